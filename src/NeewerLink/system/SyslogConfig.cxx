// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "system/SyslogConfig.hxx"
#include <syslog.h>

namespace neewerLink {

    static constexpr char TAG[] = "SyslogService";
    static constexpr size_t MESSAGE_BUFFER_SIZE = 4096;
    static constexpr size_t MAX_LOG_MSG_SIZE = 256;

    static SyslogConfig* g_syslog_instance = nullptr;

    esp_err_t SyslogConfig::init(const char* ident) {
        if (m_initialized) {
            return ESP_OK;
        }

        m_log_buffer = xMessageBufferCreate(MESSAGE_BUFFER_SIZE);
        if (!m_log_buffer) {
            ESP_LOGE(TAG, "Failed to create message buffer. Syslog disabled.");
            return ESP_ERR_NO_MEM;
        }

        m_ident = ident;
        openlog(m_ident.c_str(), LOG_PID | LOG_NDELAY, LOG_DAEMON);

        const BaseType_t task_created = xTaskCreate(
            syslog_task_entry,
            "syslog_task",
            8192,
            this,
            2,
            &m_task_handle
        );

        if (task_created != pdPASS) {
            ESP_LOGE(TAG, "Failed to create syslog task. Syslog disabled.");
            vMessageBufferDelete(m_log_buffer);
            m_log_buffer = nullptr;
            closelog();
            return ESP_ERR_NO_MEM;
        }

        g_syslog_instance = this;
        m_original_logger = esp_log_set_vprintf(syslog_vprintf_func);
        m_initialized = true;

        ESP_LOGI(TAG, "Syslog forwarding enabled as '%s'.", m_ident.c_str());
        return ESP_OK;
    }

    int SyslogConfig::priorityForLine(const char* line, const size_t len) {
        // esp_log may prefix the level letter with a color escape sequence
        size_t i = 0;
        if (len > 0 && line[0] == '\033') {
            while (i < len && line[i] != 'm') ++i;
            ++i;
        }
        if (i >= len) return LOG_INFO;
        switch (line[i]) {
            case 'E': return LOG_ERR;
            case 'W': return LOG_WARNING;
            case 'D':
            case 'V': return LOG_DEBUG;
            default:  return LOG_INFO;
        }
    }

    int SyslogConfig::syslog_vprintf_func(const char *format, va_list args) {
        int ret = 0;
        if (g_syslog_instance && g_syslog_instance->m_original_logger) {
            va_list args_copy;
            va_copy(args_copy, args);
            ret = g_syslog_instance->m_original_logger(format, args_copy);
            va_end(args_copy);
        }

        if (!g_syslog_instance || !g_syslog_instance->m_log_buffer) {
            return ret;
        }
        if (xTaskGetCurrentTaskHandle() == g_syslog_instance->m_task_handle) {
            return ret;
        }

        char msg_buffer[MAX_LOG_MSG_SIZE];
        const int len = vsnprintf(msg_buffer, sizeof(msg_buffer), format, args);

        if (len > 0) {
            const size_t actual_len = (static_cast<size_t>(len) < sizeof(msg_buffer)) ? static_cast<size_t>(len) : (sizeof(msg_buffer) - 1);
            xMessageBufferSend(g_syslog_instance->m_log_buffer, msg_buffer, actual_len, 0);
        }

        return ret;
    }

    void SyslogConfig::syslog_task_entry(void* arg) {
        auto* self = static_cast<SyslogConfig*>(arg);
        self->syslog_task_runner();
    }

    void SyslogConfig::syslog_task_runner() {
        std::array<char, MAX_LOG_MSG_SIZE + 1> recv_buffer;

        while (true) {
            size_t received_bytes = xMessageBufferReceive(
                m_log_buffer,
                recv_buffer.data(),
                recv_buffer.size() - 1,
                portMAX_DELAY
            );

            while (received_bytes > 0 && (recv_buffer[received_bytes - 1] == '\n' || recv_buffer[received_bytes - 1] == '\r')) {
                received_bytes--;
            }
            if (received_bytes > 0) {
                recv_buffer[received_bytes] = '\0';
                syslog(priorityForLine(recv_buffer.data(), received_bytes), "%s", recv_buffer.data());
            }
        }
    }

} // namespace neewerLink
