// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef NEEWERLINK_SYSLOGCONFIG_HXX
#define NEEWERLINK_SYSLOGCONFIG_HXX

#include <freertos/message_buffer.h>

namespace neewerLink {
    // Mirrors esp_log output into the host syslog, keeping console output.
    class SyslogConfig {
        public:
            SyslogConfig(const SyslogConfig&) = delete;
            SyslogConfig& operator=(const SyslogConfig&) = delete;

            static SyslogConfig& Instance() {
                static SyslogConfig instance;
                return instance;
            }

            esp_err_t init(const char* ident);

            [[nodiscard]] bool isInitialized() const { return m_initialized; }

            // Syslog priority for an esp_log line ("E (123) TAG: ...")
            [[nodiscard]] static int priorityForLine(const char* line, size_t len);

        private:
            SyslogConfig() = default;
            static int syslog_vprintf_func(const char *format, va_list args);
            static void syslog_task_entry(void* arg);
            [[noreturn]] void syslog_task_runner();
            std::string m_ident;
            vprintf_like_t m_original_logger {nullptr};
            bool m_initialized {false};
            MessageBufferHandle_t m_log_buffer {nullptr};
            TaskHandle_t m_task_handle {nullptr};
    };
} // neewerLink

#endif //NEEWERLINK_SYSLOGCONFIG_HXX
