// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "serial/SerialSession.hxx"
#include "serial/FrameAssembler.hxx"
#include "protocol/Protocol.hxx"
#include <dirent.h>

namespace neewerLink
{
    static constexpr char TAG[] = "SerialSession";
    static constexpr size_t READ_CHUNK_SIZE = 256;
    static constexpr uint32_t READ_TASK_STACK_SIZE = 8192;
    static constexpr UBaseType_t READ_TASK_PRIORITY = 5;

    SerialSession::~SerialSession() {
        disconnect();
    }

    esp_err_t SerialSession::connect(const std::string& port_name, QueueHandle_t event_queue) {
        std::lock_guard<std::mutex> lock(m_port_mutex);

        if (m_running) {
            m_running->store(false);
            m_running.reset();
        }
        if (m_port.isOpen()) {
            ESP_LOGI(TAG, "Dropping connection to %s", m_port.path().c_str());
            m_port.close();
        }

        SerialPort port;
        esp_err_t err = port.open(port_name);
        if (err != ESP_OK) {
            return err;
        }

        auto ctx = std::make_unique<ReadContext>();
        err = port.duplicate(ctx->port);
        if (err != ESP_OK) {
            return err;
        }
        ctx->running = std::make_shared<std::atomic<bool>>(true);
        ctx->event_queue = event_queue;

        auto running = ctx->running;
        // The task owns the context from here on
        ReadContext* task_ctx = ctx.release();
        if (xTaskCreate(readTask, "serial_read", READ_TASK_STACK_SIZE, task_ctx, READ_TASK_PRIORITY, nullptr) != pdPASS) {
            ESP_LOGE(TAG, "Failed to create read task for %s", port_name.c_str());
            delete task_ctx;
            return ESP_ERR_NO_MEM;
        }

        m_port = std::move(port);
        m_running = std::move(running);
        ESP_LOGI(TAG, "Connected to %s", port_name.c_str());
        return ESP_OK;
    }

    void SerialSession::disconnect() {
        std::lock_guard<std::mutex> lock(m_port_mutex);
        if (m_running) {
            m_running->store(false);
            m_running.reset();
        }
        if (m_port.isOpen()) {
            ESP_LOGI(TAG, "Disconnected from %s", m_port.path().c_str());
            m_port.close();
        }
    }

    esp_err_t SerialSession::write(const std::span<const uint8_t> data) {
        std::lock_guard<std::mutex> lock(m_port_mutex);
        if (!m_port.isOpen()) {
            ESP_LOGW(TAG, "Write of %zu bytes rejected: port not open", data.size());
            return NEEWERLINK_ERR_NOT_CONNECTED;
        }

        ESP_LOGD(TAG, "TX %s", Protocol::formatBytes(data).c_str());
        const esp_err_t err = m_port.writeAll(data);
        if (err != ESP_OK) {
            return err;
        }
        return m_port.flush();
    }

    bool SerialSession::isConnected() const {
        std::lock_guard<std::mutex> lock(m_port_mutex);
        return m_port.isOpen();
    }

    std::string SerialSession::portName() const {
        std::lock_guard<std::mutex> lock(m_port_mutex);
        return m_port.isOpen() ? m_port.path() : std::string{};
    }

    std::vector<std::string> SerialSession::listPorts(const std::string_view filter, const char* dev_dir) {
        std::vector<std::string> ports;
        DIR* dir = opendir(dev_dir);
        if (!dir) {
            ESP_LOGW(TAG, "Cannot scan %s: %s", dev_dir, strerror(errno));
            return ports;
        }

        while (const dirent* entry = readdir(dir)) {
            const std::string_view name(entry->d_name);
            if (name == "." || name == "..") continue;
            if (name.find(filter) != std::string_view::npos) {
                std::string path(dev_dir);
                if (!path.empty() && path.back() != '/') path += '/';
                path += name;
                ports.push_back(std::move(path));
            }
        }
        closedir(dir);

        std::sort(ports.begin(), ports.end());
        return ports;
    }

    std::optional<std::string> SerialSession::findPort(const std::string_view filter, const char* dev_dir) {
        auto ports = listPorts(filter, dev_dir);
        if (ports.empty()) {
            return std::nullopt;
        }
        return std::move(ports.front());
    }

    void SerialSession::publish(QueueHandle_t queue, const LightEvent& event) {
        if (!queue) return;
        if (xQueueSend(queue, &event, 0) != pdTRUE) {
            ESP_LOGW(TAG, "Event queue full, dropping event");
        }
    }

    void SerialSession::readTask(void* arg) {
        std::unique_ptr<ReadContext> ctx(static_cast<ReadContext*>(arg));
        FrameAssembler assembler;
        std::array<uint8_t, READ_CHUNK_SIZE> chunk{};
        const std::string port_name = ctx->port.path();

        ESP_LOGD(TAG, "Read task started on %s", port_name.c_str());

        while (ctx->running->load()) {
            size_t n = 0;
            const esp_err_t err = ctx->port.read(chunk.data(), chunk.size(), n, SERIAL_READ_TIMEOUT_MS);
            if (err == ESP_ERR_TIMEOUT) {
                continue;
            }
            if (err != ESP_OK) {
                ESP_LOGW(TAG, "Read loop on %s ended: %s", port_name.c_str(), errorToName(err));
                // A superseded connection stays silent; the queue belongs to its successor now
                if (ctx->running->load()) {
                    publish(ctx->event_queue, LightEvent{ .type = LightEventType::Disconnected, .status = {} });
                }
                break;
            }

            assembler.append(chunk.data(), n);
            assembler.extract([&ctx](const LightStatus& status) {
                ESP_LOGD(TAG, "Status: brightness=%u%% temp=%luK",
                         status.brightness, static_cast<unsigned long>(status.kelvin));
                if (ctx->running->load()) {
                    publish(ctx->event_queue, LightEvent{ .type = LightEventType::StatusChanged, .status = status });
                }
            });
        }

        ESP_LOGD(TAG, "Read task on %s exiting (%lu frames, %lu rejected, %lu bytes skipped)",
                 port_name.c_str(),
                 static_cast<unsigned long>(assembler.framesDecoded()),
                 static_cast<unsigned long>(assembler.framesRejected()),
                 static_cast<unsigned long>(assembler.bytesDiscarded()));

        ctx.reset();
        vTaskDelete(nullptr);
    }
}
