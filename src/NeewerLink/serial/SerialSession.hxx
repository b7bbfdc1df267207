// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef NEEWERLINK_SERIALSESSION_HXX
#define NEEWERLINK_SERIALSESSION_HXX

#include "serial/SerialPort.hxx"
#include "light/LightTypes.hxx"

namespace neewerLink
{
    /**
     * @brief Owns the serial connection to one panel and its background read task.
     *
     * Writes are serialized by a mutex. The read task works on a duplicated descriptor
     * and only communicates outward by posting LightEvent values to the event queue.
     * Every connection has its own liveness flag, so a superseded read task can never be
     * revived by a later connect().
     */
    class SerialSession {
    public:
        SerialSession() = default;
        ~SerialSession();

        SerialSession(const SerialSession&) = delete;
        SerialSession& operator=(const SerialSession&) = delete;

        /**
         * @brief Stops the current read task, opens the port and starts a new read task.
         * @param event_queue Queue of LightEvent receiving status and disconnect events, may be nullptr.
         * @return ESP_OK, NEEWERLINK_ERR_PORT_OPEN_FAILED, NEEWERLINK_ERR_PORT_CLONE_FAILED or ESP_ERR_NO_MEM.
         */
        esp_err_t connect(const std::string& port_name, QueueHandle_t event_queue);

        /**
         * @brief Signals the read task to stop and drops the port. Safe to call repeatedly.
         */
        void disconnect();

        /**
         * @brief Writes all bytes and drains the output.
         * @return ESP_OK, NEEWERLINK_ERR_NOT_CONNECTED, NEEWERLINK_ERR_WRITE_FAILED or NEEWERLINK_ERR_FLUSH_FAILED.
         */
        esp_err_t write(std::span<const uint8_t> data);

        // True while a port handle is held; says nothing about the read task.
        [[nodiscard]] bool isConnected() const;

        [[nodiscard]] std::string portName() const;

        /**
         * @brief Device nodes in dev_dir whose name contains filter, sorted by name.
         */
        [[nodiscard]] static std::vector<std::string> listPorts(std::string_view filter, const char* dev_dir = "/dev");

        [[nodiscard]] static std::optional<std::string> findPort(std::string_view filter, const char* dev_dir = "/dev");

    private:
        struct ReadContext {
            SerialPort port;
            std::shared_ptr<std::atomic<bool>> running;
            QueueHandle_t event_queue{nullptr};
        };

        static void readTask(void* arg);
        static void publish(QueueHandle_t queue, const LightEvent& event);

        SerialPort m_port{};
        std::shared_ptr<std::atomic<bool>> m_running{};
        mutable std::mutex m_port_mutex{};
    };
}

#endif //NEEWERLINK_SERIALSESSION_HXX
