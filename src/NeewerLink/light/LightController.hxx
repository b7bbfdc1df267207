// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef NEEWERLINK_LIGHTCONTROLLER_HXX
#define NEEWERLINK_LIGHTCONTROLLER_HXX

#include "serial/SerialSession.hxx"

namespace neewerLink
{
    /**
     * @brief Entry point for UI and command layers: port discovery, connection and light commands.
     *
     * Status reports and disconnect notifications arrive on getEventQueue() as LightEvent items.
     */
    class LightController {
    public:
        LightController(const LightController&) = delete;
        LightController& operator=(const LightController&) = delete;

        static LightController& Instance() {
            static LightController instance;
            return instance;
        }

        /**
         * @brief Creates the event queue. Repeated calls are no-ops.
         */
        esp_err_t init(uint32_t event_queue_length, std::string port_filter);

        [[nodiscard]] bool isInitialized() const;

        [[nodiscard]] std::vector<std::string> listPorts() const;
        [[nodiscard]] std::optional<std::string> findPort() const;

        esp_err_t connect(const std::string& port_name);
        void disconnect();
        [[nodiscard]] bool isConnected() const;
        [[nodiscard]] std::string portName() const;

        /**
         * @brief Sends a CCT command. Brightness is capped at 100, Kelvin is quantized to 19 steps.
         */
        esp_err_t setLight(uint8_t brightness, uint32_t kelvin);

        esp_err_t turnOn();
        esp_err_t turnOff();

        [[nodiscard]] QueueHandle_t getEventQueue() const;

        void setDevDirectory(std::string dev_dir);

    private:
        LightController() = default;

        SerialSession m_session{};
        QueueHandle_t m_event_queue{nullptr};
        std::string m_port_filter{};
        std::string m_dev_dir{"/dev"};
        std::atomic<bool> m_initialized{false};
    };
}

#endif //NEEWERLINK_LIGHTCONTROLLER_HXX
