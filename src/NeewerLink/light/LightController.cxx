// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "light/LightController.hxx"
#include "protocol/Protocol.hxx"

namespace neewerLink
{
    static constexpr char TAG[] = "LightController";

    esp_err_t LightController::init(const uint32_t event_queue_length, std::string port_filter) {
        if (m_initialized) return ESP_OK;

        m_event_queue = xQueueCreate(event_queue_length, sizeof(LightEvent));
        if (!m_event_queue) {
            ESP_LOGE(TAG, "Failed to create event queue (%lu items)", static_cast<unsigned long>(event_queue_length));
            return ESP_ERR_NO_MEM;
        }
        m_port_filter = std::move(port_filter);
        m_initialized = true;

        ESP_LOGI(TAG, "Light controller initialized, port filter '%s'.", m_port_filter.c_str());
        return ESP_OK;
    }

    bool LightController::isInitialized() const {
        return m_initialized;
    }

    void LightController::setDevDirectory(std::string dev_dir) {
        m_dev_dir = std::move(dev_dir);
    }

    std::vector<std::string> LightController::listPorts() const {
        return SerialSession::listPorts(m_port_filter, m_dev_dir.c_str());
    }

    std::optional<std::string> LightController::findPort() const {
        return SerialSession::findPort(m_port_filter, m_dev_dir.c_str());
    }

    esp_err_t LightController::connect(const std::string& port_name) {
        if (!m_initialized) {
            ESP_LOGE(TAG, "connect() before init()");
            return ESP_ERR_INVALID_STATE;
        }
        const esp_err_t err = m_session.connect(port_name, m_event_queue);
        if (err != ESP_OK) {
            ESP_LOGE(TAG, "Failed to connect to %s: %s", port_name.c_str(), errorToName(err));
        }
        return err;
    }

    void LightController::disconnect() {
        m_session.disconnect();
    }

    bool LightController::isConnected() const {
        return m_session.isConnected();
    }

    std::string LightController::portName() const {
        return m_session.portName();
    }

    esp_err_t LightController::setLight(const uint8_t brightness, const uint32_t kelvin) {
        const auto packet = Protocol::encodeCctCommand(brightness, kelvin);
        const esp_err_t err = m_session.write(packet);
        if (err != ESP_OK) {
            ESP_LOGE(TAG, "setLight failed: %s", errorToName(err));
            return err;
        }

        // Report what the panel was actually told after capping and quantization
        const uint8_t temp_step = packet[5];
        ESP_LOGI(TAG, "Set brightness=%u%% temp=%luK (0x%02x)",
                 packet[4], static_cast<unsigned long>(Protocol::byteToKelvin(temp_step)), temp_step);
        return ESP_OK;
    }

    esp_err_t LightController::turnOn() {
        return setLight(Protocol::BRIGHTNESS_MAX, Protocol::DEFAULT_TEMP_K);
    }

    esp_err_t LightController::turnOff() {
        return setLight(0, Protocol::DEFAULT_TEMP_K);
    }

    QueueHandle_t LightController::getEventQueue() const {
        return m_event_queue;
    }
}
