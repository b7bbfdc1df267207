// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "system/AppController.hxx"
#include "system/CommandConsole.hxx"
#include "system/SyslogConfig.hxx"
#include "light/LightController.hxx"

namespace neewerLink
{
    static constexpr char TAG[] = "AppController";

    esp_err_t AppController::start() {
        if (m_started) return ESP_OK;

        const auto config = ConfigManager::Instance().getConfig();
        if (config.syslog_enabled) {
            // Console logging keeps working if syslog cannot be set up
            if (const esp_err_t err = SyslogConfig::Instance().init("neewerlink"); err != ESP_OK) {
                ESP_LOGW(TAG, "Syslog forwarding unavailable: %s", esp_err_to_name(err));
            }
        }

        if (const esp_err_t err = initLightSubsystem(); err != ESP_OK) {
            return err;
        }
        m_started = true;

        if (config.auto_connect) {
            // A missing light is not fatal; the console can connect later
            (void)connectConfiguredPort();
        } else {
            ESP_LOGI(TAG, "Auto-connect disabled, waiting for an explicit connect.");
        }

        if (const esp_err_t err = CommandConsole::Instance().start(); err != ESP_OK) {
            ESP_LOGW(TAG, "Command console unavailable: %s", esp_err_to_name(err));
        }
        return ESP_OK;
    }

    esp_err_t AppController::initLightSubsystem() {
        ESP_LOGI(TAG, "Initializing light subsystem...");
        const auto config = ConfigManager::Instance().getConfig();

        auto& light = LightController::Instance();
        if (const esp_err_t err = light.init(config.event_queue_length, config.port_filter); err != ESP_OK) {
            return err;
        }

        if (xTaskCreate(lightEventTask, "light_events", 8192, this, 4, &m_event_task_handle) != pdPASS) {
            ESP_LOGE(TAG, "Failed to create light event task");
            return ESP_ERR_NO_MEM;
        }
        return ESP_OK;
    }

    esp_err_t AppController::connectConfiguredPort() {
        const auto config = ConfigManager::Instance().getConfig();
        auto& light = LightController::Instance();

        std::string port = config.port_name;
        if (port.empty()) {
            const auto found = light.findPort();
            if (!found) {
                ESP_LOGW(TAG, "No USB serial port matching '%s' found. Is the light connected?", config.port_filter.c_str());
                return ESP_ERR_NOT_FOUND;
            }
            port = *found;
        }

        {
            std::lock_guard<std::mutex> lock(m_status_mutex);
            m_last_status.reset();
        }
        if (const esp_err_t err = light.connect(port); err != ESP_OK) {
            return err;
        }

        if (config.apply_on_connect) {
            if (light.setLight(config.startup_brightness, config.startup_kelvin) != ESP_OK) {
                ESP_LOGW(TAG, "Startup light state was not applied.");
            }
        }
        return ESP_OK;
    }

    void AppController::applyConfigUpdate(const ConfigUpdateResult result) {
        const auto config = ConfigManager::Instance().getConfig();
        auto& light = LightController::Instance();

        switch (result) {
            case ConfigUpdateResult::NoUpdate:
                break;
            case ConfigUpdateResult::PortUpdate:
                ESP_LOGI(TAG, "Port settings changed, reconnecting.");
                light.disconnect();
                if (config.auto_connect) {
                    (void)connectConfiguredPort();
                }
                break;
            case ConfigUpdateResult::LightUpdate:
                if (config.apply_on_connect && light.isConnected()) {
                    if (light.setLight(config.startup_brightness, config.startup_kelvin) != ESP_OK) {
                        ESP_LOGW(TAG, "Updated light state was not applied.");
                    }
                } else {
                    ESP_LOGI(TAG, "Light settings saved, applied on next connect.");
                }
                break;
            case ConfigUpdateResult::SystemUpdate:
                ESP_LOGW(TAG, "Event queue and syslog settings take effect after a restart.");
                break;
        }
    }

    std::optional<LightStatus> AppController::lastStatus() const {
        std::lock_guard<std::mutex> lock(m_status_mutex);
        return m_last_status;
    }

    void AppController::lightEventTask(void* pvParameters) {
        auto* self = static_cast<AppController*>(pvParameters);
        const QueueHandle_t queue = LightController::Instance().getEventQueue();
        LightEvent event;

        while (true) {
            if (xQueueReceive(queue, &event, portMAX_DELAY) != pdPASS) {
                continue;
            }
            switch (event.type) {
                case LightEventType::StatusChanged: {
                    ESP_LOGI(TAG, "Light status: brightness=%u%% temp=%luK",
                             event.status.brightness, static_cast<unsigned long>(event.status.kelvin));
                    std::lock_guard<std::mutex> lock(self->m_status_mutex);
                    self->m_last_status = event.status;
                    break;
                }
                case LightEventType::Disconnected: {
                    ESP_LOGW(TAG, "Light disconnected.");
                    std::lock_guard<std::mutex> lock(self->m_status_mutex);
                    self->m_last_status.reset();
                    break;
                }
            }
        }
    }
}
