// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef NEEWERLINK_APPCONTROLLER_HXX
#define NEEWERLINK_APPCONTROLLER_HXX

#include "light/LightTypes.hxx"
#include "system/ConfigManager.hxx"

namespace neewerLink
{
    class AppController {
        public:
            AppController(const AppController&) = delete;
            AppController& operator=(const AppController&) = delete;

            static AppController& Instance() {
                static AppController instance;
                return instance;
            }

            /**
             * @brief Brings up logging, the light controller, the event consumer and the console,
             *        then makes the single startup connection attempt.
             */
            esp_err_t start();

            /**
             * @brief Connects to the configured port, or the first discovered one, and applies
             *        the startup light state when configured to.
             * @return ESP_OK, ESP_ERR_NOT_FOUND when no port matches, or the connect error.
             */
            esp_err_t connectConfiguredPort();

            // Reacts to a saved configuration change
            void applyConfigUpdate(ConfigUpdateResult result);

            // Most recent status reported by the panel on the current connection
            [[nodiscard]] std::optional<LightStatus> lastStatus() const;

        private:
            AppController() = default;

            esp_err_t initLightSubsystem();

            [[noreturn]] static void lightEventTask(void* pvParameters);

            TaskHandle_t m_event_task_handle{nullptr};
            std::atomic<bool> m_started{false};

            mutable std::mutex m_status_mutex{};
            std::optional<LightStatus> m_last_status{};
    };
} // neewerLink

#endif //NEEWERLINK_APPCONTROLLER_HXX
