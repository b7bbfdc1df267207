// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef NEEWERLINK_CONFIGMANAGER_HXX
#define NEEWERLINK_CONFIGMANAGER_HXX

#include "protocol/Protocol.hxx"

namespace neewerLink
{
    inline constexpr char DEFAULT_CONFIG_PATH[] = "neewerlink.json";
    inline constexpr char CONFIG_PATH_ENV[] = "NEEWERLINK_CONFIG";

    struct AppConfig {
        // Serial
        std::string port_name;                  // empty: discover by port_filter
        std::string port_filter{"ttyUSB"};
        bool auto_connect{true};

        // Light
        bool apply_on_connect{false};
        uint8_t startup_brightness{Protocol::BRIGHTNESS_MAX};
        uint32_t startup_kelvin{Protocol::DEFAULT_TEMP_K};

        // Events
        uint32_t event_queue_length{16};

        // Logging
        bool syslog_enabled{false};
    };

    enum class ConfigUpdateResult {
        NoUpdate,
        PortUpdate,
        LightUpdate,
        SystemUpdate
    };

    class ConfigManager {
        public:
            ConfigManager(const ConfigManager&) = delete;
            ConfigManager& operator=(const ConfigManager&) = delete;

            [[nodiscard]] static ConfigManager& Instance() {
                static ConfigManager instance;
                return instance;
            }

            /**
             * @brief Binds the configuration file. nullptr selects $NEEWERLINK_CONFIG or neewerlink.json.
             */
            esp_err_t init(const char* path = nullptr);

            /**
             * @brief Reads the bound file. A missing file keeps the defaults.
             * @return ESP_OK, or ESP_ERR_INVALID_ARG if the file is not valid JSON.
             */
            esp_err_t load();

            esp_err_t save();

            [[nodiscard]] AppConfig getConfig() const;

            void setConfig(const AppConfig& new_config);

            [[nodiscard]] std::string getPath() const;

            // Caller owns the returned object
            cJSON* getSerializedConfig() const;

            ConfigUpdateResult updateConfigFromJson(const char* json_str);

        private:
            ConfigManager() = default;

            static bool applyJson(const cJSON* root, AppConfig& cfg);
            static cJSON* serialize(const AppConfig& cfg);

            AppConfig config_cache{};
            std::string config_path{};
            mutable std::mutex config_mutex{};
            bool initialized{false};
    };
}

#endif //NEEWERLINK_CONFIGMANAGER_HXX
