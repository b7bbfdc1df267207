// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "system/ConfigManager.hxx"
#include <utils/FileHandle.hxx>

namespace neewerLink
{
    static constexpr char TAG[] = "Config";
    static constexpr uint32_t EVENT_QUEUE_MIN = 1;
    static constexpr uint32_t EVENT_QUEUE_MAX = 256;

    esp_err_t ConfigManager::init(const char* path) {
        std::lock_guard<std::mutex> lock(config_mutex);
        if (path == nullptr) {
            const char* env_path = getenv(CONFIG_PATH_ENV);
            path = (env_path && *env_path) ? env_path : DEFAULT_CONFIG_PATH;
        }
        config_path = path;
        config_cache = AppConfig{};
        initialized = true;
        ESP_LOGI(TAG, "Using configuration file %s", config_path.c_str());
        return ESP_OK;
    }

    esp_err_t ConfigManager::load() {
        std::lock_guard<std::mutex> lock(config_mutex);
        if (!initialized) {
            ESP_LOGE(TAG, "load() called before init()");
            return ESP_ERR_INVALID_STATE;
        }

        config_cache = AppConfig{};

        const FileHandle file(config_path.c_str(), "r");
        if (!file) {
            ESP_LOGW(TAG, "Config file '%s' not found (%s), using defaults", config_path.c_str(), strerror(errno));
            return ESP_OK;
        }

        const std::string content = file.readAll();
        cJSON* root = cJSON_Parse(content.c_str());
        if (root == nullptr || !cJSON_IsObject(root)) {
            ESP_LOGE(TAG, "Config file '%s' is not a JSON object, using defaults", config_path.c_str());
            cJSON_Delete(root);
            return ESP_ERR_INVALID_ARG;
        }

        applyJson(root, config_cache);
        cJSON_Delete(root);

        ESP_LOGI(TAG, "Configuration loaded successfully.");
        return ESP_OK;
    }

    esp_err_t ConfigManager::save() {
        std::lock_guard<std::mutex> lock(config_mutex);
        if (!initialized) {
            return ESP_ERR_INVALID_STATE;
        }

        cJSON* root = serialize(config_cache);
        char* text = cJSON_Print(root);
        cJSON_Delete(root);
        if (text == nullptr) {
            return ESP_ERR_NO_MEM;
        }

        esp_err_t result = ESP_OK;
        {
            const FileHandle file(config_path.c_str(), "w");
            if (!file) {
                ESP_LOGE(TAG, "Cannot write '%s': %s", config_path.c_str(), strerror(errno));
                result = ESP_FAIL;
            } else if (fputs(text, file.get()) < 0 || fputc('\n', file.get()) == EOF) {
                ESP_LOGE(TAG, "Failed to write '%s'", config_path.c_str());
                result = ESP_FAIL;
            }
        }
        cJSON_free(text);

        if (result == ESP_OK) {
            ESP_LOGI(TAG, "Configuration saved successfully.");
        }
        return result;
    }

    AppConfig ConfigManager::getConfig() const {
        std::lock_guard<std::mutex> lock(config_mutex);
        return config_cache;
    }

    void ConfigManager::setConfig(const AppConfig& new_config) {
        std::lock_guard<std::mutex> lock(config_mutex);
        config_cache = new_config;
    }

    std::string ConfigManager::getPath() const {
        std::lock_guard<std::mutex> lock(config_mutex);
        return config_path;
    }

    cJSON* ConfigManager::serialize(const AppConfig& cfg) {
        cJSON* root = cJSON_CreateObject();

        cJSON_AddStringToObject(root, "port_name", cfg.port_name.c_str());
        cJSON_AddStringToObject(root, "port_filter", cfg.port_filter.c_str());
        cJSON_AddBoolToObject(root, "auto_connect", cfg.auto_connect);
        cJSON_AddBoolToObject(root, "apply_on_connect", cfg.apply_on_connect);
        cJSON_AddNumberToObject(root, "startup_brightness", cfg.startup_brightness);
        cJSON_AddNumberToObject(root, "startup_kelvin", cfg.startup_kelvin);
        cJSON_AddNumberToObject(root, "event_queue_length", cfg.event_queue_length);
        cJSON_AddBoolToObject(root, "syslog_enabled", cfg.syslog_enabled);

        return root;
    }

    cJSON* ConfigManager::getSerializedConfig() const {
        return serialize(getConfig());
    }

    bool ConfigManager::applyJson(const cJSON* root, AppConfig& cfg) {
        bool changed = false;

        #define JsonSetStrConfig(NAME, KEY) \
            if (const cJSON* item = cJSON_GetObjectItem(root, KEY); cJSON_IsString(item) && (item->valuestring != nullptr)) { \
                std::string val = item->valuestring; \
                if (cfg.NAME != val) { \
                    cfg.NAME = val; \
                    changed = true; \
                } \
            }

        #define JsonSetBoolConfig(NAME, KEY) \
            if (const cJSON* item = cJSON_GetObjectItem(root, KEY); cJSON_IsBool(item)) { \
                const bool val = cJSON_IsTrue(item); \
                if (cfg.NAME != val) { \
                    cfg.NAME = val; \
                    changed = true; \
                } \
            }

        #define JsonSetRangeConfig(NAME, KEY, TYPE, MIN, MAX) \
            if (const cJSON* item = cJSON_GetObjectItem(root, KEY); cJSON_IsNumber(item)) { \
                const double raw = item->valuedouble; \
                if (raw < (MIN) || raw > (MAX)) { \
                    ESP_LOGW(TAG, "Ignoring %s=%g, allowed range is %g..%g", KEY, raw, \
                             static_cast<double>(MIN), static_cast<double>(MAX)); \
                } else if (const auto val = static_cast<TYPE>(raw); cfg.NAME != val) { \
                    cfg.NAME = val; \
                    changed = true; \
                } \
            }

        JsonSetStrConfig(port_name, "port_name");
        JsonSetStrConfig(port_filter, "port_filter");
        JsonSetBoolConfig(auto_connect, "auto_connect");
        JsonSetBoolConfig(apply_on_connect, "apply_on_connect");
        JsonSetRangeConfig(startup_brightness, "startup_brightness", uint8_t, 0, Protocol::BRIGHTNESS_MAX);
        JsonSetRangeConfig(startup_kelvin, "startup_kelvin", uint32_t, Protocol::TEMP_MIN_K, Protocol::TEMP_MAX_K);
        JsonSetRangeConfig(event_queue_length, "event_queue_length", uint32_t, EVENT_QUEUE_MIN, EVENT_QUEUE_MAX);
        JsonSetBoolConfig(syslog_enabled, "syslog_enabled");

        #undef JsonSetStrConfig
        #undef JsonSetBoolConfig
        #undef JsonSetRangeConfig

        return changed;
    }

    ConfigUpdateResult ConfigManager::updateConfigFromJson(const char* json_str) {
        cJSON* root = cJSON_Parse(json_str);
        if (root == nullptr) {
            ESP_LOGE(TAG, "Failed to parse configuration JSON");
            return ConfigUpdateResult::NoUpdate;
        }

        const AppConfig old_cfg = getConfig();
        AppConfig current_cfg = old_cfg;
        const bool changed = applyJson(root, current_cfg);
        cJSON_Delete(root);

        if (!changed) {
            return ConfigUpdateResult::NoUpdate;
        }

        if (current_cfg.port_filter.empty()) {
            ESP_LOGE(TAG, "Port filter cannot be empty");
            return ConfigUpdateResult::NoUpdate;
        }

        setConfig(current_cfg);
        if (esp_err_t save_result = save(); save_result != ESP_OK) {
            setConfig(old_cfg);
            return ConfigUpdateResult::NoUpdate;
        }

        if (old_cfg.port_name != current_cfg.port_name ||
            old_cfg.port_filter != current_cfg.port_filter ||
            old_cfg.auto_connect != current_cfg.auto_connect) {
            return ConfigUpdateResult::PortUpdate;
        }

        if (old_cfg.event_queue_length != current_cfg.event_queue_length ||
            old_cfg.syslog_enabled != current_cfg.syslog_enabled) {
            return ConfigUpdateResult::SystemUpdate;
        }

        return ConfigUpdateResult::LightUpdate;
    }
}
