// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "unity.h"
#include "system/ConfigManager.hxx"
#include "system/SyslogConfig.hxx"
#include <syslog.h>
#include <unistd.h>

using namespace neewerLink;

static std::string tempConfigPath() {
    char path_template[] = "/tmp/neewerlink-config-XXXXXX";
    const int fd = mkstemp(path_template);
    TEST_ASSERT_TRUE(fd >= 0);
    close(fd);
    unlink(path_template);
    return path_template;
}

static void writeFile(const std::string& path, const char* content) {
    FILE* f = fopen(path.c_str(), "w");
    TEST_ASSERT_NOT_NULL(f);
    fputs(content, f);
    fclose(f);
}

static void test_config_defaults_without_file() {
    auto& cm = ConfigManager::Instance();
    const std::string path = tempConfigPath();
    TEST_ASSERT_EQUAL(ESP_OK, cm.init(path.c_str()));
    TEST_ASSERT_EQUAL(ESP_OK, cm.load());

    const AppConfig cfg = cm.getConfig();
    TEST_ASSERT_EQUAL_STRING(path.c_str(), cm.getPath().c_str());
    TEST_ASSERT_EQUAL_STRING("", cfg.port_name.c_str());
    TEST_ASSERT_EQUAL_STRING("ttyUSB", cfg.port_filter.c_str());
    TEST_ASSERT_TRUE(cfg.auto_connect);
    TEST_ASSERT_FALSE(cfg.apply_on_connect);
    TEST_ASSERT_EQUAL_UINT8(100, cfg.startup_brightness);
    TEST_ASSERT_EQUAL_UINT32(4950, cfg.startup_kelvin);
    TEST_ASSERT_EQUAL_UINT32(16, cfg.event_queue_length);
    TEST_ASSERT_FALSE(cfg.syslog_enabled);
}

static void test_config_load_from_file() {
    auto& cm = ConfigManager::Instance();
    const std::string path = tempConfigPath();
    writeFile(path, R"({"port_name": "/dev/ttyUSB7", "startup_brightness": 40, "startup_kelvin": 9000})");

    TEST_ASSERT_EQUAL(ESP_OK, cm.init(path.c_str()));
    TEST_ASSERT_EQUAL(ESP_OK, cm.load());

    const AppConfig cfg = cm.getConfig();
    TEST_ASSERT_EQUAL_STRING("/dev/ttyUSB7", cfg.port_name.c_str());
    TEST_ASSERT_EQUAL_UINT8(40, cfg.startup_brightness);
    // Out-of-range value is ignored
    TEST_ASSERT_EQUAL_UINT32(4950, cfg.startup_kelvin);
    unlink(path.c_str());
}

static void test_config_malformed_file() {
    auto& cm = ConfigManager::Instance();
    const std::string path = tempConfigPath();
    writeFile(path, "{ not json");

    TEST_ASSERT_EQUAL(ESP_OK, cm.init(path.c_str()));
    TEST_ASSERT_EQUAL(ESP_ERR_INVALID_ARG, cm.load());
    TEST_ASSERT_EQUAL_STRING("ttyUSB", cm.getConfig().port_filter.c_str());
    unlink(path.c_str());
}

static void test_json_update() {
    auto& cm = ConfigManager::Instance();
    const std::string path = tempConfigPath();
    TEST_ASSERT_EQUAL(ESP_OK, cm.init(path.c_str()));
    TEST_ASSERT_EQUAL(ESP_OK, cm.load());

    const char* port_json = R"({"port_name": "/dev/ttyUSB1"})";
    TEST_ASSERT_EQUAL(ConfigUpdateResult::PortUpdate, cm.updateConfigFromJson(port_json));
    TEST_ASSERT_EQUAL(ConfigUpdateResult::NoUpdate, cm.updateConfigFromJson(port_json));

    const char* light_json = R"({"startup_brightness": 25, "startup_kelvin": 6000, "apply_on_connect": true})";
    TEST_ASSERT_EQUAL(ConfigUpdateResult::LightUpdate, cm.updateConfigFromJson(light_json));

    TEST_ASSERT_EQUAL(ConfigUpdateResult::SystemUpdate, cm.updateConfigFromJson(R"({"event_queue_length": 32})"));

    TEST_ASSERT_EQUAL(ConfigUpdateResult::NoUpdate, cm.updateConfigFromJson(R"({"garbage": 1})"));
    TEST_ASSERT_EQUAL(ConfigUpdateResult::NoUpdate, cm.updateConfigFromJson(R"({"startup_brightness": 101})"));
    TEST_ASSERT_EQUAL(ConfigUpdateResult::NoUpdate, cm.updateConfigFromJson(R"({"port_filter": ""})"));
    TEST_ASSERT_EQUAL(ConfigUpdateResult::NoUpdate, cm.updateConfigFromJson("not json"));

    // Accepted updates were persisted
    TEST_ASSERT_EQUAL(ESP_OK, cm.load());
    const AppConfig cfg = cm.getConfig();
    TEST_ASSERT_EQUAL_STRING("/dev/ttyUSB1", cfg.port_name.c_str());
    TEST_ASSERT_EQUAL_STRING("ttyUSB", cfg.port_filter.c_str());
    TEST_ASSERT_TRUE(cfg.apply_on_connect);
    TEST_ASSERT_EQUAL_UINT8(25, cfg.startup_brightness);
    TEST_ASSERT_EQUAL_UINT32(6000, cfg.startup_kelvin);
    TEST_ASSERT_EQUAL_UINT32(32, cfg.event_queue_length);

    cJSON* serialized = cm.getSerializedConfig();
    TEST_ASSERT_NOT_NULL(serialized);
    const cJSON* item = cJSON_GetObjectItem(serialized, "port_name");
    TEST_ASSERT_TRUE(cJSON_IsString(item));
    TEST_ASSERT_EQUAL_STRING("/dev/ttyUSB1", item->valuestring);
    cJSON_Delete(serialized);

    unlink(path.c_str());
}

static void test_syslog_priority_mapping() {
    TEST_ASSERT_EQUAL(LOG_ERR, SyslogConfig::priorityForLine("E (12) tag: x", 13));
    TEST_ASSERT_EQUAL(LOG_WARNING, SyslogConfig::priorityForLine("W (12) tag: x", 13));
    TEST_ASSERT_EQUAL(LOG_INFO, SyslogConfig::priorityForLine("I (12) tag: x", 13));
    TEST_ASSERT_EQUAL(LOG_DEBUG, SyslogConfig::priorityForLine("D (12) tag: x", 13));

    const char colored[] = "\033[0;31mE (12) tag: x\033[0m";
    TEST_ASSERT_EQUAL(LOG_ERR, SyslogConfig::priorityForLine(colored, sizeof(colored) - 1));
    TEST_ASSERT_EQUAL(LOG_INFO, SyslogConfig::priorityForLine("", 0));
}

void run_config_manager_tests() {
    RUN_TEST(test_config_defaults_without_file);
    RUN_TEST(test_config_load_from_file);
    RUN_TEST(test_config_malformed_file);
    RUN_TEST(test_json_update);
    RUN_TEST(test_syslog_priority_mapping);
}
