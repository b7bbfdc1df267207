// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include <esp_err.h>
#include <esp_log.h>

#include "system/ConfigManager.hxx"
#include "system/AppController.hxx"

static constexpr char TAG[] = "neewerLink";

extern "C" void app_main(void) {
    ESP_LOGI("", "NeewerLink v.%s", NEEWERLINK_VERSION);
    ESP_LOGI(TAG, "Neewer panel controller starting...");

    auto& config = neewerLink::ConfigManager::Instance();
    ESP_ERROR_CHECK(config.init());
    if (config.load() != ESP_OK) {
        ESP_LOGW(TAG, "Continuing with default configuration.");
    }

    ESP_ERROR_CHECK(neewerLink::AppController::Instance().start());

    ESP_LOGI(TAG, "Application setup complete. Logic running in background tasks.");
}
