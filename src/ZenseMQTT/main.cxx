// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include <esp_err.h>
#include <esp_log.h>
#include <string>
#include <cstdlib>
#include <mutex>
#include <nvs_flash.h>
#include <cJSON.h>

#include "config/ConfigDefaults.hxx"
#include "config/ConfigManager.hxx"
#include "lifecycle/Lifecycle.hxx"

static constexpr char TAG[] = "zenseMQTT";

extern "C" void app_main(void) {
    ESP_LOGI("", "Zense-to-MQTT Bridge v.%s (configured at: %s)", ZENSEMQTT_VERSION, ZENSEMQTT_CONFIGURED_TIMESTAMP);
    ESP_LOGI(TAG, "Zense-to-MQTT Bridge starting...");

    auto& config = zenseMQTT::ConfigManager::getInstance();
    ESP_ERROR_CHECK(config.init());
    ESP_ERROR_CHECK(config.load());
#if CONFIG_IDF_TARGET_LINUX
    ESP_ERROR_CHECK(config.loadOptionsFile(zenseMQTT::defaults::OPTIONS_FILE));
    config.applyEnvironment();
#endif
    ESP_ERROR_CHECK(config.validate());

    if (cJSON* effective = config.getSerializedConfig(true)) {
        if (char* printed = cJSON_PrintUnformatted(effective)) {
            ESP_LOGI(TAG, "Effective configuration: %s", printed);
            cJSON_free(printed);
        }
        cJSON_Delete(effective);
    }

    ESP_ERROR_CHECK(zenseMQTT::Lifecycle::startNormalMode(config.getConfig()));
    ESP_LOGI(TAG, "Application setup complete. Logic running in background tasks.");

    zenseMQTT::Lifecycle::runUntilShutdown();
#if CONFIG_IDF_TARGET_LINUX
    // the FreeRTOS port keeps the process alive after app_main returns
    exit(EXIT_SUCCESS);
#endif
}
