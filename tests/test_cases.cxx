// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include <stdio.h>
#include <stdlib.h>
#include "unity.h"
#include "nvs_flash.h"
#include "esp_log.h"
#include "sdkconfig.h"

static const char* TAG = "TEST_RUNNER";

void run_zense_protocol_tests();
void run_zense_link_tests();
void run_socket_transport_tests();
void run_state_publisher_tests();
void run_command_translator_tests();
void run_poll_loop_tests();
void run_mqtt_logic_tests();
void run_config_manager_tests();
void run_bridge_tests();

extern "C" void app_main(void) {
    esp_err_t ret = nvs_flash_init();
    if (ret == ESP_ERR_NVS_NO_FREE_PAGES || ret == ESP_ERR_NVS_NEW_VERSION_FOUND) {
        ESP_ERROR_CHECK(nvs_flash_erase());
        ret = nvs_flash_init();
    }
    ESP_ERROR_CHECK(ret);

    ESP_LOGI(TAG, "Starting Unity Tests...");

    UNITY_BEGIN();

    run_zense_protocol_tests();
    run_zense_link_tests();
#if CONFIG_IDF_TARGET_LINUX
    // loopback sockets of the host; on a chip the network stack is not up here
    run_socket_transport_tests();
#endif
    run_state_publisher_tests();
    run_command_translator_tests();
    run_poll_loop_tests();
    run_mqtt_logic_tests();
    run_config_manager_tests();
    run_bridge_tests();

    const int failures = UNITY_END();

    ESP_LOGI(TAG, "All tests finished, %d failure(s).", failures);
#if CONFIG_IDF_TARGET_LINUX
    // ctest reads the process exit code
    exit(failures == 0 ? EXIT_SUCCESS : EXIT_FAILURE);
#endif
}
