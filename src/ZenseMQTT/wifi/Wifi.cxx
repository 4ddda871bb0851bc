// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include <esp_netif.h>
#include <lwip/ip4_addr.h>
#include "wifi/Wifi.hxx"

namespace zenseMQTT
{
    static constexpr char TAG[] = "WifiManager";

    static constexpr uint32_t RETRY_MIN_MS = 1000;
    static constexpr uint32_t RETRY_MAX_MS = 60000;

    Wifi& Wifi::getInstance() {
        static Wifi instance;
        return instance;
    }

    esp_err_t Wifi::init() {
        if (initialized) {
            return ESP_OK;
        }

        ESP_ERROR_CHECK(esp_netif_init());
        ESP_ERROR_CHECK(esp_event_loop_create_default());

        wifi_init_config_t cfg = WIFI_INIT_CONFIG_DEFAULT();
        ESP_ERROR_CHECK(esp_wifi_init(&cfg));

        ESP_ERROR_CHECK(esp_event_handler_instance_register(WIFI_EVENT,
                                                            ESP_EVENT_ANY_ID,
                                                            &wifiEventHandler,
                                                            this,
                                                            nullptr));
        ESP_ERROR_CHECK(esp_event_handler_instance_register(IP_EVENT,
                                                            IP_EVENT_STA_GOT_IP,
                                                            &wifiEventHandler,
                                                            this,
                                                            nullptr));

        const esp_timer_create_args_t timer_args = {
            .callback = &reconnectTimerCallback,
            .arg = this,
            .dispatch_method = ESP_TIMER_TASK,
            .name = "wifi_retry",
            .skip_unhandled_events = true,
        };
        ESP_ERROR_CHECK(esp_timer_create(&timer_args, &reconnect_timer));

        initialized = true;
        ESP_LOGI(TAG, "WiFi Manager initialized.");
        return ESP_OK;
    }

    esp_err_t Wifi::connectToAP(const std::string& ssid, const std::string& password) {
        if (ssid.empty()) {
            ESP_LOGE(TAG, "WiFi SSID is not configured.");
            return ESP_ERR_INVALID_ARG;
        }
        status = Status::CONNECTING;
        stopping = false;
        if (!esp_netif_get_handle_from_ifkey("WIFI_STA_DEF") && !esp_netif_create_default_wifi_sta()) {
            ESP_LOGE(TAG, "Failed to create STA netif");
            status = Status::DISCONNECTED;
            return ESP_FAIL;
        }

        wifi_config_t wifi_config = {};
        strncpy(reinterpret_cast<char*>(wifi_config.sta.ssid), ssid.c_str(), sizeof(wifi_config.sta.ssid) - 1);
        strncpy(reinterpret_cast<char*>(wifi_config.sta.password), password.c_str(), sizeof(wifi_config.sta.password) - 1);
        wifi_config.sta.threshold.authmode = password.empty() ? WIFI_AUTH_OPEN : WIFI_AUTH_WPA2_PSK;

        esp_err_t err = esp_wifi_set_mode(WIFI_MODE_STA);
        if (err == ESP_OK) err = esp_wifi_set_config(WIFI_IF_STA, &wifi_config);
        if (err == ESP_OK) err = esp_wifi_start();
        if (err != ESP_OK) {
            ESP_LOGE(TAG, "Failed to start WiFi STA: %s", esp_err_to_name(err));
            status = Status::DISCONNECTED;
            return err;
        }

        ESP_LOGI(TAG, "Connecting to AP SSID: %s", ssid.c_str());
        return ESP_OK;
    }

    void Wifi::disconnect() {
        stopping = true;
        if (reconnect_timer) {
            esp_timer_stop(reconnect_timer);
        }
        ESP_ERROR_CHECK_WITHOUT_ABORT(esp_wifi_disconnect());
        ESP_ERROR_CHECK_WITHOUT_ABORT(esp_wifi_stop());
        status = Status::DISCONNECTED;
    }

    std::string Wifi::getIpAddress() const {
        if (status != Status::CONNECTED) {
            return "0.0.0.0";
        }
        esp_netif_t* netif = esp_netif_get_handle_from_ifkey("WIFI_STA_DEF");
        if (!netif) {
            return "0.0.0.0";
        }
        esp_netif_ip_info_t ip_info;
        if (esp_netif_get_ip_info(netif, &ip_info) != ESP_OK) {
            return "0.0.0.0";
        }
        return ip4addr_ntoa(reinterpret_cast<const ip4_addr_t*>(&ip_info.ip));
    }

    void Wifi::reconnectTimerCallback(void* arg) {
        const auto* manager = static_cast<Wifi*>(arg);
        if (!manager->stopping) {
            ESP_ERROR_CHECK_WITHOUT_ABORT(esp_wifi_connect());
        }
    }

    void Wifi::wifiEventHandler(void* arg, esp_event_base_t event_base, int32_t event_id, void* event_data) {
        auto* manager = static_cast<Wifi*>(arg);

        if (event_base == WIFI_EVENT && event_id == WIFI_EVENT_STA_START) {
            ESP_LOGI(TAG, "STA_START: connecting...");
            ESP_ERROR_CHECK_WITHOUT_ABORT(esp_wifi_connect());
        } else if (event_base == WIFI_EVENT && event_id == WIFI_EVENT_STA_DISCONNECTED) {
            const bool was_connected = manager->status == Status::CONNECTED;
            manager->status = Status::DISCONNECTED;
            if (was_connected && manager->onDisconnected) manager->onDisconnected();
            if (manager->stopping) return;

            const uint32_t shift = std::min<uint32_t>(manager->retry_count, 6);
            const uint32_t delay_ms = std::min<uint32_t>(RETRY_MIN_MS << shift, RETRY_MAX_MS);
            ++manager->retry_count;
            ESP_LOGW(TAG, "STA_DISCONNECTED: attempt %lu failed, retrying in %lu ms",
                     static_cast<unsigned long>(manager->retry_count), static_cast<unsigned long>(delay_ms));
            // ESP_ERR_INVALID_STATE from stop only means the timer was idle
            esp_timer_stop(manager->reconnect_timer);
            ESP_ERROR_CHECK_WITHOUT_ABORT(esp_timer_start_once(manager->reconnect_timer, static_cast<uint64_t>(delay_ms) * 1000));
        } else if (event_base == IP_EVENT && event_id == IP_EVENT_STA_GOT_IP) {
            ip_event_got_ip_t const* event = static_cast<ip_event_got_ip_t*>(event_data);
            ESP_LOGI(TAG, "GOT_IP: " IPSTR, IP2STR(&event->ip_info.ip));
            manager->retry_count = 0;
            manager->status = Status::CONNECTED;
            if (manager->onConnected) manager->onConnected();
        }
    }
} // zenseMQTT
