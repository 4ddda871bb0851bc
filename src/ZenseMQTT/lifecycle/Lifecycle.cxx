// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "lifecycle/Lifecycle.hxx"
#include "bridge/Bridge.hxx"
#include "config/SyslogConfig.hxx"
#include "mqtt/MQTTClient.hxx"
#include "zense/SocketTransport.hxx"
#include <csignal>
#if !CONFIG_IDF_TARGET_LINUX
#include "wifi/Wifi.hxx"
#endif

namespace zenseMQTT
{
    static constexpr char TAG[] = "Lifecycle";
    static constexpr uint32_t SHUTDOWN_POLL_MS = 200;

    static std::unique_ptr<Bridge> g_bridge;
#if !CONFIG_IDF_TARGET_LINUX
    static std::once_flag g_bridge_once;
#endif
    static volatile std::sig_atomic_t g_shutdown_requested = 0;

    esp_err_t Lifecycle::startNormalMode(const AppConfig& config) {
        ESP_LOGI(TAG, "Starting in normal mode...");
    #if CONFIG_IDF_TARGET_LINUX
        installSignalHandlers();
        startSyslog(config);
        return startBridge(config);
    #else
        auto& wifi = Wifi::getInstance();
        if (const esp_err_t err = wifi.init(); err != ESP_OK) return err;

        wifi.onConnected = [config]() {
            ESP_LOGI(TAG, "WiFi connected (%s), starting bridge...", Wifi::getInstance().getIpAddress().c_str());
            std::call_once(g_bridge_once, [&config]() {
                startSyslog(config);
                if (const esp_err_t err = startBridge(config); err != ESP_OK) {
                    ESP_LOGE(TAG, "Bridge start failed: %s", esp_err_to_name(err));
                }
            });
        };
        wifi.onDisconnected = []() {
            ESP_LOGW(TAG, "WiFi disconnected, MQTT and gateway link will reconnect on their own.");
        };
        return wifi.connectToAP(config.wifi_ssid, config.wifi_password);
    #endif
    }

    esp_err_t Lifecycle::startBridge(const AppConfig& config) {
        auto& mqtt = MQTTClient::getInstance();

        g_bridge = std::make_unique<Bridge>(config, mqtt, std::make_unique<SocketTransport>());
        if (const esp_err_t err = g_bridge->start(); err != ESP_OK) {
            ESP_LOGE(TAG, "Bridge start failed: %s", esp_err_to_name(err));
            g_bridge.reset();
            return err;
        }

        if (const esp_err_t err = mqtt.init(config.brokerUri(), config.client_id, config.availabilityTopic(), config.mqtt_user, config.mqtt_pass);
            err != ESP_OK) {
            return err;
        }
        mqtt.onConnected = []() { if (g_bridge) g_bridge->onMqttConnected(); };
        mqtt.onDisconnected = []() { if (g_bridge) g_bridge->onMqttDisconnected(); };
        mqtt.onData = [](const std::string& topic, const std::string& data) {
            if (g_bridge) g_bridge->onMqttData(topic, data);
        };

        ESP_LOGI(TAG, "MQTT connect %s", config.brokerUri().c_str());
        return mqtt.connect();
    }

    void Lifecycle::startSyslog(const AppConfig& config) {
        if (!config.syslog_enabled || config.syslog_server.empty()) return;
        // remote logging is optional, the bridge runs without it
        if (const esp_err_t err = SyslogConfig::getInstance().init(config.syslog_server); err != ESP_OK) {
            ESP_LOGW(TAG, "Syslog forwarding to %s not started: %s", config.syslog_server.c_str(), esp_err_to_name(err));
        }
    }

    void Lifecycle::installSignalHandlers() {
    #if CONFIG_IDF_TARGET_LINUX
        struct sigaction action = {};
        action.sa_handler = [](int) { g_shutdown_requested = 1; };
        sigemptyset(&action.sa_mask);
        if (sigaction(SIGINT, &action, nullptr) != 0 || sigaction(SIGTERM, &action, nullptr) != 0) {
            ESP_LOGW(TAG, "Could not install signal handlers, shutdown will not be graceful");
        }
    #endif
    }

    void Lifecycle::runUntilShutdown() {
    #if CONFIG_IDF_TARGET_LINUX
        while (!g_shutdown_requested) {
            vTaskDelay(pdMS_TO_TICKS(SHUTDOWN_POLL_MS));
        }
        ESP_LOGI(TAG, "Shutdown signal received.");
        shutdown();
    #endif
    }

    void Lifecycle::shutdown() {
        if (g_bridge) {
            g_bridge->stop();
        }
        MQTTClient::getInstance().disconnect();
        g_bridge.reset();
        ESP_LOGI(TAG, "Shutdown complete.");
    }
} // zenseMQTT
