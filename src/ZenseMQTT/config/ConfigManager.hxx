// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef ZENSEMQTT_CONFIGMANAGER_HXX
#define ZENSEMQTT_CONFIGMANAGER_HXX

namespace zenseMQTT
{
    struct AppConfig {
        // WiFi (ESP32 targets only)
        std::string wifi_ssid;
        std::string wifi_password;

        // Gateway
        std::string zense_host;
        uint16_t zense_port{0};
        std::string zense_code;
        // JSON object {"<device id>": "<name>"}, empty object means discover from the gateway
        std::string zense_devices;

        // MQTT
        std::string mqtt_uri;
        std::string mqtt_host;
        uint16_t mqtt_port{0};
        std::string mqtt_user;
        std::string mqtt_pass;
        std::string client_id;
        std::string mqtt_base_topic;
        std::string discovery_prefix;
        std::string uid_prefix;

        // Timing
        int32_t state_poll_sec{0};
        uint32_t debounce_ms{0};
        uint32_t cmd_gap_ms{0};
        uint32_t level_on_window_ms{0};
        uint32_t socket_timeout_ms{0};
        uint32_t reconnect_min_ms{0};
        uint32_t reconnect_max_ms{0};
        uint32_t auth_cooldown_ms{0};

        bool debug_mqtt{false};

        // Syslog
        std::string syslog_server;
        bool syslog_enabled{false};

        [[nodiscard]] std::string brokerUri() const;
        [[nodiscard]] std::string availabilityTopic() const;
    };

    enum class ConfigUpdateResult {
        NoUpdate,
        Updated,
        ParseError
    };

    class ConfigManager {
        public:
            ConfigManager(const ConfigManager&) = delete;
            ConfigManager& operator=(const ConfigManager&) = delete;

            [[nodiscard]] static ConfigManager& getInstance() {
                static ConfigManager instance;
                return instance;
            }

            // Инициализация NVS
            esp_err_t init();

            // Значения по умолчанию + NVS (раздел прошивается при провижининге, сам мост его не пишет)
            esp_err_t load();

            // Опции аддона Home Assistant (JSON файл), отсутствие файла не ошибка
            esp_err_t loadOptionsFile(const char* path);

            // Переменные окружения поверх всего остального
            bool applyEnvironment();

            ConfigUpdateResult updateConfigFromJson(const char* json_str);

            /**
             * @brief Checks that every required setting is present and sane.
             * @return ESP_OK or ESP_ERR_INVALID_ARG (fatal at startup)
             */
            [[nodiscard]] esp_err_t validate() const;

            [[nodiscard]] AppConfig getConfig() const;

            void setConfig(const AppConfig& new_config);

            struct cJSON* getSerializedConfig(bool mask_passwords = true) const;

            static AppConfig defaultConfig();

        private:
            ConfigManager() = default;
            static esp_err_t getString(nvs_handle_t handle, const char* key, std::string& out_value);
            static esp_err_t getU32(nvs_handle_t handle, const char* key, uint32_t& out_value);
            static esp_err_t getI32(nvs_handle_t handle, const char* key, int32_t& out_value);
            static esp_err_t getU16(nvs_handle_t handle, const char* key, uint16_t& out_value);
            static esp_err_t getFlag(nvs_handle_t handle, const char* key, bool& out_value);

            AppConfig config_cache{defaultConfig()};
            mutable std::mutex config_mutex{};
            bool initialized{false};
    };
}

#endif //ZENSEMQTT_CONFIGMANAGER_HXX
