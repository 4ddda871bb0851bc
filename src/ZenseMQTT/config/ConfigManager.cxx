// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "config/ConfigManager.hxx"
#include "config/ConfigDefaults.hxx"
#include "zense/ZenseProtocol.hxx"
#include "utils/NvsHandle.hxx"
#include "utils/StringUtils.hxx"
#include <ctime>

namespace zenseMQTT
{
    static constexpr char TAG[] = "Config";
    static constexpr size_t OPTIONS_FILE_MAX_SIZE = 16 * 1024;

    std::string AppConfig::brokerUri() const {
        if (!mqtt_uri.empty()) return mqtt_uri;
        return std::format("mqtt://{}:{}", mqtt_host, mqtt_port);
    }

    std::string AppConfig::availabilityTopic() const {
        return std::format("{}{}", mqtt_base_topic, defaults::AVAILABILITY_SUBTOPIC);
    }

    AppConfig ConfigManager::defaultConfig() {
        AppConfig cfg{};
        cfg.zense_host = defaults::ZENSE_HOST;
        cfg.zense_port = defaults::ZENSE_PORT;
        cfg.zense_code = defaults::ZENSE_CODE;
        cfg.zense_devices = "{}";
        cfg.mqtt_host = defaults::MQTT_HOST;
        cfg.mqtt_port = defaults::MQTT_PORT;
        cfg.mqtt_base_topic = defaults::MQTT_BASE_TOPIC;
        cfg.discovery_prefix = defaults::DISCOVERY_PREFIX;
        cfg.uid_prefix = defaults::UID_PREFIX;
        cfg.state_poll_sec = defaults::STATE_POLL_SEC;
        cfg.debounce_ms = defaults::DEBOUNCE_MS;
        cfg.cmd_gap_ms = defaults::CMD_GAP_MS;
        cfg.level_on_window_ms = defaults::LEVEL_ON_WINDOW_MS;
        cfg.socket_timeout_ms = defaults::SOCKET_TIMEOUT_MS;
        cfg.reconnect_min_ms = defaults::RECONNECT_MIN_MS;
        cfg.reconnect_max_ms = defaults::RECONNECT_MAX_MS;
        cfg.auth_cooldown_ms = defaults::AUTH_COOLDOWN_MS;
        return cfg;
    }

    esp_err_t ConfigManager::init() {
        if (initialized) {
            return ESP_OK;
        }
        esp_err_t ret = nvs_flash_init();
        if (ret == ESP_ERR_NVS_NO_FREE_PAGES || ret == ESP_ERR_NVS_NEW_VERSION_FOUND) {
            ESP_LOGW(TAG, "NVS partition was truncated, erasing and re-initializing...");
            ret = nvs_flash_erase();
            if (ret == ESP_OK) {
                ret = nvs_flash_init();
            }
        }
        if (ret != ESP_OK) {
            ESP_LOGE(TAG, "NVS init failed: %s", esp_err_to_name(ret));
            return ret;
        }
        initialized = true;
        ESP_LOGI(TAG, "NVS initialized successfully.");
        return ESP_OK;
    }

    esp_err_t ConfigManager::load() {
        std::lock_guard lock(config_mutex);
        config_cache = defaultConfig();

        const utils::NvsHandle nvs_handle(defaults::NVS_NAMESPACE, NVS_READONLY);
        if (!nvs_handle) {
            ESP_LOGI(TAG, "No stored configuration, using defaults.");
        } else {
            #define GetNVS(func, key, field) \
                if (const esp_err_t err = func(nvs_handle.get(), key, config_cache.field); err != ESP_OK) return err;

            GetNVS(getString, "wifi_ssid", wifi_ssid);
            GetNVS(getString, "wifi_pass", wifi_password);
            GetNVS(getString, "zense_ip", zense_host);
            GetNVS(getU16, "zense_port", zense_port);
            GetNVS(getString, "zense_code", zense_code);
            GetNVS(getString, "zense_devs", zense_devices);
            GetNVS(getString, "mqtt_uri", mqtt_uri);
            GetNVS(getString, "mqtt_host", mqtt_host);
            GetNVS(getU16, "mqtt_port", mqtt_port);
            GetNVS(getString, "mqtt_user", mqtt_user);
            GetNVS(getString, "mqtt_pass", mqtt_pass);
            GetNVS(getString, "cid", client_id);
            GetNVS(getString, "mqtt_base", mqtt_base_topic);
            GetNVS(getString, "disc_prefix", discovery_prefix);
            GetNVS(getString, "uid_prefix", uid_prefix);
            GetNVS(getI32, "poll_sec", state_poll_sec);
            GetNVS(getU32, "debounce_ms", debounce_ms);
            GetNVS(getU32, "gap_ms", cmd_gap_ms);
            GetNVS(getU32, "on_window_ms", level_on_window_ms);
            GetNVS(getU32, "sock_to_ms", socket_timeout_ms);
            GetNVS(getU32, "recon_min_ms", reconnect_min_ms);
            GetNVS(getU32, "recon_max_ms", reconnect_max_ms);
            GetNVS(getU32, "auth_cd_ms", auth_cooldown_ms);
            GetNVS(getString, "syslog_srv", syslog_server);

            GetNVS(getFlag, "debug_mqtt", debug_mqtt);
            GetNVS(getFlag, "syslog_en", syslog_enabled);

            #undef GetNVS
        }

        if (config_cache.client_id.empty()) {
            config_cache.client_id = std::format("zense-bridge-{}", static_cast<long long>(time(nullptr)));
        }

        ESP_LOGI(TAG, "Configuration loaded successfully.");
        return ESP_OK;
    }

    esp_err_t ConfigManager::loadOptionsFile(const char* path) {
        FILE* file = fopen(path, "rb");
        if (!file) {
            ESP_LOGD(TAG, "Options file %s not present", path);
            return ESP_OK;
        }

        std::string content;
        std::array<char, 512> chunk{};
        size_t read = 0;
        while ((read = fread(chunk.data(), 1, chunk.size(), file)) > 0) {
            content.append(chunk.data(), read);
            if (content.size() > OPTIONS_FILE_MAX_SIZE) {
                fclose(file);
                ESP_LOGE(TAG, "Options file %s is larger than %zu bytes", path, OPTIONS_FILE_MAX_SIZE);
                return ESP_ERR_INVALID_SIZE;
            }
        }
        fclose(file);

        switch (updateConfigFromJson(content.c_str())) {
            case ConfigUpdateResult::ParseError:
                ESP_LOGE(TAG, "Options file %s is not valid JSON", path);
                return ESP_ERR_INVALID_ARG;
            case ConfigUpdateResult::Updated:
                ESP_LOGI(TAG, "Applied add-on options from %s", path);
                break;
            case ConfigUpdateResult::NoUpdate:
                break;
        }
        return ESP_OK;
    }

    static std::optional<uint32_t> secondsToMs(const std::string_view value) {
        const auto trimmed = utils::trim(value);
        double seconds = 0.0;
        const auto [ptr, ec] = std::from_chars(trimmed.data(), trimmed.data() + trimmed.size(), seconds);
        if (trimmed.empty() || ec != std::errc() || ptr != trimmed.data() + trimmed.size() || seconds < 0 || seconds > 86400) {
            return std::nullopt;
        }
        return static_cast<uint32_t>(seconds * 1000.0 + 0.5);
    }

    static bool isTruthy(const std::string_view value) {
        const auto upper = utils::toUpper(utils::trim(value));
        return upper == "1" || upper == "TRUE" || upper == "YES" || upper == "ON";
    }

    bool ConfigManager::applyEnvironment() {
        std::lock_guard lock(config_mutex);
        bool changed = false;

        auto env = [](const char* name) -> std::optional<std::string_view> {
            const char* value = getenv(name);
            if (!value || value[0] == '\0') return std::nullopt;
            return std::string_view(value);
        };
        auto warnInvalid = [](const char* name, const std::string_view value) {
            ESP_LOGW(TAG, "Ignoring invalid %s='%.*s'", name, static_cast<int>(value.size()), value.data());
        };

        #define EnvString(NAME, FIELD) \
            if (const auto v = env(NAME)) { config_cache.FIELD = std::string(*v); changed = true; }
        #define EnvNumber(NAME, FIELD, TYPE) \
            if (const auto v = env(NAME)) { \
                if (const auto n = utils::parseInt<TYPE>(*v)) { config_cache.FIELD = *n; changed = true; } \
                else warnInvalid(NAME, *v); \
            }
        #define EnvSeconds(NAME, FIELD) \
            if (const auto v = env(NAME)) { \
                if (const auto ms = secondsToMs(*v)) { config_cache.FIELD = *ms; changed = true; } \
                else warnInvalid(NAME, *v); \
            }

        EnvString("ZENSE_IP", zense_host);
        EnvNumber("ZENSE_PORT", zense_port, uint16_t);
        EnvString("ZENSE_CODE", zense_code);
        EnvString("ZENSE_DEVICES", zense_devices);
        EnvString("MQTT_URI", mqtt_uri);
        EnvString("MQTT_HOST", mqtt_host);
        EnvNumber("MQTT_PORT", mqtt_port, uint16_t);
        EnvString("MQTT_USER", mqtt_user);
        EnvString("MQTT_PASS", mqtt_pass);
        EnvString("MQTT_CLIENT_ID", client_id);
        EnvString("BASE", mqtt_base_topic);
        EnvString("DISCOVERY_PREFIX", discovery_prefix);
        EnvString("UID_PREFIX", uid_prefix);
        EnvNumber("STATE_POLL_SEC", state_poll_sec, int32_t);
        EnvNumber("DEBOUNCE_MS", debounce_ms, uint32_t);
        EnvSeconds("CMD_GAP_SEC", cmd_gap_ms);
        EnvSeconds("LEVEL_ON_WINDOW_SEC", level_on_window_ms);
        EnvSeconds("SOCKET_TIMEOUT", socket_timeout_ms);
        EnvString("SYSLOG_SERVER", syslog_server);

        #undef EnvString
        #undef EnvNumber
        #undef EnvSeconds

        if (const auto v = env("DEBUG_MQTT")) {
            config_cache.debug_mqtt = isTruthy(*v);
            changed = true;
        }
        if (const auto v = env("SYSLOG_ENABLED")) {
            config_cache.syslog_enabled = isTruthy(*v);
            changed = true;
        }

        if (changed) {
            ESP_LOGI(TAG, "Environment overrides applied.");
        }
        return changed;
    }

    ConfigUpdateResult ConfigManager::updateConfigFromJson(const char* json_str) {
        cJSON* root = cJSON_Parse(json_str);
        if (root == nullptr || !cJSON_IsObject(root)) {
            ESP_LOGE(TAG, "Failed to parse configuration JSON");
            cJSON_Delete(root);
            return ConfigUpdateResult::ParseError;
        }

        AppConfig current_cfg = getConfig();
        bool changed = false;

        #define JsonSetStrConfig(NAME, KEY) \
            if (const cJSON* item = cJSON_GetObjectItem(root, KEY); cJSON_IsString(item) && (item->valuestring != nullptr)) { \
                std::string val = item->valuestring; \
                if (current_cfg.NAME != val) { \
                    current_cfg.NAME = val; \
                    changed = true; \
                } \
            }
        #define JsonSetNumConfig(NAME, KEY, TYPE) \
            if (const cJSON* item = cJSON_GetObjectItem(root, KEY); cJSON_IsNumber(item)) { \
                const auto val = static_cast<TYPE>(item->valuedouble); \
                if (current_cfg.NAME != val) { \
                    current_cfg.NAME = val; \
                    changed = true; \
                } \
            }
        #define JsonSetSecondsConfig(NAME, KEY) \
            if (const cJSON* item = cJSON_GetObjectItem(root, KEY); cJSON_IsNumber(item) && item->valuedouble >= 0) { \
                const auto val = static_cast<uint32_t>(item->valuedouble * 1000.0 + 0.5); \
                if (current_cfg.NAME != val) { \
                    current_cfg.NAME = val; \
                    changed = true; \
                } \
            }
        #define JsonSetBoolConfig(NAME, KEY) \
            if (const cJSON* item = cJSON_GetObjectItem(root, KEY); cJSON_IsBool(item)) { \
                const bool val = cJSON_IsTrue(item); \
                if (current_cfg.NAME != val) { \
                    current_cfg.NAME = val; \
                    changed = true; \
                } \
            }

        JsonSetStrConfig(wifi_ssid, "wifi_ssid");
        JsonSetStrConfig(wifi_password, "wifi_password");

        JsonSetStrConfig(zense_host, "zense_ip");
        JsonSetNumConfig(zense_port, "zense_port", uint16_t);
        JsonSetStrConfig(zense_code, "zense_code");
        // the add-on schema declares the code as int
        if (const cJSON* item = cJSON_GetObjectItem(root, "zense_code"); cJSON_IsNumber(item)) {
            const std::string val = std::to_string(static_cast<long long>(item->valuedouble));
            if (current_cfg.zense_code != val) {
                current_cfg.zense_code = val;
                changed = true;
            }
        }
        if (const cJSON* item = cJSON_GetObjectItem(root, "devices"); cJSON_IsObject(item)) {
            if (char* devices = cJSON_PrintUnformatted(item)) {
                if (current_cfg.zense_devices != devices) {
                    current_cfg.zense_devices = devices;
                    changed = true;
                }
                cJSON_free(devices);
            }
        }

        JsonSetStrConfig(mqtt_uri, "mqtt_uri");
        JsonSetStrConfig(mqtt_host, "mqtt_host");
        JsonSetNumConfig(mqtt_port, "mqtt_port", uint16_t);
        JsonSetStrConfig(mqtt_user, "mqtt_user");
        JsonSetStrConfig(mqtt_pass, "mqtt_pass");
        JsonSetStrConfig(client_id, "client_id");
        JsonSetStrConfig(mqtt_base_topic, "mqtt_base_topic");
        JsonSetStrConfig(discovery_prefix, "discovery_prefix");
        JsonSetStrConfig(uid_prefix, "uid_prefix");

        JsonSetNumConfig(state_poll_sec, "state_poll_sec", int32_t);
        JsonSetNumConfig(debounce_ms, "debounce_ms", uint32_t);
        JsonSetSecondsConfig(cmd_gap_ms, "cmd_gap_sec");
        JsonSetSecondsConfig(level_on_window_ms, "level_on_window_sec");
        JsonSetSecondsConfig(socket_timeout_ms, "socket_timeout_sec");
        JsonSetSecondsConfig(reconnect_min_ms, "reconnect_min_sec");
        JsonSetSecondsConfig(reconnect_max_ms, "reconnect_max_sec");
        JsonSetSecondsConfig(auth_cooldown_ms, "auth_cooldown_sec");

        JsonSetBoolConfig(debug_mqtt, "debug_mqtt");
        JsonSetStrConfig(syslog_server, "syslog_server");
        JsonSetBoolConfig(syslog_enabled, "syslog_enabled");

        #undef JsonSetStrConfig
        #undef JsonSetNumConfig
        #undef JsonSetSecondsConfig
        #undef JsonSetBoolConfig

        cJSON_Delete(root);

        if (!changed) {
            return ConfigUpdateResult::NoUpdate;
        }
        setConfig(current_cfg);
        return ConfigUpdateResult::Updated;
    }

    esp_err_t ConfigManager::validate() const {
        const AppConfig cfg = getConfig();
        bool valid = true;

        auto fail = [&valid](const char* message) {
            ESP_LOGE(TAG, "Invalid configuration: %s", message);
            valid = false;
        };

        if (cfg.zense_host.empty()) fail("zense_ip is required");
        if (cfg.zense_port == 0) fail("zense_port must be 1..65535");
        if (cfg.zense_code.empty()) fail("zense_code is required");
        if (cfg.mqtt_uri.empty() && (cfg.mqtt_host.empty() || cfg.mqtt_port == 0)) fail("mqtt_host/mqtt_port or mqtt_uri is required");
        if (cfg.mqtt_base_topic.empty()) fail("mqtt_base_topic must not be empty");
        if (cfg.discovery_prefix.empty()) fail("discovery_prefix must not be empty");
        if (cfg.uid_prefix.empty()) fail("uid_prefix must not be empty");
        if (cfg.socket_timeout_ms == 0) fail("socket timeout must be positive");
        if (cfg.reconnect_min_ms == 0 || cfg.reconnect_min_ms > cfg.reconnect_max_ms) fail("reconnect backoff must satisfy 0 < min <= max");
        if (cfg.auth_cooldown_ms == 0) fail("auth cooldown must be positive");

        if (!cfg.zense_devices.empty()) {
            cJSON* devices = cJSON_Parse(cfg.zense_devices.c_str());
            if (!cJSON_IsObject(devices)) {
                fail("devices must be a JSON object of id -> name");
            } else {
                const cJSON* item = nullptr;
                cJSON_ArrayForEach(item, devices) {
                    if (!ZenseProtocol::isValidDeviceId(item->string ? item->string : "") || !cJSON_IsString(item)) {
                        fail("devices contains an invalid device id or name");
                        break;
                    }
                }
            }
            cJSON_Delete(devices);
        }

        return valid ? ESP_OK : ESP_ERR_INVALID_ARG;
    }

    AppConfig ConfigManager::getConfig() const {
        std::lock_guard lock(config_mutex);
        return config_cache;
    }

    void ConfigManager::setConfig(const AppConfig& new_config) {
        std::lock_guard lock(config_mutex);
        config_cache = new_config;
    }

    cJSON* ConfigManager::getSerializedConfig(const bool mask_passwords) const {
        const AppConfig cfg = getConfig();
        cJSON* root = cJSON_CreateObject();

        cJSON_AddStringToObject(root, "zense_ip", cfg.zense_host.c_str());
        cJSON_AddNumberToObject(root, "zense_port", cfg.zense_port);
        cJSON_AddStringToObject(root, "zense_code", mask_passwords ? "***" : cfg.zense_code.c_str());
        cJSON_AddStringToObject(root, "devices", cfg.zense_devices.c_str());
        cJSON_AddStringToObject(root, "mqtt_uri", cfg.brokerUri().c_str());
        cJSON_AddStringToObject(root, "mqtt_user", cfg.mqtt_user.c_str());
        cJSON_AddStringToObject(root, "mqtt_pass", mask_passwords ? "***" : cfg.mqtt_pass.c_str());
        cJSON_AddStringToObject(root, "client_id", cfg.client_id.c_str());
        cJSON_AddStringToObject(root, "mqtt_base_topic", cfg.mqtt_base_topic.c_str());
        cJSON_AddStringToObject(root, "discovery_prefix", cfg.discovery_prefix.c_str());
        cJSON_AddStringToObject(root, "uid_prefix", cfg.uid_prefix.c_str());
        cJSON_AddNumberToObject(root, "state_poll_sec", cfg.state_poll_sec);
        cJSON_AddNumberToObject(root, "debounce_ms", cfg.debounce_ms);
        cJSON_AddNumberToObject(root, "cmd_gap_ms", cfg.cmd_gap_ms);
        cJSON_AddNumberToObject(root, "level_on_window_ms", cfg.level_on_window_ms);
        cJSON_AddNumberToObject(root, "socket_timeout_ms", cfg.socket_timeout_ms);
        cJSON_AddNumberToObject(root, "reconnect_min_ms", cfg.reconnect_min_ms);
        cJSON_AddNumberToObject(root, "reconnect_max_ms", cfg.reconnect_max_ms);
        cJSON_AddNumberToObject(root, "auth_cooldown_ms", cfg.auth_cooldown_ms);
        cJSON_AddBoolToObject(root, "debug_mqtt", cfg.debug_mqtt);
        cJSON_AddStringToObject(root, "syslog_server", cfg.syslog_server.c_str());
        cJSON_AddBoolToObject(root, "syslog_enabled", cfg.syslog_enabled);
        cJSON_AddStringToObject(root, "wifi_ssid", cfg.wifi_ssid.c_str());
        cJSON_AddStringToObject(root, "wifi_password", mask_passwords ? "***" : cfg.wifi_password.c_str());

        return root;
    }

    esp_err_t ConfigManager::getString(const nvs_handle_t handle, const char* key, std::string& out_value) {
        size_t required_size = 0;
        esp_err_t err = nvs_get_str(handle, key, nullptr, &required_size);

        if (err == ESP_ERR_NVS_NOT_FOUND) {
            return ESP_OK;
        }
        if (err != ESP_OK) {
            ESP_LOGE(TAG, "Error reading key '%s': %s", key, esp_err_to_name(err));
            return err;
        }
        if (required_size == 0) {
            out_value.clear();
            return ESP_OK;
        }

        std::vector<char> buf(required_size);
        err = nvs_get_str(handle, key, buf.data(), &required_size);
        if (err == ESP_OK) {
            out_value.assign(buf.data(), required_size > 0 ? required_size - 1 : 0);
        }
        return err;
    }

    esp_err_t ConfigManager::getU32(const nvs_handle_t handle, const char* key, uint32_t& out_value) {
        const esp_err_t err = nvs_get_u32(handle, key, &out_value);
        return err == ESP_ERR_NVS_NOT_FOUND ? ESP_OK : err;
    }

    esp_err_t ConfigManager::getI32(const nvs_handle_t handle, const char* key, int32_t& out_value) {
        const esp_err_t err = nvs_get_i32(handle, key, &out_value);
        return err == ESP_ERR_NVS_NOT_FOUND ? ESP_OK : err;
    }

    esp_err_t ConfigManager::getU16(const nvs_handle_t handle, const char* key, uint16_t& out_value) {
        const esp_err_t err = nvs_get_u16(handle, key, &out_value);
        return err == ESP_ERR_NVS_NOT_FOUND ? ESP_OK : err;
    }

    esp_err_t ConfigManager::getFlag(const nvs_handle_t handle, const char* key, bool& out_value) {
        uint8_t flag = 0;
        const esp_err_t err = nvs_get_u8(handle, key, &flag);
        if (err == ESP_ERR_NVS_NOT_FOUND) return ESP_OK;
        if (err == ESP_OK) out_value = (flag == 1);
        return err;
    }
}
