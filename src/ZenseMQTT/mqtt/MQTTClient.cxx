// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "mqtt/MQTTClient.hxx"
#include "config/ConfigDefaults.hxx"

namespace zenseMQTT
{
    static constexpr char TAG[] = "MQTTClient";

    esp_err_t MQTTClient::init(const std::string& uri, const std::string& client_id, const std::string& availability_topic,
                               const std::string& username, const std::string& password) {
        if (client_handle) {
            ESP_LOGW(TAG, "MQTT client already initialized.");
            return ESP_ERR_INVALID_STATE;
        }

        m_uri = uri;
        m_client_id = client_id;
        m_availability_topic = availability_topic;
        m_username = username;
        m_password = password;

        esp_mqtt_client_config_t mqtt_cfg = {};
        mqtt_cfg.broker.address.uri = m_uri.c_str();
        mqtt_cfg.credentials.client_id = m_client_id.c_str();
        if (!m_username.empty()) {
            mqtt_cfg.credentials.username = m_username.c_str();
        }
        if (!m_password.empty()) {
            mqtt_cfg.credentials.authentication.password = m_password.c_str();
        }
        mqtt_cfg.session.keepalive = 30;
        mqtt_cfg.session.disable_clean_session = false;
        mqtt_cfg.session.last_will.topic = m_availability_topic.c_str();
        mqtt_cfg.session.last_will.msg = defaults::PAYLOAD_OFFLINE;
        mqtt_cfg.session.last_will.qos = 1;
        mqtt_cfg.session.last_will.retain = true;

        client_handle = esp_mqtt_client_init(&mqtt_cfg);
        if (!client_handle) {
            ESP_LOGE(TAG, "esp_mqtt_client_init failed for %s", m_uri.c_str());
            return ESP_FAIL;
        }
        if (const esp_err_t err = esp_mqtt_client_register_event(client_handle, MQTT_EVENT_ANY, mqttEventHandler, this); err != ESP_OK) {
            ESP_LOGE(TAG, "Failed to register MQTT event handler: %s", esp_err_to_name(err));
            esp_mqtt_client_destroy(client_handle);
            client_handle = nullptr;
            return err;
        }
        status = MqttStatus::DISCONNECTED;
        ESP_LOGI(TAG, "MQTT client configured for %s (user=%s)", m_uri.c_str(), m_username.empty() ? "no" : "yes");
        return ESP_OK;
    }

    esp_err_t MQTTClient::connect() {
        if (!client_handle) return ESP_ERR_INVALID_STATE;
        status = MqttStatus::CONNECTING;
        const esp_err_t err = esp_mqtt_client_start(client_handle);
        if (err != ESP_OK) {
            ESP_LOGE(TAG, "Failed to start MQTT client: %s", esp_err_to_name(err));
            status = MqttStatus::DISCONNECTED;
        }
        return err;
    }

    void MQTTClient::disconnect() {
        if (!client_handle) return;
        if (status == MqttStatus::CONNECTED) {
            ESP_ERROR_CHECK_WITHOUT_ABORT(esp_mqtt_client_disconnect(client_handle));
        }
        status = MqttStatus::DISCONNECTED;
        if (const esp_err_t err = esp_mqtt_client_stop(client_handle); err != ESP_OK) {
            ESP_LOGW(TAG, "Stopping MQTT client: %s", esp_err_to_name(err));
        }
    }

    MqttStatus MQTTClient::getStatus() const {
        return status;
    }

    esp_err_t MQTTClient::publish(const std::string& topic, const std::string& payload, const int qos, const bool retain) {
        if (!client_handle) return ESP_ERR_INVALID_STATE;
        if (status != MqttStatus::CONNECTED) return ESP_ERR_INVALID_STATE;
        const int msg_id = esp_mqtt_client_publish(client_handle, topic.c_str(), payload.c_str(),
                                                   static_cast<int>(payload.length()), qos, retain ? 1 : 0);
        if (msg_id < 0) {
            ESP_LOGW(TAG, "Publish to %s failed", topic.c_str());
            return ESP_FAIL;
        }
        return ESP_OK;
    }

    esp_err_t MQTTClient::subscribe(const std::string& topic, const int qos) {
        if (!client_handle) return ESP_ERR_INVALID_STATE;
        if (esp_mqtt_client_subscribe(client_handle, topic.c_str(), qos) < 0) {
            ESP_LOGW(TAG, "Subscribe to %s failed", topic.c_str());
            return ESP_FAIL;
        }
        return ESP_OK;
    }

    esp_err_t MQTTClient::unsubscribe(const std::string& topic) {
        if (!client_handle) return ESP_ERR_INVALID_STATE;
        if (esp_mqtt_client_unsubscribe(client_handle, topic.c_str()) < 0) {
            ESP_LOGW(TAG, "Unsubscribe from %s failed", topic.c_str());
            return ESP_FAIL;
        }
        return ESP_OK;
    }

    void MQTTClient::mqttEventHandler(void* handler_args, [[maybe_unused]] esp_event_base_t base, int32_t event_id, void* event_data) {
        auto* client = static_cast<MQTTClient*>(handler_args);
        auto const* event = static_cast<esp_mqtt_event_handle_t>(event_data);
        if (!client || !event) return;

        switch (static_cast<esp_mqtt_event_id_t>(event_id)) {
            case MQTT_EVENT_CONNECTED:
                ESP_LOGI(TAG, "MQTT_EVENT_CONNECTED");
                client->status = MqttStatus::CONNECTED;
                if (client->onConnected) client->onConnected();
                break;
            case MQTT_EVENT_DISCONNECTED:
                ESP_LOGW(TAG, "MQTT_EVENT_DISCONNECTED");
                client->status = MqttStatus::CONNECTING;
                if (client->onDisconnected) client->onDisconnected();
                break;
            case MQTT_EVENT_SUBSCRIBED:
                ESP_LOGD(TAG, "MQTT_EVENT_SUBSCRIBED, msg_id=%d", event->msg_id);
                break;
            case MQTT_EVENT_UNSUBSCRIBED:
                ESP_LOGD(TAG, "MQTT_EVENT_UNSUBSCRIBED, msg_id=%d", event->msg_id);
                break;
            case MQTT_EVENT_DATA:
                // fragmented payloads (current_data_offset > 0) are far larger than any command
                if (client->onData && event->current_data_offset == 0 && event->data_len == event->total_data_len) {
                    const std::string topic(event->topic, event->topic_len);
                    const std::string data(event->data, event->data_len);
                    client->onData(topic, data);
                }
                break;
            case MQTT_EVENT_ERROR:
                ESP_LOGE(TAG, "MQTT_EVENT_ERROR");
                break;
            default:
                ESP_LOGD(TAG, "Other event id:%d", event->event_id);
                break;
        }
    }
} // zenseMQTT
