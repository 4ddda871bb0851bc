// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef ZENSEMQTT_MQTTCLIENT_HXX
#define ZENSEMQTT_MQTTCLIENT_HXX

#include "mqtt_client.h"
#include "bridge/MqttPublisher.hxx"

namespace zenseMQTT
{
    enum class MqttStatus {
        DISCONNECTED,
        CONNECTING,
        CONNECTED
    };

    class MQTTClient final : public MqttPublisher {
        public:
            MQTTClient(const MQTTClient&) = delete;
            MQTTClient& operator=(const MQTTClient&) = delete;

            static MQTTClient& getInstance() {
                static MQTTClient instance;
                return instance;
            }

            esp_err_t init(const std::string& uri, const std::string& client_id, const std::string& availability_topic,
                           const std::string& username, const std::string& password);

            esp_err_t connect();
            void disconnect();

            [[nodiscard]] MqttStatus getStatus() const;

            esp_err_t publish(const std::string& topic, const std::string& payload, int qos = 0, bool retain = false) override;
            esp_err_t subscribe(const std::string& topic, int qos = 0) override;
            esp_err_t unsubscribe(const std::string& topic) override;

            // Callbacks, invoked from the esp-mqtt task
            std::function<void()> onConnected;
            std::function<void()> onDisconnected;
            std::function<void(const std::string&, const std::string&)> onData;

        private:
            MQTTClient() = default;

            static void mqttEventHandler(void* handler_args, esp_event_base_t base, int32_t event_id, void* event_data);

            // esp-mqtt keeps pointers into the config, these must outlive the client
            std::string m_uri;
            std::string m_client_id;
            std::string m_availability_topic;
            std::string m_username;
            std::string m_password;

            esp_mqtt_client_handle_t client_handle{nullptr};
            std::atomic<MqttStatus> status{MqttStatus::DISCONNECTED};
    };
} // zenseMQTT

#endif //ZENSEMQTT_MQTTCLIENT_HXX
