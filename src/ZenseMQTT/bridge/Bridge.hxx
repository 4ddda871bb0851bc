// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef ZENSEMQTT_BRIDGE_HXX
#define ZENSEMQTT_BRIDGE_HXX

#include "bridge/CommandTranslator.hxx"
#include "bridge/EntityRegistry.hxx"
#include "bridge/PollLoop.hxx"
#include "bridge/StatePublisher.hxx"
#include "config/ConfigManager.hxx"
#include "mqtt/MQTTCommandHandler.hxx"
#include "mqtt/MQTTCommandProcess.hxx"
#include "zense/ZenseLink.hxx"

namespace zenseMQTT
{
    /**
     * @brief Owns every bridge component and routes between the bus and the gateway.
     *
     * The MQTT transport itself is outside: it delivers onMqttConnected(),
     * onMqttDisconnected() and onMqttData(), and receives publications
     * through the MqttPublisher passed in.
     */
    class Bridge {
    public:
        Bridge(const AppConfig& config, MqttPublisher& mqtt, std::unique_ptr<ZenseTransport> transport);
        ~Bridge();

        Bridge(const Bridge&) = delete;
        Bridge& operator=(const Bridge&) = delete;

        /**
         * @brief Loads the device list and starts link supervisor, poll loop and command worker.
         * @return ESP_ERR_INVALID_ARG for a malformed device list
         */
        esp_err_t start();

        /**
         * @brief Publishes offline, unsubscribes, stops all tasks and closes the gateway session.
         */
        void stop();

        void onMqttConnected();
        void onMqttDisconnected();
        void onMqttData(const std::string& topic, const std::string& data);

        [[nodiscard]] EntityRegistry& registry() { return m_registry; }
        [[nodiscard]] ZenseLink& link() { return m_link; }

        static ZenseLinkConfig linkConfigFrom(const AppConfig& config);
        static TopicLayout topicsFrom(const AppConfig& config);

    private:
        void onLinkStateChanged(LinkState state);
        void onHomeAssistantOnline();
        [[nodiscard]] std::vector<std::string> subscriptions() const;

        const AppConfig m_config;
        const TopicLayout m_topics;
        MqttPublisher& m_mqtt;

        EntityRegistry m_registry;
        ZenseLink m_link;
        StatePublisher m_publisher;
        CommandTranslator m_translator;
        PollLoop m_poll;
        MQTTCommandHandler m_handler;
        MQTTCommandProcess m_commands;

        std::atomic<bool> m_mqtt_connected{false};
        std::atomic<bool> m_started{false};
    };
} // zenseMQTT

#endif //ZENSEMQTT_BRIDGE_HXX
