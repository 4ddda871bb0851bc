// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "bridge/Bridge.hxx"
#include "zense/ZenseErrors.hxx"

namespace zenseMQTT
{
    static constexpr char TAG[] = "Bridge";

    ZenseLinkConfig Bridge::linkConfigFrom(const AppConfig& config) {
        ZenseLinkConfig link_cfg;
        link_cfg.host = config.zense_host;
        link_cfg.port = config.zense_port;
        link_cfg.login_code = config.zense_code;
        link_cfg.cmd_gap_ms = config.cmd_gap_ms;
        link_cfg.socket_timeout_ms = config.socket_timeout_ms;
        link_cfg.reconnect_min_ms = config.reconnect_min_ms;
        link_cfg.reconnect_max_ms = config.reconnect_max_ms;
        link_cfg.auth_cooldown_ms = config.auth_cooldown_ms;
        link_cfg.debug = config.debug_mqtt;
        return link_cfg;
    }

    TopicLayout Bridge::topicsFrom(const AppConfig& config) {
        return TopicLayout{config.mqtt_base_topic, config.discovery_prefix, config.uid_prefix};
    }

    Bridge::Bridge(const AppConfig& config, MqttPublisher& mqtt, std::unique_ptr<ZenseTransport> transport)
        : m_config(config),
          m_topics(topicsFrom(config)),
          m_mqtt(mqtt),
          m_link(linkConfigFrom(config), std::move(transport)),
          m_publisher(mqtt, m_topics, m_registry),
          m_translator(m_link, m_publisher, config.level_on_window_ms),
          m_poll(m_link, m_publisher, m_registry, config.state_poll_sec),
          m_handler(m_topics, m_registry, config.debug_mqtt),
          m_commands(m_handler, config.debounce_ms) {
        m_link.onStateChanged = [this](const LinkState state) { onLinkStateChanged(state); };
        m_commands.onCommand = [this](const BridgeCommand& command) {
            // the missing state update is the failure signal towards Home Assistant
            if (const esp_err_t err = m_translator.handle(command); err != ESP_OK) {
                ESP_LOGD(TAG, "Command for %s not applied: %s", command.device_id.c_str(), zenseErrToName(err));
            }
        };
        m_commands.onHomeAssistantOnline = [this]() { onHomeAssistantOnline(); };
    }

    Bridge::~Bridge() {
        stop();
    }

    esp_err_t Bridge::start() {
        if (m_started) return ESP_OK;

        if (const esp_err_t err = m_registry.loadStatic(m_config.zense_devices); err != ESP_OK) {
            return err;
        }
        if (m_registry.empty()) {
            ESP_LOGI(TAG, "No devices configured, they will be discovered from the gateway.");
        }

        if (const esp_err_t err = m_commands.init(); err != ESP_OK) return err;
        if (const esp_err_t err = m_link.start(); err != ESP_OK) return err;
        if (const esp_err_t err = m_poll.start(); err != ESP_OK) return err;

        m_started = true;
        ESP_LOGI(TAG, "Bridge started: gateway %s:%u, base topic %s", m_config.zense_host.c_str(), m_config.zense_port, m_config.mqtt_base_topic.c_str());
        return ESP_OK;
    }

    void Bridge::stop() {
        if (!m_started.exchange(false)) return;
        ESP_LOGI(TAG, "Stopping bridge...");

        if (m_mqtt_connected) {
            m_publisher.publishAvailability(false);
            for (const auto& topic : subscriptions()) {
                m_mqtt.unsubscribe(topic);
            }
        }

        // link first: in-flight and waiting gateway calls return ZENSE_ERR_SHUTDOWN
        m_link.stop();
        m_commands.stop();
        m_poll.stop();
        ESP_LOGI(TAG, "Bridge stopped.");
    }

    std::vector<std::string> Bridge::subscriptions() const {
        return {
            m_topics.homeAssistantStatusTopic(),
            m_topics.commandSubscription(),
            m_topics.brightnessSubscription(),
        };
    }

    void Bridge::onMqttConnected() {
        m_mqtt_connected = true;
        ESP_LOGI(TAG, "MQTT connected, announcing bridge.");

        // a fresh broker session may have lost retained messages
        m_publisher.resetCache();

        for (const auto& topic : subscriptions()) {
            if (m_mqtt.subscribe(topic) == ESP_OK) {
                ESP_LOGI(TAG, "Subscribed to %s", topic.c_str());
            }
        }
        m_publisher.publishAvailability(true);

        if (!m_registry.empty()) {
            m_publisher.publishDiscovery();
        }
        m_poll.requestRefresh();
    }

    void Bridge::onMqttDisconnected() {
        m_mqtt_connected = false;
    }

    void Bridge::onMqttData(const std::string& topic, const std::string& data) {
        m_commands.enqueueMqttMessage(topic, data);
    }

    void Bridge::onHomeAssistantOnline() {
        ESP_LOGI(TAG, "Home Assistant restarted, republishing discovery.");
        m_publisher.resetCache();
        if (!m_registry.empty()) {
            m_publisher.publishDiscovery();
        }
        m_poll.requestRefresh();
    }

    void Bridge::onLinkStateChanged(const LinkState state) {
        ESP_LOGI(TAG, "Gateway link %s", linkStateToString(state));
        if (state == LinkState::AUTHENTICATED) {
            // levels may have changed at the wall switches while we were away
            m_poll.requestRefresh();
        }
    }
} // zenseMQTT
