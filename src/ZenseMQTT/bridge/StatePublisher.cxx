// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "bridge/StatePublisher.hxx"
#include "config/ConfigDefaults.hxx"

namespace zenseMQTT
{
    static constexpr char TAG[] = "StatePublisher";
    static constexpr char PAYLOAD_ON[] = "ON";
    static constexpr char PAYLOAD_OFF[] = "OFF";

    StatePublisher::StatePublisher(MqttPublisher& mqtt, TopicLayout topics, EntityRegistry& registry)
        : m_mqtt(mqtt), m_topics(std::move(topics)), m_registry(registry) {}

    std::string StatePublisher::discoveryPayload(const ZenseEntity& entity) const {
        cJSON* root = cJSON_CreateObject();
        if (!root) return {};

        cJSON_AddStringToObject(root, "name", std::format("{} (Zense)", entity.name).c_str());
        cJSON_AddStringToObject(root, "unique_id", m_topics.uid(entity.id).c_str());
        cJSON_AddStringToObject(root, "command_topic", m_topics.commandTopic(entity.id).c_str());
        cJSON_AddStringToObject(root, "state_topic", m_topics.stateTopic(entity.id).c_str());
        cJSON_AddStringToObject(root, "brightness_command_topic", m_topics.brightnessCommandTopic(entity.id).c_str());
        cJSON_AddStringToObject(root, "brightness_state_topic", m_topics.brightnessStateTopic(entity.id).c_str());
        cJSON_AddNumberToObject(root, "brightness_scale", ZENSE_LEVEL_MAX);
        cJSON_AddStringToObject(root, "payload_on", PAYLOAD_ON);
        cJSON_AddStringToObject(root, "payload_off", PAYLOAD_OFF);
        cJSON_AddStringToObject(root, "availability_topic", m_topics.availabilityTopic().c_str());
        cJSON_AddStringToObject(root, "payload_available", defaults::PAYLOAD_ONLINE);
        cJSON_AddStringToObject(root, "payload_not_available", defaults::PAYLOAD_OFFLINE);
        cJSON_AddFalseToObject(root, "optimistic");
        cJSON_AddNumberToObject(root, "qos", 0);

        std::string payload;
        if (char* json = cJSON_PrintUnformatted(root)) {
            payload = json;
            cJSON_free(json);
        }
        cJSON_Delete(root);
        return payload;
    }

    void StatePublisher::publishDiscovery(const std::vector<ZenseEntity>& entities) {
        size_t published = 0;
        for (const auto& entity : entities) {
            const std::string payload = discoveryPayload(entity);
            if (payload.empty()) {
                ESP_LOGE(TAG, "Failed to build discovery payload for %s", entity.id.c_str());
                continue;
            }
            if (m_mqtt.publish(m_topics.discoveryTopic(entity.id), payload, 0, true) == ESP_OK) {
                ++published;
            }
        }
        ESP_LOGI(TAG, "Published discovery for %zu of %zu lights", published, entities.size());
    }

    void StatePublisher::publishDiscovery() {
        publishDiscovery(m_registry.entities());
    }

    bool StatePublisher::publishState(const ZenseDeviceId& id, const uint8_t level) {
        std::lock_guard lock(m_mutex);
        ++m_revisions[id];
        return publishLocked(id, level);
    }

    uint32_t StatePublisher::stateRevision(const ZenseDeviceId& id) const {
        std::lock_guard lock(m_mutex);
        const auto it = m_revisions.find(id);
        return it == m_revisions.end() ? 0 : it->second;
    }

    bool StatePublisher::publishPolledState(const ZenseDeviceId& id, const uint8_t level, const uint32_t revision) {
        std::lock_guard lock(m_mutex);
        if (const auto it = m_revisions.find(id); it != m_revisions.end() && it->second != revision) {
            ESP_LOGD(TAG, "Polled level %u of %s is older than the last command, dropped", level, id.c_str());
            return false;
        }
        return publishLocked(id, level);
    }

    bool StatePublisher::publishLocked(const ZenseDeviceId& id, uint8_t level) {
        level = std::min(level, ZENSE_LEVEL_MAX);
        m_registry.updateLevel(id, level);

        if (const auto it = m_last_published.find(id); it != m_last_published.end() && it->second == level) {
            return false;
        }

        const esp_err_t state_err = m_mqtt.publish(m_topics.stateTopic(id), level > 0 ? PAYLOAD_ON : PAYLOAD_OFF, 0, true);
        const esp_err_t level_err = m_mqtt.publish(m_topics.brightnessStateTopic(id), std::to_string(level), 0, true);
        if (state_err != ESP_OK || level_err != ESP_OK) {
            ESP_LOGW(TAG, "State of %s not published (%s)", id.c_str(), esp_err_to_name(state_err != ESP_OK ? state_err : level_err));
            // the broker may hold either value now
            m_last_published.erase(id);
            return false;
        }

        ESP_LOGD(TAG, "State %s -> %u", id.c_str(), level);
        m_last_published[id] = level;
        return true;
    }

    void StatePublisher::publishAvailability(const bool online) {
        const esp_err_t err = m_mqtt.publish(m_topics.availabilityTopic(),
            online ? defaults::PAYLOAD_ONLINE : defaults::PAYLOAD_OFFLINE, 1, true);
        if (err != ESP_OK) {
            ESP_LOGW(TAG, "Availability '%s' not published: %s", online ? defaults::PAYLOAD_ONLINE : defaults::PAYLOAD_OFFLINE, esp_err_to_name(err));
        }
    }

    void StatePublisher::resetCache() {
        std::lock_guard lock(m_mutex);
        m_last_published.clear();
    }
} // zenseMQTT
