// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "mqtt/MQTTCommandHandler.hxx"
#include "bridge/EntityRegistry.hxx"
#include "config/ConfigDefaults.hxx"
#include "utils/StringUtils.hxx"

namespace zenseMQTT {

    static constexpr char TAG[] = "MQTTCommandHandler";
    static constexpr int HA_BRIGHTNESS_MAX = 255;

    MQTTCommandHandler::MQTTCommandHandler(TopicLayout topics, const EntityRegistry& registry, const bool debug)
        : m_topics(std::move(topics)), m_registry(registry), m_debug(debug) {}

    std::optional<uint8_t> MQTTCommandHandler::normalizeBrightness(const std::string_view payload) {
        const auto raw = utils::parseRoundedNumber(payload);
        if (!raw) return std::nullopt;

        if (*raw < 0) return 0;
        if (*raw <= ZENSE_LEVEL_MAX) return static_cast<uint8_t>(*raw);

        const int clamped = std::min(*raw, HA_BRIGHTNESS_MAX);
        return static_cast<uint8_t>((clamped * ZENSE_LEVEL_MAX + HA_BRIGHTNESS_MAX / 2) / HA_BRIGHTNESS_MAX);
    }

    MQTTCommandHandler::Result MQTTCommandHandler::parse(const MqttMessage& msg, BridgeCommand& out) const {
        const std::string_view payload = utils::trim(msg.payload);

        if (msg.topic == m_topics.homeAssistantStatusTopic()) {
            return payload == defaults::PAYLOAD_ONLINE ? Result::HOME_ASSISTANT_ONLINE : Result::IGNORED;
        }

        const auto parsed = m_topics.parseCommandTopic(msg.topic);
        if (!parsed) {
            ESP_LOGD(TAG, "Ignoring message on %s", msg.topic.c_str());
            return Result::IGNORED;
        }
        const auto& [device_id, topic_kind] = *parsed;

        if (m_debug) {
            ESP_LOGI(TAG, "RX topic=%s payload='%.*s'", msg.topic.c_str(), static_cast<int>(payload.size()), payload.data());
        }

        if (!m_registry.contains(device_id)) {
            ESP_LOGW(TAG, "Command for unknown device %s dropped", device_id.c_str());
            return Result::IGNORED;
        }

        switch (topic_kind) {
            case TopicLayout::CommandTopic::BRIGHTNESS: {
                const auto level = normalizeBrightness(payload);
                if (!level) {
                    ESP_LOGW(TAG, "Non-numeric brightness '%.*s' for %s", static_cast<int>(payload.size()), payload.data(), device_id.c_str());
                    return Result::IGNORED;
                }
                out = BridgeCommand::brightness(device_id, *level);
                return Result::COMMAND;
            }
            case TopicLayout::CommandTopic::SWITCH: {
                const std::string upper = utils::toUpper(payload);
                if (upper == "ON") {
                    out = BridgeCommand::on(device_id);
                    return Result::COMMAND;
                }
                if (upper == "OFF") {
                    out = BridgeCommand::off(device_id);
                    return Result::COMMAND;
                }
                ESP_LOGW(TAG, "Unknown payload '%.*s' for %s", static_cast<int>(payload.size()), payload.data(), device_id.c_str());
                return Result::IGNORED;
            }
        }
        return Result::IGNORED;
    }

} // zenseMQTT
