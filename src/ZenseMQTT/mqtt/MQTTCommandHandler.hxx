// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef ZENSEMQTT_MQTTCOMMANDHANDLER_HXX
#define ZENSEMQTT_MQTTCOMMANDHANDLER_HXX

#include "bridge/BridgeCommand.hxx"
#include "bridge/TopicLayout.hxx"

namespace zenseMQTT {

    class EntityRegistry;

    struct MqttMessage {
        std::string topic;
        std::string payload;
    };

    /**
     * @brief Decodes inbound MQTT messages into bridge commands.
     */
    class MQTTCommandHandler {
    public:
        enum class Result {
            IGNORED,
            COMMAND,
            HOME_ASSISTANT_ONLINE
        };

        MQTTCommandHandler(TopicLayout topics, const EntityRegistry& registry, bool debug);

        /**
         * @brief Handle mqtt message
         * @param msg topic + payload as received
         * @param out filled when COMMAND is returned
         */
        Result parse(const MqttMessage& msg, BridgeCommand& out) const;

        /**
         * @brief Home Assistant sends 0..255 unless brightness_scale is honoured,
         *        values up to 100 are taken as they are.
         * @return level 0..100, nullopt for non-numeric payloads
         */
        static std::optional<uint8_t> normalizeBrightness(std::string_view payload);

    private:
        const TopicLayout m_topics;
        const EntityRegistry& m_registry;
        const bool m_debug;
    };

} // zenseMQTT

#endif //ZENSEMQTT_MQTTCOMMANDHANDLER_HXX
