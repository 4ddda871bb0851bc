// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef ZENSEMQTT_STATEPUBLISHER_HXX
#define ZENSEMQTT_STATEPUBLISHER_HXX

#include "bridge/EntityRegistry.hxx"
#include "bridge/MqttPublisher.hxx"
#include "bridge/TopicLayout.hxx"

namespace zenseMQTT
{
    class StatePublisher {
    public:
        StatePublisher(MqttPublisher& mqtt, TopicLayout topics, EntityRegistry& registry);

        /**
         * @brief Publishes one retained Home Assistant light config per entity.
         */
        void publishDiscovery(const std::vector<ZenseEntity>& entities);
        void publishDiscovery();

        /**
         * @brief Publishes ON/OFF and brightness for a level a command just set.
         *
         * The same level is not published twice in a row for an entity until
         * resetCache() is called. Every call advances the entity's revision.
         * @return true if the state was sent, false if unchanged or not sent
         */
        bool publishState(const ZenseDeviceId& id, uint8_t level);

        // Taken before a level is read from the gateway
        [[nodiscard]] uint32_t stateRevision(const ZenseDeviceId& id) const;

        /**
         * @brief Publishes a level read from the gateway.
         *
         * Dropped when a command state was published for the entity after
         * @p revision was taken: the read may predate that command.
         */
        bool publishPolledState(const ZenseDeviceId& id, uint8_t level, uint32_t revision);

        void publishAvailability(bool online);

        // Forget what was published, e.g. after the broker session was re-established
        void resetCache();

    private:
        [[nodiscard]] std::string discoveryPayload(const ZenseEntity& entity) const;
        bool publishLocked(const ZenseDeviceId& id, uint8_t level);

        MqttPublisher& m_mqtt;
        const TopicLayout m_topics;
        EntityRegistry& m_registry;

        // held across check, publish and record so concurrent callers cannot reorder
        mutable std::mutex m_mutex;
        std::map<ZenseDeviceId, uint8_t> m_last_published;
        std::map<ZenseDeviceId, uint32_t> m_revisions;
    };
} // zenseMQTT

#endif //ZENSEMQTT_STATEPUBLISHER_HXX
