// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef ZENSEMQTT_TOPICLAYOUT_HXX
#define ZENSEMQTT_TOPICLAYOUT_HXX

#include "bridge/BridgeCommand.hxx"

namespace zenseMQTT
{
    /**
     * @brief Topic names of one bridge instance, all derived from the device id.
     *
     *   {base}/{uid}/set                      ON / OFF
     *   {base}/{uid}/brightness/set           0..255
     *   {base}/{uid}/state                    ON / OFF (retained)
     *   {base}/{uid}/brightness/state         0..100 (retained)
     *   {discovery}/light/{uid}/config        discovery JSON (retained)
     *
     * where uid = {uid_prefix}{device id}.
     */
    struct TopicLayout {
        enum class CommandTopic {
            SWITCH,
            BRIGHTNESS
        };

        std::string base;
        std::string discovery_prefix;
        std::string uid_prefix;

        [[nodiscard]] std::string uid(const ZenseDeviceId& id) const;
        [[nodiscard]] std::string commandTopic(const ZenseDeviceId& id) const;
        [[nodiscard]] std::string brightnessCommandTopic(const ZenseDeviceId& id) const;
        [[nodiscard]] std::string stateTopic(const ZenseDeviceId& id) const;
        [[nodiscard]] std::string brightnessStateTopic(const ZenseDeviceId& id) const;
        [[nodiscard]] std::string discoveryTopic(const ZenseDeviceId& id) const;

        [[nodiscard]] std::string availabilityTopic() const;
        [[nodiscard]] std::string homeAssistantStatusTopic() const;
        [[nodiscard]] std::string commandSubscription() const;
        [[nodiscard]] std::string brightnessSubscription() const;

        /**
         * @brief Splits an inbound command topic into device id and topic kind.
         * @return nullopt for topics outside this bridge's namespace or with a
         *         malformed device id
         */
        [[nodiscard]] std::optional<std::pair<ZenseDeviceId, CommandTopic>> parseCommandTopic(std::string_view topic) const;
    };
} // zenseMQTT

#endif //ZENSEMQTT_TOPICLAYOUT_HXX
