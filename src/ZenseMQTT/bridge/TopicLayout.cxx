// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "bridge/TopicLayout.hxx"
#include "config/ConfigDefaults.hxx"
#include "zense/ZenseProtocol.hxx"

namespace zenseMQTT
{
    static constexpr std::string_view SWITCH_SUFFIX = "/set";
    static constexpr std::string_view BRIGHTNESS_SUFFIX = "/brightness/set";

    std::string TopicLayout::uid(const ZenseDeviceId& id) const {
        return std::format("{}{}", uid_prefix, id);
    }

    std::string TopicLayout::commandTopic(const ZenseDeviceId& id) const {
        return std::format("{}/{}/set", base, uid(id));
    }

    std::string TopicLayout::brightnessCommandTopic(const ZenseDeviceId& id) const {
        return std::format("{}/{}/brightness/set", base, uid(id));
    }

    std::string TopicLayout::stateTopic(const ZenseDeviceId& id) const {
        return std::format("{}/{}/state", base, uid(id));
    }

    std::string TopicLayout::brightnessStateTopic(const ZenseDeviceId& id) const {
        return std::format("{}/{}/brightness/state", base, uid(id));
    }

    std::string TopicLayout::discoveryTopic(const ZenseDeviceId& id) const {
        return std::format("{}/light/{}/config", discovery_prefix, uid(id));
    }

    std::string TopicLayout::availabilityTopic() const {
        return std::format("{}{}", base, defaults::AVAILABILITY_SUBTOPIC);
    }

    std::string TopicLayout::homeAssistantStatusTopic() const {
        return std::format("{}/status", discovery_prefix);
    }

    std::string TopicLayout::commandSubscription() const {
        return std::format("{}/+/set", base);
    }

    std::string TopicLayout::brightnessSubscription() const {
        return std::format("{}/+/brightness/set", base);
    }

    std::optional<std::pair<ZenseDeviceId, TopicLayout::CommandTopic>> TopicLayout::parseCommandTopic(std::string_view topic) const {
        if (!topic.starts_with(base) || topic.size() <= base.size() || topic[base.size()] != '/') {
            return std::nullopt;
        }
        topic.remove_prefix(base.size() + 1);

        CommandTopic kind;
        if (topic.ends_with(BRIGHTNESS_SUFFIX)) {
            kind = CommandTopic::BRIGHTNESS;
            topic.remove_suffix(BRIGHTNESS_SUFFIX.size());
        } else if (topic.ends_with(SWITCH_SUFFIX)) {
            kind = CommandTopic::SWITCH;
            topic.remove_suffix(SWITCH_SUFFIX.size());
        } else {
            return std::nullopt;
        }

        // what remains must be exactly one level: the uid
        if (!topic.starts_with(uid_prefix)) return std::nullopt;
        const std::string_view id = topic.substr(uid_prefix.size());
        if (!ZenseProtocol::isValidDeviceId(id)) return std::nullopt;

        return std::make_pair(ZenseDeviceId(id), kind);
    }
} // zenseMQTT
