// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef ZENSEMQTT_ZENSETYPES_HXX
#define ZENSEMQTT_ZENSETYPES_HXX

namespace zenseMQTT
{
    // Device id as used by the gateway protocol ("12", "A3", ...)
    using ZenseDeviceId = std::string;

    constexpr uint8_t ZENSE_LEVEL_MAX = 100;

    struct ZenseEntity {
        ZenseDeviceId id;
        std::string name;
        // Last level confirmed by the gateway, unknown until the first response
        std::optional<uint8_t> level;

        [[nodiscard]] std::optional<bool> isOn() const {
            if (!level.has_value()) return std::nullopt;
            return *level > 0;
        }
    };

    enum class LinkState {
        DISCONNECTED,
        CONNECTING,
        AUTHENTICATED,
        COOLDOWN
    };

    inline const char* linkStateToString(const LinkState state) {
        switch (state) {
            case LinkState::DISCONNECTED:  return "DISCONNECTED";
            case LinkState::CONNECTING:    return "CONNECTING";
            case LinkState::AUTHENTICATED: return "AUTHENTICATED";
            case LinkState::COOLDOWN:      return "COOLDOWN";
        }
        return "UNKNOWN";
    }
} // zenseMQTT

#endif //ZENSEMQTT_ZENSETYPES_HXX
