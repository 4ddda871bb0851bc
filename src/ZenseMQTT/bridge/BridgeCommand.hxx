// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef ZENSEMQTT_BRIDGECOMMAND_HXX
#define ZENSEMQTT_BRIDGECOMMAND_HXX

#include "zense/ZenseTypes.hxx"

namespace zenseMQTT
{
    enum class CommandKind {
        ON_OFF,
        BRIGHTNESS
    };

    struct BridgeCommand {
        ZenseDeviceId device_id;
        CommandKind kind{CommandKind::ON_OFF};
        // ON_OFF: 0 = off, 1 = on. BRIGHTNESS: level 0..100
        uint8_t value{0};

        static BridgeCommand on(ZenseDeviceId id) { return {std::move(id), CommandKind::ON_OFF, 1}; }
        static BridgeCommand off(ZenseDeviceId id) { return {std::move(id), CommandKind::ON_OFF, 0}; }
        static BridgeCommand brightness(ZenseDeviceId id, const uint8_t level) {
            return {std::move(id), CommandKind::BRIGHTNESS, std::min(level, ZENSE_LEVEL_MAX)};
        }

        bool operator==(const BridgeCommand&) const = default;
    };
} // zenseMQTT

#endif //ZENSEMQTT_BRIDGECOMMAND_HXX
