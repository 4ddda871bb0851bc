// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef ZENSEMQTT_COMMANDTRANSLATOR_HXX
#define ZENSEMQTT_COMMANDTRANSLATOR_HXX

#include "bridge/BridgeCommand.hxx"

namespace zenseMQTT
{
    class ZenseLink;
    class StatePublisher;

    /**
     * @brief Turns bus commands into gateway commands.
     *
     *   off            -> Set {id} 0, forgets a pending brightness
     *   brightness L   -> Fade {id} L, remembers L for the on-window
     *   on             -> Set {id} 100, unless a brightness was sent for the
     *                     same entity within the on-window
     *
     * Home Assistant sends "brightness" and "ON" as two messages; without the
     * window the ON would override the requested level with full brightness.
     */
    class CommandTranslator {
    public:
        // Monotonic time in microseconds
        using Clock = std::function<int64_t()>;

        CommandTranslator(ZenseLink& link, StatePublisher& publisher, uint32_t on_window_ms, Clock clock = esp_timer_get_time);

        /**
         * @return ESP_OK when the command was applied or suppressed, otherwise
         *         the DeviceLink error (no state is published in that case)
         */
        esp_err_t handle(const ZenseDeviceId& device_id, CommandKind kind, uint8_t value);
        esp_err_t handle(const BridgeCommand& command);

        [[nodiscard]] bool hasPendingBrightness(const ZenseDeviceId& device_id) const;

    private:
        struct PendingBrightness {
            uint8_t level;
            int64_t timestamp_us;
        };

        esp_err_t handleOnOff(const ZenseDeviceId& device_id, bool on);
        esp_err_t handleBrightness(const ZenseDeviceId& device_id, uint8_t level);
        esp_err_t apply(const ZenseDeviceId& device_id, uint8_t level, bool fade);

        ZenseLink& m_link;
        StatePublisher& m_publisher;
        const int64_t m_on_window_us;
        const Clock m_clock;

        mutable std::mutex m_pending_mutex;
        std::map<ZenseDeviceId, PendingBrightness> m_pending;
    };
} // zenseMQTT

#endif //ZENSEMQTT_COMMANDTRANSLATOR_HXX
