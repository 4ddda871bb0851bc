// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "bridge/CommandTranslator.hxx"
#include "bridge/StatePublisher.hxx"
#include "zense/ZenseErrors.hxx"
#include "zense/ZenseLink.hxx"

namespace zenseMQTT
{
    static constexpr char TAG[] = "CommandTranslator";

    CommandTranslator::CommandTranslator(ZenseLink& link, StatePublisher& publisher, const uint32_t on_window_ms, Clock clock)
        : m_link(link),
          m_publisher(publisher),
          m_on_window_us(static_cast<int64_t>(on_window_ms) * 1000),
          m_clock(std::move(clock)) {}

    esp_err_t CommandTranslator::handle(const BridgeCommand& command) {
        return handle(command.device_id, command.kind, command.value);
    }

    esp_err_t CommandTranslator::handle(const ZenseDeviceId& device_id, const CommandKind kind, const uint8_t value) {
        switch (kind) {
            case CommandKind::ON_OFF:
                return handleOnOff(device_id, value != 0);
            case CommandKind::BRIGHTNESS:
                return handleBrightness(device_id, value);
        }
        return ESP_ERR_INVALID_ARG;
    }

    bool CommandTranslator::hasPendingBrightness(const ZenseDeviceId& device_id) const {
        std::lock_guard lock(m_pending_mutex);
        const auto it = m_pending.find(device_id);
        return it != m_pending.end() && (m_clock() - it->second.timestamp_us) <= m_on_window_us;
    }

    esp_err_t CommandTranslator::handleOnOff(const ZenseDeviceId& device_id, const bool on) {
        if (!on) {
            {
                std::lock_guard lock(m_pending_mutex);
                m_pending.erase(device_id);
            }
            return apply(device_id, 0, false);
        }

        {
            std::lock_guard lock(m_pending_mutex);
            if (const auto it = m_pending.find(device_id); it != m_pending.end()) {
                const int64_t age_us = m_clock() - it->second.timestamp_us;
                if (age_us <= m_on_window_us) {
                    ESP_LOGD(TAG, "ON for %s suppressed, brightness %u sent %lld ms ago",
                             device_id.c_str(), it->second.level, static_cast<long long>(age_us / 1000));
                    return ESP_OK;
                }
                // stale record, nothing to keep it for
                m_pending.erase(it);
            }
        }
        return apply(device_id, ZENSE_LEVEL_MAX, false);
    }

    esp_err_t CommandTranslator::handleBrightness(const ZenseDeviceId& device_id, uint8_t level) {
        level = std::min(level, ZENSE_LEVEL_MAX);
        {
            std::lock_guard lock(m_pending_mutex);
            m_pending[device_id] = PendingBrightness{level, m_clock()};
        }
        return apply(device_id, level, true);
    }

    esp_err_t CommandTranslator::apply(const ZenseDeviceId& device_id, const uint8_t level, const bool fade) {
        const esp_err_t err = fade ? m_link.fade(device_id, level) : m_link.setLevel(device_id, level);
        if (err != ESP_OK) {
            ESP_LOGW(TAG, "%s %s %u failed: %s", fade ? "Fade" : "Set", device_id.c_str(), level, zenseErrToName(err));
            return err;
        }
        m_publisher.publishState(device_id, level);
        return ESP_OK;
    }
} // zenseMQTT
