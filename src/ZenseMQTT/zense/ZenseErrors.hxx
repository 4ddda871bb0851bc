// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef ZENSEMQTT_ZENSEERRORS_HXX
#define ZENSEMQTT_ZENSEERRORS_HXX

namespace zenseMQTT
{
    // Error range of the gateway link, outside of the ranges used by IDF components
    constexpr esp_err_t ZENSE_ERR_BASE          = 0x7A000;
    // Network-level failure while opening the session (retry with backoff)
    constexpr esp_err_t ZENSE_ERR_CONNECT       = ZENSE_ERR_BASE + 1;
    // Login code rejected by the gateway (retry with cooldown, lockout risk)
    constexpr esp_err_t ZENSE_ERR_AUTH          = ZENSE_ERR_BASE + 2;
    // I/O failure or peer close on an established session
    constexpr esp_err_t ZENSE_ERR_LINK          = ZENSE_ERR_BASE + 3;
    // Malformed or unexpected response frame
    constexpr esp_err_t ZENSE_ERR_PROTOCOL      = ZENSE_ERR_BASE + 4;
    // No authenticated session, command rejected without touching the wire
    constexpr esp_err_t ZENSE_ERR_NOT_CONNECTED = ZENSE_ERR_BASE + 5;
    constexpr esp_err_t ZENSE_ERR_SHUTDOWN      = ZENSE_ERR_BASE + 6;

    inline const char* zenseErrToName(const esp_err_t err) {
        switch (err) {
            case ZENSE_ERR_CONNECT:       return "ZENSE_ERR_CONNECT";
            case ZENSE_ERR_AUTH:          return "ZENSE_ERR_AUTH";
            case ZENSE_ERR_LINK:          return "ZENSE_ERR_LINK";
            case ZENSE_ERR_PROTOCOL:      return "ZENSE_ERR_PROTOCOL";
            case ZENSE_ERR_NOT_CONNECTED: return "ZENSE_ERR_NOT_CONNECTED";
            case ZENSE_ERR_SHUTDOWN:      return "ZENSE_ERR_SHUTDOWN";
            default:                      return esp_err_to_name(err);
        }
    }
} // zenseMQTT

#endif //ZENSEMQTT_ZENSEERRORS_HXX
