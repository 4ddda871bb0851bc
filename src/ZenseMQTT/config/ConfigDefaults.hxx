// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef ZENSEMQTT_CONFIGDEFAULTS_HXX
#define ZENSEMQTT_CONFIGDEFAULTS_HXX

namespace zenseMQTT::defaults
{
    constexpr char NVS_NAMESPACE[] = "zense2mqtt";
    // Home Assistant add-on options, written by the supervisor
    constexpr char OPTIONS_FILE[] = "/data/options.json";

    // Gateway
    constexpr char ZENSE_HOST[] = "192.168.1.235";
    constexpr uint16_t ZENSE_PORT = 10001;
    constexpr char ZENSE_CODE[] = "16713";

    // MQTT
    constexpr char MQTT_HOST[] = "127.0.0.1";
    constexpr uint16_t MQTT_PORT = 1883;
    constexpr char MQTT_BASE_TOPIC[] = "homeassistant/zense_bridge";
    constexpr char DISCOVERY_PREFIX[] = "homeassistant";
    constexpr char UID_PREFIX[] = "zensebridge_";
    constexpr char AVAILABILITY_SUBTOPIC[] = "/availability";
    constexpr char PAYLOAD_ONLINE[] = "online";
    constexpr char PAYLOAD_OFFLINE[] = "offline";

    // Timing
    constexpr int32_t STATE_POLL_SEC = 600;
    constexpr int32_t STATE_POLL_MIN_SEC = 60;
    constexpr uint32_t DEBOUNCE_MS = 120;
    constexpr uint32_t CMD_GAP_MS = 100;
    constexpr uint32_t LEVEL_ON_WINDOW_MS = 1000;
    constexpr uint32_t SOCKET_TIMEOUT_MS = 12000;

    // Reconnect. The vendor lockout threshold is undocumented, so a rejected
    // login waits a full minute and doubles up to 16 minutes.
    constexpr uint32_t RECONNECT_MIN_MS = 1000;
    constexpr uint32_t RECONNECT_MAX_MS = 60000;
    constexpr uint32_t AUTH_COOLDOWN_MS = 60000;
}

#endif //ZENSEMQTT_CONFIGDEFAULTS_HXX
