// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef ZENSEMQTT_WIFI_HXX
#define ZENSEMQTT_WIFI_HXX

#include "esp_wifi.h"

namespace zenseMQTT
{
    class Wifi {
    public:
        enum class Status {
            DISCONNECTED,
            CONNECTING,
            CONNECTED
        };

        Wifi(const Wifi&) = delete;
        Wifi& operator=(const Wifi&) = delete;

        static Wifi& getInstance();

        // Инициализация сетевого стека
        esp_err_t init();

        // Подключение к точке доступа, повторяется автоматически после обрыва
        esp_err_t connectToAP(const std::string& ssid, const std::string& password);

        void disconnect();

        [[nodiscard]] Status getStatus() const { return status; }
        [[nodiscard]] std::string getIpAddress() const;

        // Callbacks
        std::function<void(void)> onConnected;
        std::function<void(void)> onDisconnected;

    private:
        Wifi() = default;

        static void wifiEventHandler(void* arg, esp_event_base_t event_base, int32_t event_id, void* event_data);
        static void reconnectTimerCallback(void* arg);

        std::atomic<Status> status{Status::DISCONNECTED};
        std::atomic<bool> stopping{false};
        uint32_t retry_count{0};
        esp_timer_handle_t reconnect_timer{nullptr};
        bool initialized{false};
    };
} // zenseMQTT

#endif //ZENSEMQTT_WIFI_HXX
