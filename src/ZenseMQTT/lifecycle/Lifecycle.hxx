// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef ZENSEMQTT_LIFECYCLE_HXX
#define ZENSEMQTT_LIFECYCLE_HXX

#include "config/ConfigManager.hxx"

namespace zenseMQTT
{
    class Lifecycle {
        public:
            Lifecycle(const Lifecycle&) = delete;
            Lifecycle& operator=(const Lifecycle&) = delete;
            Lifecycle() = delete;

            // Запуск моста: сеть (ESP32), syslog, MQTT, шлюз
            static esp_err_t startNormalMode(const AppConfig& config);

            // Блокирует до SIGINT/SIGTERM (linux), затем останавливает мост
            static void runUntilShutdown();

            static void shutdown();

        private:
            static esp_err_t startBridge(const AppConfig& config);
            static void startSyslog(const AppConfig& config);
            static void installSignalHandlers();
    };
} // zenseMQTT

#endif //ZENSEMQTT_LIFECYCLE_HXX
