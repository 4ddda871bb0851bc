// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef ZENSEMQTT_SYSLOGCONFIG_HXX
#define ZENSEMQTT_SYSLOGCONFIG_HXX

#include <freertos/message_buffer.h>

namespace zenseMQTT {
    /**
     * @brief Mirrors every esp_log line to a remote syslog server over UDP.
     *
     * Lines are copied into a message buffer from the logging context and
     * sent by a background task, so a slow or unreachable server never
     * blocks the caller.
     */
    class SyslogConfig {
        public:
            SyslogConfig(const SyslogConfig&) = delete;
            SyslogConfig& operator=(const SyslogConfig&) = delete;

            static SyslogConfig& getInstance() {
                static SyslogConfig instance;
                return instance;
            }

            // server_addr: "host" or "host:port", default port 514
            esp_err_t init(const std::string& server_addr);
            esp_err_t setServer(const std::string& server_addr);

        private:
            SyslogConfig() = default;
            static int syslogVprintf(const char *format, va_list args);
            static void syslogTaskEntry(void* arg);
            [[noreturn]] void syslogTaskRunner();
            void sendLogUdp(const char* message, size_t len);

            std::string m_server_addr;
            int m_sock {-1};
            vprintf_like_t m_original_logger {nullptr};
            std::recursive_mutex m_sock_mutex;
            bool m_initialized {false};
            MessageBufferHandle_t m_log_buffer {nullptr};
            TaskHandle_t m_task_handle {nullptr};
    };
} // zenseMQTT

#endif //ZENSEMQTT_SYSLOGCONFIG_HXX
