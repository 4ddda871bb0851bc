// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef ZENSEMQTT_ZENSELINK_HXX
#define ZENSEMQTT_ZENSELINK_HXX

#include "zense/ZenseTransport.hxx"
#include "zense/ZenseTypes.hxx"

namespace zenseMQTT
{
    struct ZenseLinkConfig {
        std::string host;
        uint16_t port{10001};
        std::string login_code;

        uint32_t cmd_gap_ms{100};
        uint32_t socket_timeout_ms{12000};

        uint32_t reconnect_min_ms{1000};
        uint32_t reconnect_max_ms{60000};
        uint32_t auth_cooldown_ms{60000};
        // consecutive malformed responses before the session is considered broken
        uint8_t max_protocol_errors{3};

        bool debug{false};
    };

    /**
     * @brief Owns the single TCP session to the gateway box.
     *
     * All traffic (commands from MQTT and polling) goes through one mutex, so
     * requests never interleave on the wire and consecutive sends are at least
     * cmd_gap_ms apart. A supervisor task re-establishes a lost session with
     * exponential backoff (DISCONNECTED -> CONNECTING -> AUTHENTICATED) and
     * backs off much longer after a rejected login (COOLDOWN).
     *
     * Commands issued while no session is up fail with ZENSE_ERR_NOT_CONNECTED,
     * they are never queued and replayed.
     */
    class ZenseLink {
    public:
        ZenseLink(ZenseLinkConfig config, std::unique_ptr<ZenseTransport> transport);
        ~ZenseLink();

        ZenseLink(const ZenseLink&) = delete;
        ZenseLink& operator=(const ZenseLink&) = delete;

        /**
         * @brief Starts the supervisor task that keeps the session up.
         */
        esp_err_t start();

        /**
         * @brief Cancels pending waits, stops the supervisor and closes the session.
         *
         * Returns only after the supervisor task has exited.
         */
        void stop();

        /**
         * @brief Single connect + login attempt, updates the backoff state.
         * @return ESP_OK, ZENSE_ERR_CONNECT, ZENSE_ERR_AUTH or ZENSE_ERR_SHUTDOWN
         */
        esp_err_t connect();

        /**
         * @brief Blocks until a session is authenticated, shutdown or timeout.
         */
        bool waitForSession(uint32_t timeout_ms) const;

        /**
         * @brief Sends one framed command and reads one framed response.
         * @param cmd full frame, e.g. ">>Set 12 100<<"
         * @param response raw response including the frame markers
         */
        esp_err_t sendCommand(const std::string& cmd, std::string& response);

        esp_err_t setLevel(const ZenseDeviceId& device_id, uint8_t level);
        esp_err_t fade(const ZenseDeviceId& device_id, uint8_t level);
        esp_err_t getLevel(const ZenseDeviceId& device_id, uint8_t& out_level);
        esp_err_t getDevices(std::vector<ZenseDeviceId>& out_ids);
        esp_err_t getName(const ZenseDeviceId& device_id, std::optional<std::string>& out_name);

        [[nodiscard]] LinkState getState() const { return m_state.load(); }
        [[nodiscard]] bool isShuttingDown() const;

        // reconnect_min_ms doubled per consecutive failure, capped at reconnect_max_ms
        static uint32_t backoffDelayMs(const ZenseLinkConfig& config, uint32_t failures);
        // auth_cooldown_ms doubled per rejected login, up to 16x
        static uint32_t cooldownDelayMs(const ZenseLinkConfig& config, uint32_t auth_failures);

        // Invoked with the link mutex held: must not call back into ZenseLink
        std::function<void(LinkState)> onStateChanged;

    private:
        using ResponseValidator = std::function<bool(std::string_view)>;

        esp_err_t exchange(const std::string& cmd, std::string& response, const ResponseValidator& validator);
        esp_err_t writeAndRead(const std::string& cmd, std::string& response);
        esp_err_t ensureSessionLocked();
        esp_err_t attemptConnectLocked();
        esp_err_t openAndLoginLocked();
        void teardownLocked(const char* reason);
        esp_err_t waitCommandGapLocked();
        void setState(LinkState state);

        bool sleepInterruptible(uint32_t ms) const;
        static int64_t nowUs() { return esp_timer_get_time(); }

        static void supervisorTask(void* arg);
        void supervise();

        const ZenseLinkConfig m_config;
        std::unique_ptr<ZenseTransport> m_transport;

        mutable std::mutex m_mutex;
        std::atomic<LinkState> m_state{LinkState::DISCONNECTED};
        int64_t m_last_send_us{0};
        int64_t m_next_attempt_us{0};
        uint32_t m_connect_failures{0};
        uint32_t m_auth_failures{0};
        uint8_t m_protocol_errors{0};

        EventGroupHandle_t m_events{nullptr};
        TaskHandle_t m_task{nullptr};
    };
} // zenseMQTT

#endif //ZENSEMQTT_ZENSELINK_HXX
