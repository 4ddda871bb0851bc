// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "zense/ZenseLink.hxx"
#include "zense/ZenseErrors.hxx"
#include "zense/ZenseProtocol.hxx"

namespace zenseMQTT
{
    static constexpr char TAG[] = "ZenseLink";

    static constexpr EventBits_t SHUTDOWN_BIT     = BIT0;
    static constexpr EventBits_t SESSION_UP_BIT   = BIT1;
    static constexpr EventBits_t SESSION_LOST_BIT = BIT2;
    static constexpr EventBits_t TASK_EXITED_BIT  = BIT3;

    static constexpr uint32_t AUTH_COOLDOWN_MAX_FACTOR = 16;
    static constexpr uint32_t STOP_WARN_MS = 5000;

    static TickType_t msToTicksCeil(const uint32_t ms) {
        const uint64_t ticks = (static_cast<uint64_t>(ms) * configTICK_RATE_HZ + 999) / 1000;
        return static_cast<TickType_t>(std::max<uint64_t>(1, ticks));
    }

    ZenseLink::ZenseLink(ZenseLinkConfig config, std::unique_ptr<ZenseTransport> transport)
        : m_config(std::move(config)), m_transport(std::move(transport)) {
        m_events = xEventGroupCreate();
        if (!m_events) {
            ESP_LOGE(TAG, "Failed to create event group");
        }
    }

    ZenseLink::~ZenseLink() {
        stop();
        if (m_events) {
            vEventGroupDelete(m_events);
            m_events = nullptr;
        }
    }

    esp_err_t ZenseLink::start() {
        if (!m_events) return ESP_ERR_NO_MEM;
        if (m_task) {
            ESP_LOGW(TAG, "Supervisor task is already running.");
            return ESP_OK;
        }
        xEventGroupClearBits(m_events, SHUTDOWN_BIT | TASK_EXITED_BIT);
        if (xTaskCreate(supervisorTask, "zense_link", 6144, this, 5, &m_task) != pdPASS) {
            ESP_LOGE(TAG, "Failed to create supervisor task");
            m_task = nullptr;
            return ESP_ERR_NO_MEM;
        }
        ESP_LOGI(TAG, "Gateway link supervisor started for %s:%u", m_config.host.c_str(), m_config.port);
        return ESP_OK;
    }

    void ZenseLink::stop() {
        if (!m_events) return;
        xEventGroupSetBits(m_events, SHUTDOWN_BIT);

        if (m_task) {
            // The supervisor may sit in connect() or the login read, both bounded
            // by socket_timeout_ms. It touches this object until it has exited.
            const EventBits_t bits = xEventGroupWaitBits(m_events, TASK_EXITED_BIT, pdFALSE, pdFALSE, pdMS_TO_TICKS(STOP_WARN_MS));
            if (!(bits & TASK_EXITED_BIT)) {
                ESP_LOGW(TAG, "Supervisor task still busy with the gateway, waiting for it to exit");
                xEventGroupWaitBits(m_events, TASK_EXITED_BIT, pdFALSE, pdFALSE, portMAX_DELAY);
            }
            m_task = nullptr;
        }

        std::lock_guard lock(m_mutex);
        if (m_transport && m_transport->isOpen()) {
            m_transport->close();
            ESP_LOGI(TAG, "Gateway session closed.");
        }
        xEventGroupClearBits(m_events, SESSION_UP_BIT);
        setState(LinkState::DISCONNECTED);
    }

    bool ZenseLink::isShuttingDown() const {
        return m_events && (xEventGroupGetBits(m_events) & SHUTDOWN_BIT);
    }

    esp_err_t ZenseLink::connect() {
        std::lock_guard lock(m_mutex);
        return attemptConnectLocked();
    }

    bool ZenseLink::waitForSession(const uint32_t timeout_ms) const {
        if (!m_events) return false;
        xEventGroupWaitBits(m_events, SESSION_UP_BIT | SHUTDOWN_BIT, pdFALSE, pdFALSE, pdMS_TO_TICKS(timeout_ms));
        return m_state.load() == LinkState::AUTHENTICATED;
    }

    esp_err_t ZenseLink::sendCommand(const std::string& cmd, std::string& response) {
        return exchange(cmd, response, [](const std::string_view resp) { return ZenseProtocol::isAck(resp); });
    }

    esp_err_t ZenseLink::setLevel(const ZenseDeviceId& device_id, const uint8_t level) {
        std::string response;
        return sendCommand(ZenseProtocol::set(device_id, level), response);
    }

    esp_err_t ZenseLink::fade(const ZenseDeviceId& device_id, const uint8_t level) {
        std::string response;
        return sendCommand(ZenseProtocol::fade(device_id, level), response);
    }

    esp_err_t ZenseLink::getLevel(const ZenseDeviceId& device_id, uint8_t& out_level) {
        std::string response;
        const esp_err_t err = exchange(ZenseProtocol::get(device_id), response,
            [](const std::string_view resp) { return ZenseProtocol::parseLevel(resp).has_value(); });
        if (err != ESP_OK) return err;
        out_level = ZenseProtocol::parseLevel(response).value_or(0);
        return ESP_OK;
    }

    esp_err_t ZenseLink::getDevices(std::vector<ZenseDeviceId>& out_ids) {
        std::string response;
        const esp_err_t err = exchange(ZenseProtocol::getDevices(), response,
            [](const std::string_view resp) { return ZenseProtocol::parseDeviceList(resp).has_value(); });
        if (err != ESP_OK) return err;
        out_ids = ZenseProtocol::parseDeviceList(response).value_or(std::vector<ZenseDeviceId>{});
        return ESP_OK;
    }

    esp_err_t ZenseLink::getName(const ZenseDeviceId& device_id, std::optional<std::string>& out_name) {
        std::string response;
        const esp_err_t err = exchange(ZenseProtocol::getName(device_id), response,
            [](const std::string_view resp) { return ZenseProtocol::isAck(resp); });
        if (err != ESP_OK) return err;
        out_name = ZenseProtocol::parseName(response);
        return ESP_OK;
    }

    esp_err_t ZenseLink::exchange(const std::string& cmd, std::string& response, const ResponseValidator& validator) {
        std::lock_guard lock(m_mutex);

        if (isShuttingDown()) return ZENSE_ERR_SHUTDOWN;

        if (const esp_err_t err = ensureSessionLocked(); err != ESP_OK) {
            return err;
        }

        if (const esp_err_t err = waitCommandGapLocked(); err != ESP_OK) {
            return err;
        }

        if (m_config.debug) {
            ESP_LOGI(TAG, "TX %s", cmd.c_str());
        }

        if (const esp_err_t err = writeAndRead(cmd, response); err != ESP_OK) {
            teardownLocked(err == ESP_ERR_TIMEOUT ? "response timeout" : "I/O error");
            return ZENSE_ERR_LINK;
        }

        if (m_config.debug) {
            ESP_LOGI(TAG, "RX %s", response.c_str());
        }

        if (!validator(response)) {
            ++m_protocol_errors;
            ESP_LOGW(TAG, "Unexpected response to '%s': '%s' (%u in a row)", cmd.c_str(), response.c_str(), m_protocol_errors);
            if (m_protocol_errors >= m_config.max_protocol_errors) {
                teardownLocked("repeated protocol errors");
                return ZENSE_ERR_LINK;
            }
            return ZENSE_ERR_PROTOCOL;
        }

        m_protocol_errors = 0;
        return ESP_OK;
    }

    esp_err_t ZenseLink::writeAndRead(const std::string& cmd, std::string& response) {
        m_last_send_us = nowUs();
        if (const esp_err_t err = m_transport->write(cmd); err != ESP_OK) {
            return err;
        }
        return m_transport->readUntil(ZenseProtocol::FRAME_END, response, m_config.socket_timeout_ms);
    }

    esp_err_t ZenseLink::ensureSessionLocked() {
        if (m_state.load() != LinkState::AUTHENTICATED) {
            return ZENSE_ERR_NOT_CONNECTED;
        }

        // Anything already received now belongs to no request, reading it as
        // the next response would shift every reply by one.
        size_t discarded = 0;
        const esp_err_t drain_err = m_transport->discardInput(discarded);
        if (discarded > 0) {
            ESP_LOGW(TAG, "Discarded %zu unsolicited bytes from the gateway", discarded);
        }
        if (drain_err == ESP_OK && !m_transport->peerClosed()) {
            return ESP_OK;
        }

        // The gateway drops idle sessions. Nothing was written yet, so one
        // immediate reconnect cannot duplicate the pending command.
        ESP_LOGI(TAG, "Gateway closed the idle session, reconnecting.");
        teardownLocked("peer closed idle session");
        if (const esp_err_t err = attemptConnectLocked(); err != ESP_OK) {
            return err == ZENSE_ERR_SHUTDOWN ? err : ZENSE_ERR_NOT_CONNECTED;
        }
        return ESP_OK;
    }

    esp_err_t ZenseLink::attemptConnectLocked() {
        if (isShuttingDown()) return ZENSE_ERR_SHUTDOWN;

        setState(LinkState::CONNECTING);
        const esp_err_t err = openAndLoginLocked();

        switch (err) {
            case ESP_OK:
                m_connect_failures = 0;
                m_auth_failures = 0;
                m_protocol_errors = 0;
                setState(LinkState::AUTHENTICATED);
                xEventGroupClearBits(m_events, SESSION_LOST_BIT);
                xEventGroupSetBits(m_events, SESSION_UP_BIT);
                ESP_LOGI(TAG, "Logged in to gateway %s:%u", m_config.host.c_str(), m_config.port);
                break;
            case ZENSE_ERR_AUTH: {
                ++m_auth_failures;
                const uint32_t delay_ms = cooldownDelayMs(m_config, m_auth_failures);
                m_next_attempt_us = nowUs() + static_cast<int64_t>(delay_ms) * 1000;
                setState(LinkState::COOLDOWN);
                ESP_LOGE(TAG, "Gateway rejected the login code (%lu consecutive). Check zense_code; next attempt in %lu s to avoid lockout.",
                         static_cast<unsigned long>(m_auth_failures), static_cast<unsigned long>(delay_ms / 1000));
                break;
            }
            case ZENSE_ERR_SHUTDOWN:
                setState(LinkState::DISCONNECTED);
                break;
            default: {
                ++m_connect_failures;
                const uint32_t delay_ms = backoffDelayMs(m_config, m_connect_failures);
                m_next_attempt_us = nowUs() + static_cast<int64_t>(delay_ms) * 1000;
                setState(LinkState::DISCONNECTED);
                ESP_LOGW(TAG, "Connecting to gateway failed (%s, attempt %lu), retry in %lu ms",
                         zenseErrToName(err), static_cast<unsigned long>(m_connect_failures), static_cast<unsigned long>(delay_ms));
                break;
            }
        }
        return err;
    }

    esp_err_t ZenseLink::openAndLoginLocked() {
        m_transport->close();

        if (const esp_err_t err = m_transport->open(m_config.host, m_config.port, m_config.socket_timeout_ms); err != ESP_OK) {
            return ZENSE_ERR_CONNECT;
        }
        if (isShuttingDown()) {
            m_transport->close();
            return ZENSE_ERR_SHUTDOWN;
        }

        if (const esp_err_t err = waitCommandGapLocked(); err != ESP_OK) {
            m_transport->close();
            return err;
        }

        std::string response;
        if (const esp_err_t err = writeAndRead(ZenseProtocol::login(m_config.login_code), response); err != ESP_OK) {
            ESP_LOGW(TAG, "Login handshake failed: %s", zenseErrToName(err));
            m_transport->close();
            return ZENSE_ERR_CONNECT;
        }

        if (!ZenseProtocol::isLoginOk(response)) {
            ESP_LOGE(TAG, "Login refused, gateway answered '%s'", response.c_str());
            m_transport->close();
            return ZENSE_ERR_AUTH;
        }
        return ESP_OK;
    }

    void ZenseLink::teardownLocked(const char* reason) {
        const bool was_up = m_state.load() == LinkState::AUTHENTICATED;
        m_transport->close();
        m_protocol_errors = 0;
        m_next_attempt_us = nowUs() + static_cast<int64_t>(backoffDelayMs(m_config, m_connect_failures)) * 1000;
        xEventGroupClearBits(m_events, SESSION_UP_BIT);
        xEventGroupSetBits(m_events, SESSION_LOST_BIT);
        setState(LinkState::DISCONNECTED);
        if (was_up) {
            ESP_LOGW(TAG, "Gateway session lost: %s", reason);
        }
    }

    esp_err_t ZenseLink::waitCommandGapLocked() {
        const int64_t gap_us = static_cast<int64_t>(m_config.cmd_gap_ms) * 1000;
        while (true) {
            const int64_t elapsed_us = nowUs() - m_last_send_us;
            if (m_last_send_us == 0 || elapsed_us >= gap_us) {
                return ESP_OK;
            }
            const auto remaining_ms = static_cast<uint32_t>((gap_us - elapsed_us + 999) / 1000);
            if (!sleepInterruptible(remaining_ms)) {
                return ZENSE_ERR_SHUTDOWN;
            }
        }
    }

    void ZenseLink::setState(const LinkState state) {
        const LinkState previous = m_state.exchange(state);
        if (previous == state) return;
        ESP_LOGD(TAG, "State %s -> %s", linkStateToString(previous), linkStateToString(state));
        if (onStateChanged) onStateChanged(state);
    }

    uint32_t ZenseLink::backoffDelayMs(const ZenseLinkConfig& config, const uint32_t failures) {
        const uint32_t shift = std::min<uint32_t>(failures > 0 ? failures - 1 : 0, 16);
        const uint64_t delay = static_cast<uint64_t>(config.reconnect_min_ms) << shift;
        return static_cast<uint32_t>(std::min<uint64_t>(delay, config.reconnect_max_ms));
    }

    uint32_t ZenseLink::cooldownDelayMs(const ZenseLinkConfig& config, const uint32_t auth_failures) {
        const uint32_t shift = std::min<uint32_t>(auth_failures > 0 ? auth_failures - 1 : 0, 4);
        const uint64_t factor = std::min<uint64_t>(1ULL << shift, AUTH_COOLDOWN_MAX_FACTOR);
        return static_cast<uint32_t>(std::min<uint64_t>(config.auth_cooldown_ms * factor, UINT32_MAX));
    }

    bool ZenseLink::sleepInterruptible(const uint32_t ms) const {
        const EventBits_t bits = xEventGroupWaitBits(m_events, SHUTDOWN_BIT, pdFALSE, pdFALSE, msToTicksCeil(ms));
        return !(bits & SHUTDOWN_BIT);
    }

    void ZenseLink::supervisorTask(void* arg) {
        auto* self = static_cast<ZenseLink*>(arg);
        self->supervise();
        xEventGroupSetBits(self->m_events, TASK_EXITED_BIT);
        vTaskDelete(nullptr);
    }

    void ZenseLink::supervise() {
        ESP_LOGI(TAG, "Link supervisor running.");
        while (!isShuttingDown()) {
            if (m_state.load() == LinkState::AUTHENTICATED) {
                xEventGroupWaitBits(m_events, SESSION_LOST_BIT | SHUTDOWN_BIT, pdFALSE, pdFALSE, portMAX_DELAY);
                continue;
            }

            int64_t wait_us = 0;
            {
                std::lock_guard lock(m_mutex);
                wait_us = m_next_attempt_us - nowUs();
                if (wait_us <= 0 && m_state.load() != LinkState::AUTHENTICATED) {
                    attemptConnectLocked();
                    continue;
                }
            }
            if (wait_us > 0 && !sleepInterruptible(static_cast<uint32_t>(std::min<int64_t>(wait_us / 1000 + 1, UINT32_MAX)))) {
                break;
            }
        }
        ESP_LOGI(TAG, "Link supervisor stopped.");
    }
} // zenseMQTT
