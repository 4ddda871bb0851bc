// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef ZENSEMQTT_TESTS_FAKEGATEWAY_HXX
#define ZENSEMQTT_TESTS_FAKEGATEWAY_HXX

#include "zense/ZenseErrors.hxx"
#include "zense/ZenseLink.hxx"
#include "zense/ZenseProtocol.hxx"
#include "zense/ZenseTransport.hxx"
#include "utils/StringUtils.hxx"

namespace zenseMQTT::testing
{
    /**
     * @brief In-memory gateway box answering the ASCII protocol.
     *
     * Shared between the test and the FakeTransport handed to ZenseLink so
     * the test can script failures and inspect what went over the wire.
     */
    struct FakeGateway {
        std::mutex mutex;

        std::string login_code{"16713"};
        std::map<std::string, uint8_t> levels;
        std::map<std::string, std::string> names;
        std::string device_list;

        // Failure injection
        bool refuse_connect{false};
        uint32_t connect_delay_ms{0};
        bool peer_closed{false};
        bool fail_next_write{false};
        bool garbage_next_response{false};
        // accepts the next write, then drops the connection without answering
        bool close_after_next_write{false};
        // bytes the box sends on its own, delivered ahead of the next response
        std::string unsolicited;
        // called for every write with the gateway mutex held
        std::function<void(const std::string&)> on_write;

        // Observations
        int opens{0};
        std::atomic<int> opens_finished{0};
        std::vector<std::string> writes;
        std::vector<int64_t> write_times_us;
        // writes issued while the previous response was still unread
        int overlapping_writes{0};

        std::string respond(const std::string& cmd) {
            const auto body_opt = ZenseProtocol::extractFrame(cmd);
            if (!body_opt) return ">>Error<<";
            const std::string body(utils::trim(*body_opt));
            const auto parts = utils::split(body, ' ');

            if (garbage_next_response) {
                garbage_next_response = false;
                return ">>What<<";
            }
            if (parts.size() == 2 && parts[0] == "Login") {
                return parts[1] == login_code ? ">>Login Ok<<" : ">>Login Failed<<";
            }
            if (parts.size() == 3 && (parts[0] == "Set" || parts[0] == "Fade")) {
                levels[std::string(parts[1])] = utils::parseInt<uint8_t>(parts[2]).value_or(0);
                return cmd;
            }
            if (body == "Get Devices") {
                return std::format(">>Get Devices {}<<", device_list);
            }
            if (parts.size() == 3 && parts[0] == "Get" && parts[1] == "Name") {
                const auto it = names.find(std::string(parts[2]));
                return it == names.end() ? ">>Get Name Timeout<<" : std::format(">>Get Name '{}'<<", it->second);
            }
            if (parts.size() == 2 && parts[0] == "Get") {
                const auto it = levels.find(std::string(parts[1]));
                return it == levels.end() ? ">>Get Timeout<<" : std::format(">>Get {}<<", it->second);
            }
            return ">>Error<<";
        }

        // Gateway writes excluding the login handshake
        std::vector<std::string> commands() {
            std::lock_guard lock(mutex);
            std::vector<std::string> out;
            for (const auto& w : writes) {
                if (!w.starts_with(">>Login")) out.push_back(w);
            }
            return out;
        }

        size_t count(const std::string& frame) {
            std::lock_guard lock(mutex);
            return static_cast<size_t>(std::ranges::count(writes, frame));
        }

        void clearWrites() {
            std::lock_guard lock(mutex);
            writes.clear();
            write_times_us.clear();
        }
    };

    class FakeTransport final : public ZenseTransport {
    public:
        explicit FakeTransport(std::shared_ptr<FakeGateway> gateway) : m_gateway(std::move(gateway)) {}

        esp_err_t open(const std::string&, uint16_t, uint32_t) override {
            uint32_t delay_ms = 0;
            {
                std::lock_guard lock(m_gateway->mutex);
                ++m_gateway->opens;
                delay_ms = m_gateway->connect_delay_ms;
            }
            // a box that does not answer the SYN
            if (delay_ms > 0) vTaskDelay(pdMS_TO_TICKS(delay_ms));

            std::lock_guard lock(m_gateway->mutex);
            ++m_gateway->opens_finished;
            if (m_gateway->refuse_connect) return ZENSE_ERR_CONNECT;
            m_gateway->peer_closed = false;
            m_open = true;
            return ESP_OK;
        }

        esp_err_t write(const std::string_view data) override {
            std::lock_guard lock(m_gateway->mutex);
            if (!m_open || m_gateway->peer_closed) return ZENSE_ERR_LINK;
            if (m_gateway->fail_next_write) {
                m_gateway->fail_next_write = false;
                return ZENSE_ERR_LINK;
            }
            if (!m_rx.empty()) ++m_gateway->overlapping_writes;
            m_gateway->writes.emplace_back(data);
            m_gateway->write_times_us.push_back(esp_timer_get_time());
            if (m_gateway->on_write) m_gateway->on_write(std::string(data));
            const std::string answer = m_gateway->respond(std::string(data));
            if (m_gateway->close_after_next_write) {
                m_gateway->close_after_next_write = false;
                m_gateway->peer_closed = true;
                return ESP_OK;
            }
            m_rx += answer;
            return ESP_OK;
        }

        esp_err_t readUntil(const std::string_view terminator, std::string& out, uint32_t) override {
            std::lock_guard lock(m_gateway->mutex);
            out.clear();
            if (!m_open) return ZENSE_ERR_LINK;
            takeUnsolicitedLocked();
            const size_t end = m_rx.find(terminator);
            if (end == std::string::npos) {
                // nothing more will arrive: an open session times out, a closed one ends
                return m_gateway->peer_closed ? ZENSE_ERR_LINK : ESP_ERR_TIMEOUT;
            }
            out = m_rx.substr(0, end + terminator.size());
            m_rx.erase(0, end + terminator.size());
            return ESP_OK;
        }

        esp_err_t discardInput(size_t& out_discarded) override {
            std::lock_guard lock(m_gateway->mutex);
            takeUnsolicitedLocked();
            out_discarded = m_rx.size();
            m_rx.clear();
            return m_open && !m_gateway->peer_closed ? ESP_OK : ZENSE_ERR_LINK;
        }

        bool peerClosed() override {
            std::lock_guard lock(m_gateway->mutex);
            return m_gateway->peer_closed;
        }

        void close() override {
            m_open = false;
            m_rx.clear();
        }

        [[nodiscard]] bool isOpen() const override { return m_open; }

    private:
        void takeUnsolicitedLocked() {
            if (!m_open) return;
            m_rx.insert(0, m_gateway->unsolicited);
            m_gateway->unsolicited.clear();
        }

        std::shared_ptr<FakeGateway> m_gateway;
        // bytes "on the wire" towards ZenseLink
        std::string m_rx;
        bool m_open{false};
    };

    inline ZenseLinkConfig testLinkConfig() {
        ZenseLinkConfig cfg;
        cfg.host = "gateway.test";
        cfg.port = 10001;
        cfg.login_code = "16713";
        cfg.cmd_gap_ms = 0;
        cfg.socket_timeout_ms = 1000;
        cfg.reconnect_min_ms = 10;
        cfg.reconnect_max_ms = 100;
        cfg.auth_cooldown_ms = 1000;
        return cfg;
    }

    inline std::unique_ptr<ZenseLink> makeLink(const std::shared_ptr<FakeGateway>& gateway, const ZenseLinkConfig& cfg = testLinkConfig()) {
        return std::make_unique<ZenseLink>(cfg, std::make_unique<FakeTransport>(gateway));
    }
} // zenseMQTT::testing

#endif //ZENSEMQTT_TESTS_FAKEGATEWAY_HXX
