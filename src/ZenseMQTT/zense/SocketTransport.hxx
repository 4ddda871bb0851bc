// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef ZENSEMQTT_SOCKETTRANSPORT_HXX
#define ZENSEMQTT_SOCKETTRANSPORT_HXX

#include "zense/ZenseTransport.hxx"

namespace zenseMQTT
{
    // TCP socket to the gateway (lwIP on ESP32, host BSD sockets on the linux target)
    class SocketTransport final : public ZenseTransport {
    public:
        SocketTransport() = default;
        ~SocketTransport() override;

        SocketTransport(const SocketTransport&) = delete;
        SocketTransport& operator=(const SocketTransport&) = delete;

        esp_err_t open(const std::string& host, uint16_t port, uint32_t timeout_ms) override;
        esp_err_t write(std::string_view data) override;
        esp_err_t readUntil(std::string_view terminator, std::string& out, uint32_t timeout_ms) override;
        esp_err_t discardInput(size_t& out_discarded) override;
        [[nodiscard]] bool peerClosed() override;
        void close() override;
        [[nodiscard]] bool isOpen() const override { return m_sock >= 0; }

    private:
        static void setTimeouts(int sock, uint32_t timeout_ms);
        static void enableKeepalive(int sock);

        int m_sock{-1};
        // received but not yet returned by readUntil
        std::string m_rx_buffer;
    };
} // zenseMQTT

#endif //ZENSEMQTT_SOCKETTRANSPORT_HXX
