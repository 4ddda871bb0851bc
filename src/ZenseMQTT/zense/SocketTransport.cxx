// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "zense/SocketTransport.hxx"
#include "zense/ZenseErrors.hxx"
#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <netdb.h>
#include <unistd.h>
#include <cerrno>

namespace zenseMQTT
{
    static constexpr char TAG[] = "SocketTransport";
    static constexpr size_t RX_CHUNK_SIZE = 256;
    // a response frame is a few dozen bytes, anything beyond this is garbage
    static constexpr size_t RX_MAX_SIZE = 4096;

    SocketTransport::~SocketTransport() {
        close();
    }

    esp_err_t SocketTransport::open(const std::string& host, const uint16_t port, const uint32_t timeout_ms) {
        close();

        addrinfo hints = {};
        hints.ai_family = AF_INET;
        hints.ai_socktype = SOCK_STREAM;
        addrinfo* res = nullptr;

        const int err = getaddrinfo(host.c_str(), std::to_string(port).c_str(), &hints, &res);
        if (err != 0 || res == nullptr) {
            ESP_LOGE(TAG, "DNS lookup failed for '%s': err=%d", host.c_str(), err);
            return ZENSE_ERR_CONNECT;
        }

        const int sock = socket(res->ai_family, res->ai_socktype, 0);
        if (sock < 0) {
            ESP_LOGE(TAG, "Failed to create socket: errno %d", errno);
            freeaddrinfo(res);
            return ZENSE_ERR_CONNECT;
        }

        setTimeouts(sock, timeout_ms);

        if (connect(sock, res->ai_addr, res->ai_addrlen) != 0) {
            ESP_LOGW(TAG, "Connect to %s:%u failed: errno %d", host.c_str(), port, errno);
            ::close(sock);
            freeaddrinfo(res);
            return ZENSE_ERR_CONNECT;
        }
        freeaddrinfo(res);

        enableKeepalive(sock);
        m_sock = sock;
        ESP_LOGD(TAG, "Socket %d connected to %s:%u", m_sock, host.c_str(), port);
        return ESP_OK;
    }

    esp_err_t SocketTransport::write(const std::string_view data) {
        if (m_sock < 0) return ZENSE_ERR_LINK;

        size_t sent_total = 0;
        while (sent_total < data.size()) {
            const ssize_t sent = send(m_sock, data.data() + sent_total, data.size() - sent_total, MSG_NOSIGNAL);
            if (sent < 0) {
                if (errno == EINTR) continue;
                ESP_LOGW(TAG, "send() failed: errno %d", errno);
                return ZENSE_ERR_LINK;
            }
            sent_total += static_cast<size_t>(sent);
        }
        return ESP_OK;
    }

    esp_err_t SocketTransport::readUntil(const std::string_view terminator, std::string& out, const uint32_t timeout_ms) {
        out.clear();
        if (m_sock < 0) return ZENSE_ERR_LINK;

        setTimeouts(m_sock, timeout_ms);
        std::array<char, RX_CHUNK_SIZE> chunk{};

        size_t end = m_rx_buffer.find(terminator);
        while (end == std::string::npos) {
            const ssize_t received = recv(m_sock, chunk.data(), chunk.size(), 0);
            if (received == 0) {
                ESP_LOGW(TAG, "Peer closed the connection");
                return ZENSE_ERR_LINK;
            }
            if (received < 0) {
                if (errno == EINTR) continue;
                if (errno == EAGAIN || errno == EWOULDBLOCK) {
                    return ESP_ERR_TIMEOUT;
                }
                ESP_LOGW(TAG, "recv() failed: errno %d", errno);
                return ZENSE_ERR_LINK;
            }
            m_rx_buffer.append(chunk.data(), static_cast<size_t>(received));
            if (m_rx_buffer.size() > RX_MAX_SIZE) {
                ESP_LOGW(TAG, "Response exceeds %zu bytes without terminator", RX_MAX_SIZE);
                m_rx_buffer.clear();
                return ZENSE_ERR_LINK;
            }
            end = m_rx_buffer.find(terminator);
        }

        end += terminator.size();
        out = m_rx_buffer.substr(0, end);
        m_rx_buffer.erase(0, end);
        return ESP_OK;
    }

    esp_err_t SocketTransport::discardInput(size_t& out_discarded) {
        out_discarded = m_rx_buffer.size();
        m_rx_buffer.clear();
        if (m_sock < 0) return ZENSE_ERR_LINK;

        std::array<char, RX_CHUNK_SIZE> chunk{};
        while (true) {
            const ssize_t received = recv(m_sock, chunk.data(), chunk.size(), MSG_DONTWAIT);
            if (received == 0) return ZENSE_ERR_LINK;
            if (received < 0) {
                if (errno == EINTR) continue;
                if (errno == EAGAIN || errno == EWOULDBLOCK) return ESP_OK;
                ESP_LOGW(TAG, "recv() failed while draining: errno %d", errno);
                return ZENSE_ERR_LINK;
            }
            out_discarded += static_cast<size_t>(received);
        }
    }

    bool SocketTransport::peerClosed() {
        if (m_sock < 0) return true;

        char probe = 0;
        const ssize_t ret = recv(m_sock, &probe, 1, MSG_PEEK | MSG_DONTWAIT);
        if (ret == 0) return true;
        if (ret < 0) {
            return !(errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR);
        }
        // unsolicited bytes pending, the session is alive
        return false;
    }

    void SocketTransport::close() {
        if (m_sock >= 0) {
            shutdown(m_sock, SHUT_RDWR);
            ::close(m_sock);
            m_sock = -1;
        }
        m_rx_buffer.clear();
    }

    void SocketTransport::setTimeouts(const int sock, const uint32_t timeout_ms) {
        timeval tv = {};
        tv.tv_sec = static_cast<decltype(tv.tv_sec)>(timeout_ms / 1000);
        tv.tv_usec = static_cast<decltype(tv.tv_usec)>((timeout_ms % 1000) * 1000);
        if (setsockopt(sock, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) != 0
            || setsockopt(sock, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) != 0) {
            ESP_LOGW(TAG, "Failed to set socket timeouts: errno %d", errno);
        }
    }

    void SocketTransport::enableKeepalive(const int sock) {
        int enable = 1;
        int idle = 30;
        int interval = 10;
        int count = 3;
        if (setsockopt(sock, SOL_SOCKET, SO_KEEPALIVE, &enable, sizeof(enable)) != 0
            || setsockopt(sock, IPPROTO_TCP, TCP_KEEPIDLE, &idle, sizeof(idle)) != 0
            || setsockopt(sock, IPPROTO_TCP, TCP_KEEPINTVL, &interval, sizeof(interval)) != 0
            || setsockopt(sock, IPPROTO_TCP, TCP_KEEPCNT, &count, sizeof(count)) != 0) {
            ESP_LOGW(TAG, "TCP keepalive not fully enabled: errno %d", errno);
        }
    }
} // zenseMQTT
