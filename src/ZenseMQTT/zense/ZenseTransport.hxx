// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef ZENSEMQTT_ZENSETRANSPORT_HXX
#define ZENSEMQTT_ZENSETRANSPORT_HXX

namespace zenseMQTT
{
    /**
     * @brief Byte stream to the gateway box.
     *
     * ZenseLink owns exactly one transport and is the only caller, so
     * implementations need no locking of their own.
     */
    class ZenseTransport {
    public:
        virtual ~ZenseTransport() = default;

        /**
         * @return ESP_OK, or ZENSE_ERR_CONNECT on resolve/connect failure
         */
        virtual esp_err_t open(const std::string& host, uint16_t port, uint32_t timeout_ms) = 0;

        /**
         * @return ESP_OK when all bytes were written, ZENSE_ERR_LINK otherwise
         */
        virtual esp_err_t write(std::string_view data) = 0;

        /**
         * @brief Reads until @p terminator is seen or the peer closes.
         *
         * Bytes received after the terminator stay buffered for the next call.
         * @return ESP_OK with the bytes up to and including the terminator,
         *         ESP_ERR_TIMEOUT, or ZENSE_ERR_LINK on error / peer close
         */
        virtual esp_err_t readUntil(std::string_view terminator, std::string& out, uint32_t timeout_ms) = 0;

        /**
         * @brief Drops buffered input and everything already received, without blocking.
         * @param out_discarded number of bytes thrown away
         * @return ESP_OK, or ZENSE_ERR_LINK when the peer closed the stream
         */
        virtual esp_err_t discardInput(size_t& out_discarded) = 0;

        /**
         * @brief Non-blocking check whether the peer already closed the stream.
         */
        [[nodiscard]] virtual bool peerClosed() = 0;

        virtual void close() = 0;

        [[nodiscard]] virtual bool isOpen() const = 0;
    };
} // zenseMQTT

#endif //ZENSEMQTT_ZENSETRANSPORT_HXX
