// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef ZENSEMQTT_ZENSEPROTOCOL_HXX
#define ZENSEMQTT_ZENSEPROTOCOL_HXX

#include "zense/ZenseTypes.hxx"

namespace zenseMQTT
{
    /**
     * @brief Framing of the gateway ASCII protocol.
     *
     * Every request and every response is a single frame ">>Verb args<<".
     * Known verbs: Login, Set, Fade, Get, Get Devices, Get Name.
     */
    class ZenseProtocol {
    public:
        ZenseProtocol() = delete;

        static constexpr std::string_view FRAME_START = ">>";
        static constexpr std::string_view FRAME_END = "<<";

        // Запросы
        static std::string login(std::string_view code);
        static std::string set(std::string_view device_id, uint8_t level);
        static std::string fade(std::string_view device_id, uint8_t level);
        static std::string get(std::string_view device_id);
        static std::string getDevices();
        static std::string getName(std::string_view device_id);

        // Ответы
        /**
         * @brief Returns the body of the first complete frame in @p buffer.
         * @return nullopt while the terminator has not arrived yet.
         */
        [[nodiscard]] static std::optional<std::string_view> extractFrame(std::string_view buffer);
        [[nodiscard]] static bool isLoginOk(std::string_view response);
        [[nodiscard]] static bool isAck(std::string_view response);
        [[nodiscard]] static std::optional<uint8_t> parseLevel(std::string_view response);
        [[nodiscard]] static std::optional<std::vector<ZenseDeviceId>> parseDeviceList(std::string_view response);
        [[nodiscard]] static std::optional<std::string> parseName(std::string_view response);

        [[nodiscard]] static bool isValidDeviceId(std::string_view device_id);

    private:
        static std::optional<std::string_view> payloadAfter(std::string_view response, std::string_view verb);
    };
} // zenseMQTT

#endif //ZENSEMQTT_ZENSEPROTOCOL_HXX
