// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "zense/ZenseProtocol.hxx"
#include "utils/StringUtils.hxx"

namespace zenseMQTT
{
    std::string ZenseProtocol::login(const std::string_view code) {
        return std::format(">>Login {}<<", code);
    }

    std::string ZenseProtocol::set(const std::string_view device_id, const uint8_t level) {
        return std::format(">>Set {} {}<<", device_id, std::min(level, ZENSE_LEVEL_MAX));
    }

    std::string ZenseProtocol::fade(const std::string_view device_id, const uint8_t level) {
        return std::format(">>Fade {} {}<<", device_id, std::min(level, ZENSE_LEVEL_MAX));
    }

    std::string ZenseProtocol::get(const std::string_view device_id) {
        return std::format(">>Get {}<<", device_id);
    }

    std::string ZenseProtocol::getDevices() {
        return ">>Get Devices<<";
    }

    std::string ZenseProtocol::getName(const std::string_view device_id) {
        return std::format(">>Get Name {}<<", device_id);
    }

    std::optional<std::string_view> ZenseProtocol::extractFrame(const std::string_view buffer) {
        const auto start = buffer.find(FRAME_START);
        if (start == std::string_view::npos) return std::nullopt;
        const auto body_start = start + FRAME_START.size();
        const auto end = buffer.find(FRAME_END, body_start);
        if (end == std::string_view::npos) return std::nullopt;
        return buffer.substr(body_start, end - body_start);
    }

    bool ZenseProtocol::isLoginOk(const std::string_view response) {
        const auto body = extractFrame(response);
        return body.has_value() && utils::trim(*body) == "Login Ok";
    }

    bool ZenseProtocol::isAck(const std::string_view response) {
        return extractFrame(response).has_value();
    }

    std::optional<std::string_view> ZenseProtocol::payloadAfter(const std::string_view response, const std::string_view verb) {
        const auto body = extractFrame(response);
        if (!body) return std::nullopt;
        // "Get 40" -> verb "Get" -> "40"
        if (!body->starts_with(verb)) return std::nullopt;
        std::string_view rest = body->substr(verb.size());
        if (!rest.empty() && rest.front() != ' ') return std::nullopt;
        return utils::trim(rest);
    }

    std::optional<uint8_t> ZenseProtocol::parseLevel(const std::string_view response) {
        const auto payload = payloadAfter(response, "Get");
        if (!payload) return std::nullopt;
        const auto value = utils::parseInt<int>(*payload);
        if (!value || *value < 0 || *value > ZENSE_LEVEL_MAX) return std::nullopt;
        return static_cast<uint8_t>(*value);
    }

    std::optional<std::vector<ZenseDeviceId>> ZenseProtocol::parseDeviceList(const std::string_view response) {
        const auto payload = payloadAfter(response, "Get Devices");
        if (!payload) return std::nullopt;

        std::vector<ZenseDeviceId> ids;
        for (const auto part : utils::split(*payload, ',')) {
            const auto id = utils::trim(part);
            if (!id.empty() && std::ranges::all_of(id, [](const unsigned char c) { return std::isdigit(c); })) {
                ids.emplace_back(id);
            }
        }
        return ids;
    }

    std::optional<std::string> ZenseProtocol::parseName(const std::string_view response) {
        auto payload = payloadAfter(response, "Get Name");
        if (!payload) return std::nullopt;

        std::string_view name = *payload;
        while (!name.empty() && name.front() == '\'') name.remove_prefix(1);
        while (!name.empty() && name.back() == '\'') name.remove_suffix(1);
        name = utils::trim(name);

        if (name.empty()) return std::nullopt;
        // the gateway answers "Timeout" for devices that did not report a name
        if (utils::toUpper(name) == "TIMEOUT") return std::nullopt;
        return std::string(name);
    }

    bool ZenseProtocol::isValidDeviceId(const std::string_view device_id) {
        if (device_id.empty() || device_id.size() > 16) return false;
        return std::ranges::all_of(device_id, [](const unsigned char c) {
            return std::isalnum(c) || c == '_' || c == '-';
        });
    }
} // zenseMQTT
