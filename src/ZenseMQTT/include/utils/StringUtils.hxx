// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef ZENSEMQTT_STRINGUTILS_HXX
#define ZENSEMQTT_STRINGUTILS_HXX

namespace zenseMQTT::utils {
    inline std::string_view trim(std::string_view sv) {
        constexpr std::string_view ws = " \t\r\n";
        const auto first = sv.find_first_not_of(ws);
        if (first == std::string_view::npos) return {};
        const auto last = sv.find_last_not_of(ws);
        return sv.substr(first, last - first + 1);
    }

    inline std::vector<std::string_view> split(std::string_view sv, const char delim) {
        std::vector<std::string_view> parts;
        for (const auto part : std::views::split(sv, delim)) {
            parts.emplace_back(part.begin(), part.end());
        }
        return parts;
    }

    // Strict integer parse: whole (trimmed) input must be consumed
    template <typename T>
    std::optional<T> parseInt(std::string_view sv) {
        sv = trim(sv);
        if (sv.empty()) return std::nullopt;
        T value{};
        const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);
        if (ec != std::errc() || ptr != sv.data() + sv.size()) return std::nullopt;
        return value;
    }

    // Accepts "42", "42.6", " 7 " and rounds to nearest
    inline std::optional<int> parseRoundedNumber(std::string_view sv) {
        sv = trim(sv);
        if (sv.empty()) return std::nullopt;
        double value = 0.0;
        const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);
        if (ec != std::errc() || ptr != sv.data() + sv.size()) return std::nullopt;
        if (value > 1e6 || value < -1e6) return std::nullopt;
        return static_cast<int>(value >= 0 ? value + 0.5 : value - 0.5);
    }

    inline std::string toUpper(std::string_view sv) {
        std::string out(sv);
        std::ranges::transform(out, out.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return out;
    }
}

#endif //ZENSEMQTT_STRINGUTILS_HXX
