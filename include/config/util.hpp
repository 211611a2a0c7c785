#pragma once

#include <string>
#include <chrono>
#include <stdexcept>

namespace ts::config {

// Accepts "30", "30s", "5m" or "1h". A bare number is seconds.
inline std::chrono::seconds parseSeconds(const std::string& str) {
    if (str.empty()) throw std::invalid_argument("Duration string cannot be empty");

    const auto number = [&](const size_t suffixLen) {
        const auto digits = str.substr(0, str.size() - suffixLen);
        size_t consumed = 0;
        const auto value = std::stoul(digits, &consumed);
        if (consumed != digits.size()) throw std::invalid_argument("Invalid duration: " + str);
        return value;
    };

    switch (str.back()) {
        case 's': case 'S': return std::chrono::seconds(number(1));
        case 'm': case 'M': return std::chrono::minutes(number(1));
        case 'h': case 'H': return std::chrono::hours(number(1));
        default: return std::chrono::seconds(number(0));
    }
}

inline std::string secondsToString(const std::chrono::seconds& s) {
    if (s.count() != 0 && s.count() % 3600 == 0) return std::to_string(s.count() / 3600) + "h";
    if (s.count() != 0 && s.count() % 60 == 0) return std::to_string(s.count() / 60) + "m";
    return std::to_string(s.count()) + "s";
}

}
