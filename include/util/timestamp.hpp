#pragma once

#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>

namespace ts::util {

inline std::string timestampToString(const std::time_t ts) {
    std::tm tm{};
    gmtime_r(&ts, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ"); // ISO 8601 UTC
    return oss.str();
}

// Accepts "YYYY-MM-DDTHH:MM:SSZ" as well as a fractional / offset-less variant; returns nullopt on garbage.
inline std::optional<std::time_t> parseTimestampFromString(const std::string& iso) {
    if (iso.size() < 19) return std::nullopt;
    std::tm tm = {};
    std::istringstream ss(iso.substr(0, 19));
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) return std::nullopt;
    return timegm(&tm);
}

inline std::string getCurrentTimestamp() {
    return timestampToString(std::chrono::system_clock::to_time_t(std::chrono::system_clock::now()));
}

// Sortable stamp used in backup and fallback file names, millisecond resolution.
inline std::string fileStamp(const std::chrono::system_clock::time_point tp = std::chrono::system_clock::now()) {
    using namespace std::chrono;
    const auto t = system_clock::to_time_t(tp);
    const auto ms = duration_cast<milliseconds>(tp.time_since_epoch()).count() % 1000;
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream os;
    os << std::put_time(&tm, "%Y%m%d-%H%M%S") << '-' << std::setw(3) << std::setfill('0') << ms;
    return os.str();
}

inline std::time_t toTimeT(const std::filesystem::file_time_type tp) {
    using namespace std::chrono;
    const auto sctp = time_point_cast<system_clock::duration>(tp - decltype(tp)::clock::now() + system_clock::now());
    return system_clock::to_time_t(sctp);
}

}
