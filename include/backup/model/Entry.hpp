#pragma once

#include <cstdint>
#include <ctime>
#include <filesystem>
#include <optional>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace ts::backup::model {

struct Entry {
    std::string id;             // "<YYYYMMDD-HHMMSS-mmm>_<slug>", unique within the area
    std::string item;
    bool directory = false;
    bool structured = false;
    bool absent = false;        // the item did not exist when captured
    int64_t captured_at_ms{0};
    std::optional<std::string> fingerprint;
    std::string reason;
    std::filesystem::path path; // snapshot directory, not persisted

    [[nodiscard]] std::time_t capturedAt() const { return static_cast<std::time_t>(captured_at_ms / 1000); }
};

void to_json(nlohmann::json& j, const Entry& e);
void from_json(const nlohmann::json& j, Entry& e);

}
