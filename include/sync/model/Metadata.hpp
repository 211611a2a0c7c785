#pragma once

#include <ctime>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace ts::sync::model {

// 32 lowercase hex chars. Absence is modelled with std::optional.
using Fingerprint = std::string;

struct HistoryEntry {
    std::time_t time{0};
    std::string action;
    std::string device_id;
    std::string item;
};

struct TargetState {
    std::optional<Fingerprint> last_local;
    std::optional<Fingerprint> last_remote;
    std::time_t last_sync{0};
    std::vector<HistoryEntry> history;
};

struct SyncMetadata {
    std::string device_id;
    std::string record_id;
    std::map<std::string, TargetState> targets;

    [[nodiscard]] std::time_t lastSync() const;
};

void to_json(nlohmann::json& j, const HistoryEntry& h);
void from_json(const nlohmann::json& j, HistoryEntry& h);

void to_json(nlohmann::json& j, const TargetState& t);
void from_json(const nlohmann::json& j, TargetState& t);

void to_json(nlohmann::json& j, const SyncMetadata& m);
void from_json(const nlohmann::json& j, SyncMetadata& m);

}
