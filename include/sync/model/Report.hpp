#pragma once

#include "sync/model/Action.hpp"

#include <ctime>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace ts::sync::model {

enum class Outcome {
    NoChanges,
    Synced,
    OfflineSaved,
    Pending,
    Failed
};

struct ItemResult {
    std::string item;
    ActionType action{ActionType::None};
    bool ok = true;
    std::string detail;
};

struct Report {
    Outcome outcome{Outcome::NoChanges};
    std::string message;
    std::vector<ItemResult> items;
    std::optional<std::filesystem::path> fallbackFile;
};

struct ItemStatus {
    std::string name;
    bool directory = false;
    std::optional<Fingerprint> local;
    std::optional<Fingerprint> last_local;
    std::optional<Fingerprint> last_remote;
    std::time_t last_sync{0};
    bool changedLocally = false;
};

struct StatusReport {
    std::filesystem::path config_path;
    std::filesystem::path config_root;
    std::string record_id;
    std::string device_id;
    std::string strategy;
    std::time_t last_sync{0};
    std::optional<std::time_t> remote_updated_at;
    std::size_t backups = 0;
    std::vector<ItemStatus> items;
};

std::string to_string(Outcome o);

}
