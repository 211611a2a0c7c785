#pragma once

#include "sync/model/ConflictStrategy.hpp"
#include "sync/model/Metadata.hpp"
#include "sync/model/RemoteSnapshot.hpp"
#include "sync/model/SyncItem.hpp"

#include <ctime>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace ts::sync {

enum class Mode {
    Sync,           // both directions
    Pull,           // remote -> local only
    Push,           // local -> remote only
    ForceUpload,    // local wins for every item
    ForceDownload   // remote wins for every item
};

std::string to_string(Mode m);

// Everything one reconciliation pass observed before acting.
struct Cycle {
    Mode mode{Mode::Sync};
    model::ConflictStrategy strategy{model::ConflictStrategy::Newest};
    std::vector<model::SyncItem> items;
    std::map<std::string, std::optional<model::Fingerprint>> local;
    std::map<std::string, std::optional<std::time_t>> localMtimes;
    model::RemoteSnapshot remote;
    model::SyncMetadata meta;

    [[nodiscard]] std::optional<model::Fingerprint> localOf(const std::string& name) const {
        const auto it = local.find(name);
        return it == local.end() ? std::nullopt : it->second;
    }

    [[nodiscard]] std::optional<std::time_t> mtimeOf(const std::string& name) const {
        const auto it = localMtimes.find(name);
        return it == localMtimes.end() ? std::nullopt : it->second;
    }

    [[nodiscard]] const model::TargetState* stateOf(const std::string& name) const {
        const auto it = meta.targets.find(name);
        return it == meta.targets.end() ? nullptr : &it->second;
    }
};

}
