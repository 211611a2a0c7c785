#pragma once

#include "sync/model/Metadata.hpp"
#include "util/files.hpp"

#include <ctime>
#include <map>
#include <optional>
#include <string>

namespace ts::sync::model {

struct RemoteItem {
    util::Blob content;     // primary document text, or the zip container of an auxiliary item
    Fingerprint fingerprint;
};

// Per-item view of the hosted record, rebuilt every cycle.
struct RemoteSnapshot {
    bool exists = false;
    std::string record_id;
    std::optional<std::time_t> updated_at;
    std::string device_id;      // device that wrote the manifest
    std::map<std::string, RemoteItem> items;
    std::map<std::string, Fingerprint> manifest;   // as published, including items this device does not sync

    [[nodiscard]] const RemoteItem* find(const std::string& name) const {
        const auto it = items.find(name);
        return it == items.end() ? nullptr : &it->second;
    }

    [[nodiscard]] std::optional<Fingerprint> fingerprint(const std::string& name) const {
        if (const auto* item = find(name)) return item->fingerprint;
        return std::nullopt;
    }
};

}
