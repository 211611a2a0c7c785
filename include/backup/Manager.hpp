#pragma once

#include "backup/model/Entry.hpp"
#include "sync/model/SyncItem.hpp"

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace ts::fs {
class Hasher;
}

namespace ts::backup {

struct RestoreResult {
    bool ok = true;
    model::Entry restored;
    model::Entry rollbackOffer;     // state captured just before the restore
    std::string error;
};

// ####################################################################################
// ############################### Snapshot area ######################################
// ####################################################################################

// Snapshots live in <area>/<id>/ holding a copy of the item (same relative path) plus entry.json.
// Files matching the item's exclusion patterns are neither captured nor touched on apply.
class Manager {
public:
    Manager(std::filesystem::path area, unsigned int maxBackups, const fs::Hasher& hasher,
            std::vector<sync::model::SyncItem> items);

    // Throws ts::BackupError, leaving nothing half-written behind. Prunes afterwards.
    model::Entry snapshot(const sync::model::SyncItem& item, const std::string& reason = "manual");

    // Oldest snapshots beyond maxCount go first. Offline fallback files are held to the same count.
    void prune(unsigned int maxCount) const;

    // Newest first.
    [[nodiscard]] std::vector<model::Entry> list() const;
    [[nodiscard]] std::optional<model::Entry> find(const std::string& id) const;

    // Snapshots the current state (BackupError aborts), applies `entry`, then validates.
    RestoreResult restore(const model::Entry& entry);

    // Re-applies a snapshot without taking another one.
    void rollback(const model::Entry& entry);

    // Overwrites the target with the snapshot content, or removes it for an absent snapshot.
    void apply(const model::Entry& entry) const;

    // Parses the structured document and every *.yaml / *.yml inside the item. Throws ts::IntegrityError.
    void validate(const sync::model::SyncItem& item) const;

    [[nodiscard]] const std::filesystem::path& area() const { return area_; }

    // Removes the item's non-excluded files (and the item itself when nothing else remains).
    void clearTarget(const sync::model::SyncItem& item) const;

    static constexpr auto ENTRY_FILE = "entry.json";

private:
    std::filesystem::path area_;
    unsigned int maxBackups_;
    const fs::Hasher& hasher_;
    std::vector<sync::model::SyncItem> items_;
    mutable std::recursive_mutex mutex_;

    model::Entry snapshotImpl(const sync::model::SyncItem& item, const std::string& reason);
    [[nodiscard]] sync::model::SyncItem itemFor(const model::Entry& entry) const;
};

}
