#pragma once

#include "backup/Manager.hpp"
#include "sync/Cycle.hpp"
#include "sync/Merger.hpp"
#include "sync/model/Report.hpp"
#include "sync/model/SyncItem.hpp"

#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace ts::config {
struct Config;
}

namespace ts::fs {
class Hasher;
}

namespace ts::cloud {
class Transport;
}

namespace ts::concurrency {
class ThreadPool;
}

namespace ts::sync {

class MetadataStore;

// ####################################################################################
// ############################## Reconciliation entry ################################
// ####################################################################################

// Every cycle holds an in-process mutex and an advisory lock on <config_root>/.termsync.lock.
// Sync entry points never throw: failures come back as a Report with Outcome::Failed.
class Engine {
public:
    Engine(const config::Config& cfg,
           std::vector<model::SyncItem> items,
           const fs::Hasher& hasher,
           backup::Manager& backups,
           cloud::Transport& transport,
           MetadataStore& store,
           concurrency::ThreadPool* pool = nullptr);

    model::Report sync();
    model::Report forceUpload();
    model::Report forceDownload();
    model::Report pull();
    model::Report push();

    [[nodiscard]] std::vector<backup::model::Entry> listBackups() const;

    // Throws ts::BackupError when the id is unknown or the snapshot cannot be taken.
    backup::RestoreResult restore(const std::string& id);
    void rollback(const std::string& id);

    [[nodiscard]] model::StatusReport status();

    [[nodiscard]] std::map<std::string, std::optional<model::Fingerprint>> localFingerprints() const;
    [[nodiscard]] const std::vector<model::SyncItem>& items() const { return items_; }

    static constexpr auto LOCK_FILE = ".termsync.lock";

private:
    const config::Config& cfg_;
    std::vector<model::SyncItem> items_;
    const fs::Hasher& hasher_;
    backup::Manager& backups_;
    cloud::Transport& transport_;
    MetadataStore& store_;
    concurrency::ThreadPool* pool_;
    model::ConflictStrategy strategy_;
    Merger merger_;

    mutable std::mutex mutex_;

    model::Report run(Mode mode);
    [[nodiscard]] std::filesystem::path lockPath() const;
};

}
