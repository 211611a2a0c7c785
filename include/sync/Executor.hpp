#pragma once

#include "cloud/model/Record.hpp"
#include "sync/model/Action.hpp"
#include "sync/model/Report.hpp"

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace ts::fs {
class Hasher;
}

namespace ts::backup {
class Manager;
}

namespace ts::cloud {
class Transport;
}

namespace ts::concurrency {
class ThreadPool;
}

namespace ts::sync {

struct Cycle;
class Merger;
class MetadataStore;

// Carries out a plan: local writes first, then a single PATCH holding every upload, then the
// metadata commits for the actions whose effects all landed.
class Executor {
public:
    Executor(const fs::Hasher& hasher,
             backup::Manager& backups,
             cloud::Transport& transport,
             MetadataStore& store,
             const Merger& merger,
             std::string primaryFilename,
             std::string description,
             concurrency::ThreadPool* pool = nullptr);

    model::Report run(const Cycle& cycle, const std::vector<model::Action>& plan);

private:
    const fs::Hasher& hasher_;
    backup::Manager& backups_;
    cloud::Transport& transport_;
    MetadataStore& store_;
    const Merger& merger_;
    std::string primaryFilename_;
    std::string description_;
    concurrency::ThreadPool* pool_;

    struct Commit {
        std::size_t result;     // index into the report items
        std::string item;
        std::optional<model::Fingerprint> local;
        std::optional<model::Fingerprint> remote;
        std::string action;
    };

    struct Batch {
        cloud::model::RecordPatch patch;
        std::map<std::string, std::optional<model::Fingerprint>> manifest;
        std::vector<Commit> afterUpload;
        std::vector<Commit> immediate;
    };

    void download(const Cycle& cycle, const model::Action& a, model::ItemResult& result, Batch& batch, std::size_t idx);
    void stageUpload(const model::Action& a, model::ItemResult& result, Batch& batch, std::size_t idx) const;
    void merge(const Cycle& cycle, const model::Action& a, model::ItemResult& result, Batch& batch, std::size_t idx);

    // Snapshots the item, runs `write`, validates, and re-applies the snapshot when either step throws.
    void guardedWrite(const model::SyncItem& item, const std::string& reason, const std::function<void()>& write);

    void commitAll(const std::vector<Commit>& commits, model::Report& report);
};

}
