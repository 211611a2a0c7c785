#include "sync/Executor.hpp"
#include "sync/Cycle.hpp"
#include "sync/Merger.hpp"
#include "sync/MetadataStore.hpp"
#include "sync/RecordLayout.hpp"
#include "archive/Packer.hpp"
#include "backup/Manager.hpp"
#include "cloud/Transport.hpp"
#include "crypto/util/encode.hpp"
#include "fs/Hasher.hpp"
#include "log/Registry.hpp"
#include "util/errors.hpp"
#include "util/files.hpp"

#include <fmt/format.h>

using namespace ts::sync;
using namespace ts::sync::model;
using namespace ts::cloud::model;
using namespace ts::log;

Executor::Executor(const fs::Hasher& hasher,
                   backup::Manager& backups,
                   cloud::Transport& transport,
                   MetadataStore& store,
                   const Merger& merger,
                   std::string primaryFilename,
                   std::string description,
                   concurrency::ThreadPool* pool)
    : hasher_(hasher),
      backups_(backups),
      transport_(transport),
      store_(store),
      merger_(merger),
      primaryFilename_(std::move(primaryFilename)),
      description_(std::move(description)),
      pool_(pool) {}

Report Executor::run(const Cycle& cycle, const std::vector<Action>& plan) {
    Report report;
    report.items.reserve(plan.size());

    Batch batch;
    batch.patch.description = description_;

    // local writes first, uploads are only staged here
    for (std::size_t i = 0; i < plan.size(); ++i) {
        const auto& a = plan[i];
        report.items.push_back({a.item.name, a.type, true, a.reason});
        auto& result = report.items.back();

        switch (a.type) {
        case ActionType::None:
        case ActionType::Pending:
            break;
        case ActionType::Adopt:
            batch.immediate.push_back({i, a.item.name, a.local, a.remote, "adopt"});
            break;
        case ActionType::Download:
            download(cycle, a, result, batch, i);
            break;
        case ActionType::Upload:
            stageUpload(a, result, batch, i);
            break;
        case ActionType::Merge:
            merge(cycle, a, result, batch, i);
            break;
        }
    }

    bool offline = false;

    if (!batch.patch.empty()) {
        auto manifest = cycle.remote.manifest;
        for (const auto& [name, fp] : batch.manifest) {
            if (fp) manifest[name] = *fp;
            else manifest.erase(name);
        }
        batch.patch.files[RecordLayout::MANIFEST_NAME] = RecordLayout::manifestFile(store_.deviceId(), manifest);

        try {
            const auto out = transport_.upload(batch.patch);

            if (out.status == cloud::UploadStatus::OfflineSaved) {
                offline = true;
                report.fallbackFile = out.fallbackFile;
                for (const auto& c : batch.afterUpload) report.items[c.result].detail += ", saved offline";
            } else {
                commitAll(batch.afterUpload, report);
                if (!out.record_id.empty()) {
                    try {
                        store_.setRecordId(out.record_id);
                    } catch (const MetadataError& e) {
                        Registry::sync()->warn("[Executor] {}", e.what());
                    }
                }
            }
        } catch (const TransportError& e) {
            Registry::sync()->error("[Executor] Upload failed: {}", e.what());
            for (const auto& c : batch.afterUpload) {
                report.items[c.result].ok = false;
                report.items[c.result].detail = e.what();
            }
        }
    }

    commitAll(batch.immediate, report);

    std::size_t failed = 0, pending = 0, applied = 0;
    for (const auto& r : report.items) {
        if (!r.ok) ++failed;
        else if (r.action == ActionType::Pending) ++pending;
        else if (r.action == ActionType::Upload || r.action == ActionType::Download || r.action == ActionType::Merge) ++applied;
    }

    if (failed > 0) {
        report.outcome = Outcome::Failed;
        report.message = fmt::format("{} item(s) failed to sync", failed);
    } else if (offline) {
        report.outcome = Outcome::OfflineSaved;
        report.message = fmt::format("Hosted store unreachable, changes saved to {}",
                                     report.fallbackFile ? report.fallbackFile->string() : "the backup area");
    } else if (pending > 0) {
        report.outcome = Outcome::Pending;
        report.message = fmt::format("{} item(s) changed on both sides and need a manual decision", pending);
    } else if (applied > 0) {
        report.outcome = Outcome::Synced;
        report.message = fmt::format("{} item(s) synchronized", applied);
    } else {
        report.outcome = Outcome::NoChanges;
        report.message = "Everything is up to date";
    }

    return report;
}

void Executor::guardedWrite(const SyncItem& item, const std::string& reason, const std::function<void()>& write) {
    const auto pre = backups_.snapshot(item, reason);

    try {
        write();
        backups_.validate(item);
    } catch (const std::exception& e) {
        Registry::sync()->error("[Executor] Writing {} failed, rolling back to {}: {}", item.name, pre.id, e.what());
        backups_.apply(pre);
        throw;
    }
}

void Executor::download(const Cycle& cycle, const Action& a, ItemResult& result, Batch& batch, const std::size_t idx) {
    const auto* remote = cycle.remote.find(a.item.name);

    try {
        guardedWrite(a.item, "pre-download", [&] {
            if (!remote) {
                backups_.clearTarget(a.item);
                return;
            }

            const auto target = a.item.pathUnder(hasher_.root());

            if (a.item.structured) {
                std::filesystem::create_directories(target.parent_path());
                util::writeFileAtomic(target, remote->content);
                return;
            }

            // a container may only populate its own item
            for (const auto& entry : archive::Packer::entries(remote->content))
                if (entry != a.item.name && !entry.starts_with(a.item.name + "/"))
                    throw IntegrityError("Container for " + a.item.name + " holds a foreign entry: " + entry);

            backups_.clearTarget(a.item);
            archive::Packer::unpack(remote->content, hasher_.root(), pool_);
        });
    } catch (const std::exception& e) {
        result.ok = false;
        result.detail = e.what();
        return;
    }

    batch.immediate.push_back({idx, a.item.name, hasher_.fingerprint(a.item), a.remote, "download"});
    Registry::sync()->info("[Executor] {} {}", remote ? "Downloaded" : "Removed", a.item.name);
}

void Executor::stageUpload(const Action& a, ItemResult& result, Batch& batch, const std::size_t idx) const {
    try {
        if (a.item.structured) {
            const auto text = util::readFileToString(a.item.pathUnder(hasher_.root()));
            const auto fp = fs::Hasher::digest(text);

            RecordFile file;
            file.content = text;
            batch.patch.files[primaryFilename_] = std::move(file);
            batch.manifest[a.item.name] = fp;
            batch.afterUpload.push_back({idx, a.item.name, fp, fp, "upload"});
            return;
        }

        const auto name = RecordLayout::containerName(a.item);

        if (!a.local) {
            batch.patch.files[name] = std::nullopt;
            batch.manifest[a.item.name] = std::nullopt;
            batch.afterUpload.push_back({idx, a.item.name, std::nullopt, std::nullopt, "upload"});
            return;
        }

        RecordFile file;
        file.content = crypto::encode::toBase64(archive::Packer::pack(hasher_, {a.item}));
        file.base64 = true;
        batch.patch.files[name] = std::move(file);
        batch.manifest[a.item.name] = a.local;
        batch.afterUpload.push_back({idx, a.item.name, a.local, a.local, "upload"});
    } catch (const std::exception& e) {
        Registry::sync()->error("[Executor] Could not stage {} for upload: {}", a.item.name, e.what());
        result.ok = false;
        result.detail = e.what();
    }
}

void Executor::merge(const Cycle& cycle, const Action& a, ItemResult& result, Batch& batch, const std::size_t idx) {
    try {
        const auto* remote = cycle.remote.find(a.item.name);
        if (!remote) throw Error("Remote copy of " + a.item.name + " vanished before merging");

        const auto path = a.item.pathUnder(hasher_.root());
        const auto localText = util::readFileToString(path);
        const std::string remoteText(remote->content.begin(), remote->content.end());

        std::string merged;
        try {
            const auto mr = merger_.merge(localText, remoteText, cycle.mtimeOf(a.item.name), cycle.remote.updated_at);
            merged = mr.text;
            result.detail = fmt::format("merged, {} conflicting value(s)", mr.decisions.size());
        } catch (const ParseError& e) {
            // whole-document fallback, "merge" itself degrades to newest
            const auto strategy = cycle.strategy == ConflictStrategy::Merge ? ConflictStrategy::Newest : cycle.strategy;
            const auto side = pickSide(strategy, cycle.mtimeOf(a.item.name), cycle.remote.updated_at).value_or(Side::Local);
            merged = side == Side::Local ? localText : remoteText;
            result.detail = "document not mergeable, " + to_string(strategy) + " kept " + to_string(side) + " copy";
            Registry::merge()->warn("[Executor] {}: {}; keeping the {} copy", a.item.name, e.what(), to_string(side));
        }

        if (merged != localText)
            guardedWrite(a.item, "pre-merge", [&] { util::writeFileAtomic(path, merged); });

        const auto fp = fs::Hasher::digest(merged);
        if (fp != a.remote) {
            RecordFile file;
            file.content = merged;
            batch.patch.files[primaryFilename_] = std::move(file);
            batch.manifest[a.item.name] = fp;
            batch.afterUpload.push_back({idx, a.item.name, fp, fp, "merge"});
        } else {
            batch.immediate.push_back({idx, a.item.name, fp, fp, "merge"});
        }
    } catch (const std::exception& e) {
        Registry::sync()->error("[Executor] Merge of {} failed: {}", a.item.name, e.what());
        result.ok = false;
        result.detail = e.what();
    }
}

void Executor::commitAll(const std::vector<Commit>& commits, Report& report) {
    for (const auto& c : commits) {
        try {
            store_.commit(c.item, c.local, c.remote, c.action);
        } catch (const MetadataError& e) {
            Registry::sync()->error("[Executor] {}", e.what());
            report.items[c.result].ok = false;
            report.items[c.result].detail = e.what();
        }
    }
}
