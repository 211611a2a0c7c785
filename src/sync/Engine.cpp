#include "sync/Engine.hpp"
#include "sync/Executor.hpp"
#include "sync/MetadataStore.hpp"
#include "sync/Planner.hpp"
#include "sync/RecordLayout.hpp"
#include "cloud/Transport.hpp"
#include "config/Config.hpp"
#include "fs/Hasher.hpp"
#include "log/Registry.hpp"
#include "util/FileLock.hpp"
#include "util/errors.hpp"

using namespace ts::sync;
using namespace ts::sync::model;
using namespace ts::log;

Engine::Engine(const config::Config& cfg,
               std::vector<SyncItem> items,
               const fs::Hasher& hasher,
               backup::Manager& backups,
               cloud::Transport& transport,
               MetadataStore& store,
               concurrency::ThreadPool* pool)
    : cfg_(cfg),
      items_(std::move(items)),
      hasher_(hasher),
      backups_(backups),
      transport_(transport),
      store_(store),
      pool_(pool),
      strategy_(conflictStrategyFromString(cfg.sync.conflict_strategy)),
      merger_(strategy_, cfg.sync.keyed_lists) {}

Report Engine::sync() { return run(Mode::Sync); }
Report Engine::forceUpload() { return run(Mode::ForceUpload); }
Report Engine::forceDownload() { return run(Mode::ForceDownload); }
Report Engine::pull() { return run(Mode::Pull); }
Report Engine::push() { return run(Mode::Push); }

std::filesystem::path Engine::lockPath() const {
    return hasher_.root() / LOCK_FILE;
}

std::map<std::string, std::optional<Fingerprint>> Engine::localFingerprints() const {
    return hasher_.fingerprintAll(items_);
}

Report Engine::run(const Mode mode) {
    std::scoped_lock lock(mutex_);

    const auto failed = [mode](const std::string& message) {
        Registry::sync()->error("[Engine] {} failed: {}", to_string(mode), message);
        Report report;
        report.outcome = Outcome::Failed;
        report.message = message;
        return report;
    };

    try {
        util::FileLock flock(lockPath());
        Registry::sync()->debug("[Engine] Starting {} cycle", to_string(mode));

        Cycle cycle;
        cycle.mode = mode;
        cycle.strategy = strategy_;
        cycle.items = items_;
        cycle.local = hasher_.fingerprintAll(items_);
        for (const auto& item : items_) cycle.localMtimes[item.name] = hasher_.newestWriteTime(item);

        std::optional<cloud::model::RemoteRecord> record;
        try {
            record = transport_.download();
        } catch (const TransportError& e) {
            return failed(std::string("Cannot sync, hosted store unavailable: ") + e.what());
        }

        // a forced upload overwrites whatever is damaged remotely
        cycle.remote = RecordLayout::toSnapshot(record, items_, cfg_.cloud.primary_filename, mode == Mode::ForceUpload);

        if (mode == Mode::ForceDownload && !cycle.remote.exists)
            return failed("No hosted record to download from");

        cycle.meta = store_.snapshot();

        const auto plan = Planner::build(cycle);
        for (const auto& a : plan)
            if (a.type != ActionType::None)
                Registry::sync()->info("[Engine] {}: {} ({})", a.item.name, to_string(a.type), a.reason);

        Executor executor(hasher_, backups_, transport_, store_, merger_,
                          cfg_.cloud.primary_filename, cfg_.cloud.description, pool_);
        auto report = executor.run(cycle, plan);

        Registry::sync()->info("[Engine] {} finished: {} ({})", to_string(mode), to_string(report.outcome), report.message);
        return report;
    } catch (const IntegrityError& e) {
        return failed(std::string("Hosted record is damaged, run force-upload to repair it: ") + e.what());
    } catch (const std::exception& e) {
        return failed(e.what());
    }
}

std::vector<ts::backup::model::Entry> Engine::listBackups() const {
    return backups_.list();
}

ts::backup::RestoreResult Engine::restore(const std::string& id) {
    std::scoped_lock lock(mutex_);
    util::FileLock flock(lockPath());

    const auto entry = backups_.find(id);
    if (!entry) throw BackupError("No snapshot with id " + id);
    return backups_.restore(*entry);
}

void Engine::rollback(const std::string& id) {
    std::scoped_lock lock(mutex_);
    util::FileLock flock(lockPath());

    const auto entry = backups_.find(id);
    if (!entry) throw BackupError("No snapshot with id " + id);
    backups_.rollback(*entry);
}

StatusReport Engine::status() {
    std::scoped_lock lock(mutex_);

    StatusReport s;
    s.config_path = cfg_.source;
    s.config_root = hasher_.root();
    s.record_id = transport_.recordId();
    s.device_id = store_.deviceId();
    s.strategy = to_string(strategy_);

    const auto meta = store_.snapshot();
    s.last_sync = meta.lastSync();
    s.remote_updated_at = transport_.probeRemoteTimestamp();
    s.backups = backups_.list().size();

    const auto local = hasher_.fingerprintAll(items_);
    for (const auto& item : items_) {
        ItemStatus is;
        is.name = item.name;
        is.directory = item.isDirectory();
        if (const auto it = local.find(item.name); it != local.end()) is.local = it->second;

        if (const auto it = meta.targets.find(item.name); it != meta.targets.end()) {
            is.last_local = it->second.last_local;
            is.last_remote = it->second.last_remote;
            is.last_sync = it->second.last_sync;
            is.changedLocally = is.local != is.last_local;
        } else {
            is.changedLocally = is.local.has_value();
        }

        s.items.push_back(std::move(is));
    }

    return s;
}
