#include "backup/Manager.hpp"
#include "fs/Hasher.hpp"
#include "log/Registry.hpp"
#include "util/errors.hpp"
#include "util/files.hpp"
#include "util/timestamp.hpp"

#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>

using namespace ts::backup;
using namespace ts::backup::model;
using namespace ts::sync::model;
using namespace ts::log;
using namespace ts::util;
namespace stdfs = std::filesystem;

namespace {

bool isYamlFile(const stdfs::path& p) {
    const auto ext = p.extension().string();
    return ext == ".yaml" || ext == ".yml";
}

bool newerFirst(const Entry& a, const Entry& b) {
    if (a.captured_at_ms != b.captured_at_ms) return a.captured_at_ms > b.captured_at_ms;
    return a.id > b.id;
}

}

Manager::Manager(stdfs::path area, const unsigned int maxBackups, const fs::Hasher& hasher, std::vector<SyncItem> items)
    : area_(std::move(area)), maxBackups_(maxBackups), hasher_(hasher), items_(std::move(items)) {}

SyncItem Manager::itemFor(const Entry& entry) const {
    const auto it = std::ranges::find_if(items_, [&](const SyncItem& i) { return i.name == entry.item; });
    if (it != items_.end()) return *it;

    SyncItem item;
    item.name = entry.item;
    item.kind = entry.directory ? SyncItem::Kind::Directory : SyncItem::Kind::File;
    item.structured = entry.structured;
    return item;
}

Entry Manager::snapshot(const SyncItem& item, const std::string& reason) {
    std::scoped_lock lock(mutex_);
    auto entry = snapshotImpl(item, reason);
    prune(maxBackups_);
    return entry;
}

Entry Manager::snapshotImpl(const SyncItem& item, const std::string& reason) {
    using namespace std::chrono;

    // bump the stamp until the id is free so ids stay unique and in capture order
    auto tp = time_point_cast<milliseconds>(system_clock::now());
    const auto slug = slugify(item.name);
    std::string id;
    std::error_code ec;
    do {
        id = fileStamp(tp) + "_" + slug;
        if (!stdfs::exists(area_ / id, ec)) break;
        tp += milliseconds(1);
    } while (true);

    Entry entry;
    entry.id = id;
    entry.item = item.name;
    entry.directory = item.isDirectory();
    entry.structured = item.structured;
    entry.captured_at_ms = tp.time_since_epoch().count();
    entry.reason = reason;
    entry.path = area_ / id;

    try {
        stdfs::create_directories(entry.path);

        const auto src = item.pathUnder(hasher_.root());
        const auto dst = entry.path / item.name;

        if (!stdfs::exists(src)) {
            entry.absent = true;
        } else if (stdfs::is_directory(src)) {
            stdfs::create_directories(dst);
            for (const auto& rel : hasher_.collectFiles(item)) {
                stdfs::create_directories((dst / rel).parent_path());
                stdfs::copy_file(src / rel, dst / rel, stdfs::copy_options::overwrite_existing);
            }
        } else {
            stdfs::create_directories(dst.parent_path());
            stdfs::copy_file(src, dst, stdfs::copy_options::overwrite_existing);
        }

        entry.fingerprint = hasher_.fingerprint(item);
        writeFileAtomic(entry.path / ENTRY_FILE, nlohmann::json(entry).dump(2));
    } catch (const std::exception& e) {
        stdfs::remove_all(entry.path, ec);
        Registry::backup()->error("[BackupManager] Snapshot of {} failed: {}", item.name, e.what());
        throw BackupError("Snapshot of " + item.name + " failed: " + e.what());
    }

    Registry::backup()->info("[BackupManager] Captured {} ({}){}", entry.id, reason, entry.absent ? " [absent]" : "");
    return entry;
}

std::vector<Entry> Manager::list() const {
    std::scoped_lock lock(mutex_);
    std::vector<Entry> entries;

    std::error_code ec;
    if (!stdfs::is_directory(area_, ec)) return entries;

    for (const auto& de : stdfs::directory_iterator(area_, ec)) {
        if (!de.is_directory(ec)) continue;

        const auto meta = de.path() / ENTRY_FILE;
        if (!stdfs::exists(meta, ec)) continue; // half-written or foreign directory

        try {
            auto entry = nlohmann::json::parse(readFileToString(meta)).get<Entry>();
            entry.path = de.path();
            entries.push_back(std::move(entry));
        } catch (const std::exception& e) {
            Registry::backup()->warn("[BackupManager] Ignoring unreadable snapshot {}: {}", de.path().string(), e.what());
        }
    }

    std::ranges::sort(entries, newerFirst);
    return entries;
}

std::optional<Entry> Manager::find(const std::string& id) const {
    for (auto& e : list())
        if (e.id == id) return e;
    return std::nullopt;
}

void Manager::prune(const unsigned int maxCount) const {
    std::scoped_lock lock(mutex_);
    std::error_code ec;

    const auto entries = list();
    for (size_t i = maxCount; i < entries.size(); ++i) {
        stdfs::remove_all(entries[i].path, ec);
        if (ec) Registry::backup()->warn("[BackupManager] Failed to prune {}: {}", entries[i].id, ec.message());
        else Registry::backup()->debug("[BackupManager] Pruned {}", entries[i].id);
    }

    // offline fallback files carry their stamp in the name, so name order is capture order
    std::vector<stdfs::path> fallbacks;
    for (const auto& de : stdfs::directory_iterator(area_, ec)) {
        const auto name = de.path().filename().string();
        if (de.is_regular_file(ec) && name.starts_with("fallback-") && name.ends_with(".json"))
            fallbacks.push_back(de.path());
    }

    std::ranges::sort(fallbacks, std::greater<>());
    for (size_t i = maxCount; i < fallbacks.size(); ++i) stdfs::remove(fallbacks[i], ec);
}

void Manager::clearTarget(const SyncItem& item) const {
    const auto target = item.pathUnder(hasher_.root());
    std::error_code ec;
    if (!stdfs::exists(target, ec)) return;

    if (!stdfs::is_directory(target, ec)) {
        stdfs::remove(target);
        return;
    }

    for (const auto& rel : hasher_.collectFiles(item)) stdfs::remove(target / rel);

    // drop directories the removal left empty, deepest first
    std::vector<stdfs::path> dirs;
    for (const auto& de : stdfs::recursive_directory_iterator(target, stdfs::directory_options::skip_permission_denied))
        if (de.is_directory(ec)) dirs.push_back(de.path());

    std::ranges::sort(dirs, [](const stdfs::path& a, const stdfs::path& b) { return a.native().size() > b.native().size(); });
    for (const auto& d : dirs)
        if (stdfs::is_empty(d, ec)) stdfs::remove(d, ec);

    if (stdfs::is_empty(target, ec)) stdfs::remove(target, ec);
}

void Manager::apply(const Entry& entry) const {
    std::scoped_lock lock(mutex_);
    const auto item = itemFor(entry);
    const auto target = item.pathUnder(hasher_.root());

    try {
        if (entry.absent) {
            clearTarget(item);
            Registry::backup()->info("[BackupManager] Applied {}: {} removed", entry.id, item.name);
            return;
        }

        const auto src = entry.path / entry.item;
        if (!stdfs::exists(src)) throw BackupError("Snapshot " + entry.id + " is missing its content");

        if (!stdfs::is_directory(src)) {
            stdfs::create_directories(target.parent_path());
            if (stdfs::is_directory(target)) clearTarget(item);
            writeFileAtomic(target, readFileToVector(src));
        } else {
            // stage a full copy first so a failed copy leaves the target untouched
            const auto staging = target.parent_path() / ("." + target.filename().string() + ".restore-" + randomSuffix());
            stdfs::copy(src, staging, stdfs::copy_options::recursive);

            clearTarget(item);
            stdfs::create_directories(target);

            for (const auto& de : stdfs::recursive_directory_iterator(staging)) {
                if (!de.is_regular_file()) continue;
                const auto dest = target / de.path().lexically_relative(staging);
                stdfs::create_directories(dest.parent_path());
                stdfs::rename(de.path(), dest);
            }

            stdfs::remove_all(staging);
        }
    } catch (const BackupError&) {
        throw;
    } catch (const std::exception& e) {
        throw BackupError("Applying snapshot " + entry.id + " failed: " + e.what());
    }

    Registry::backup()->info("[BackupManager] Applied {} to {}", entry.id, item.name);
}

void Manager::validate(const SyncItem& item) const {
    const auto target = item.pathUnder(hasher_.root());
    std::error_code ec;
    if (!stdfs::exists(target, ec)) return;

    std::vector<stdfs::path> docs;
    if (stdfs::is_directory(target, ec)) {
        for (const auto& rel : hasher_.collectFiles(item))
            if (isYamlFile(rel)) docs.push_back(target / rel);
    } else if (item.structured || isYamlFile(target)) {
        docs.push_back(target);
    }

    for (const auto& doc : docs) {
        try {
            YAML::LoadFile(doc.string());
        } catch (const YAML::Exception& e) {
            throw IntegrityError("Invalid YAML in " + doc.string() + ": " + e.what());
        }
    }
}

RestoreResult Manager::restore(const Entry& entry) {
    std::scoped_lock lock(mutex_);
    const auto item = itemFor(entry);

    RestoreResult result;
    result.restored = entry;
    result.rollbackOffer = snapshotImpl(item, "pre-restore");

    apply(entry);

    try {
        validate(item);
    } catch (const IntegrityError& e) {
        result.ok = false;
        result.error = e.what();
        Registry::backup()->warn("[BackupManager] Restored {} fails validation, rollback available via {}",
                                 entry.id, result.rollbackOffer.id);
    }

    prune(maxBackups_);
    Registry::audit()->info("[BackupManager] restore id={} item={} valid={}", entry.id, item.name, result.ok);
    return result;
}

void Manager::rollback(const Entry& entry) {
    std::scoped_lock lock(mutex_);
    apply(entry);
    Registry::audit()->info("[BackupManager] rollback id={} item={}", entry.id, entry.item);
}
