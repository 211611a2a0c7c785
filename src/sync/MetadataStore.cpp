#include "sync/MetadataStore.hpp"
#include "crypto/util/hash.hpp"
#include "log/Registry.hpp"
#include "util/errors.hpp"
#include "util/files.hpp"
#include "util/timestamp.hpp"

#include <sys/utsname.h>
#include <unistd.h>

#include <chrono>
#include <nlohmann/json.hpp>

using namespace ts::sync;
using namespace ts::sync::model;
using namespace ts::log;
using namespace ts::util;

MetadataStore::MetadataStore(std::filesystem::path file, const unsigned int historyLimit, std::string deviceId)
    : file_(std::move(file)), historyLimit_(historyLimit), deviceId_(std::move(deviceId)) {
    meta_.device_id = deviceId_;
}

void MetadataStore::load() {
    std::scoped_lock lock(mutex_);

    meta_ = SyncMetadata{};
    meta_.device_id = deviceId_;

    std::error_code ec;
    if (!std::filesystem::exists(file_, ec)) {
        Registry::meta()->debug("[MetadataStore] No metadata at {}, starting fresh", file_.string());
        return;
    }

    try {
        meta_ = nlohmann::json::parse(readFileToString(file_)).get<SyncMetadata>();
    } catch (const std::exception& e) {
        Registry::meta()->warn("[MetadataStore] Unreadable sync metadata {}: {}", file_.string(), e.what());

        meta_ = SyncMetadata{};
        const auto aside = file_.string() + ".corrupt-" + fileStamp();
        std::filesystem::rename(file_, aside, ec);
        if (ec) Registry::meta()->error("[MetadataStore] Could not move corrupt metadata aside: {}", ec.message());
        else Registry::meta()->warn("[MetadataStore] Corrupt metadata moved to {}", aside);
    }

    // the record always speaks for this device
    meta_.device_id = deviceId_;
}

std::optional<TargetState> MetadataStore::get(const std::string& item) const {
    std::scoped_lock lock(mutex_);
    const auto it = meta_.targets.find(item);
    if (it == meta_.targets.end()) return std::nullopt;
    return it->second;
}

SyncMetadata MetadataStore::snapshot() const {
    std::scoped_lock lock(mutex_);
    return meta_;
}

void MetadataStore::persist(const SyncMetadata& meta) const {
    try {
        if (file_.has_parent_path()) std::filesystem::create_directories(file_.parent_path());
        writeFileAtomic(file_, nlohmann::json(meta).dump(2));
    } catch (const std::exception& e) {
        throw MetadataError("Failed to persist sync metadata to " + file_.string() + ": " + e.what());
    }
}

void MetadataStore::commit(const std::string& item,
                           const std::optional<Fingerprint>& local,
                           const std::optional<Fingerprint>& remote,
                           const std::string& action) {
    std::scoped_lock lock(mutex_);

    auto next = meta_;
    auto& target = next.targets[item];

    const auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    target.last_local = local;
    target.last_remote = remote;
    target.last_sync = now;
    target.history.push_back({now, action, deviceId_, item});

    if (historyLimit_ > 0 && target.history.size() > historyLimit_)
        target.history.erase(target.history.begin(),
                             target.history.begin() + static_cast<std::ptrdiff_t>(target.history.size() - historyLimit_));

    persist(next);
    meta_ = std::move(next);

    Registry::audit()->info("[MetadataStore] {} item={} local={} remote={} device={}",
                            action, item, local.value_or("-"), remote.value_or("-"), deviceId_);
}

void MetadataStore::setRecordId(const std::string& id) {
    std::scoped_lock lock(mutex_);
    if (meta_.record_id == id) return;

    auto next = meta_;
    next.record_id = id;
    persist(next);
    meta_ = std::move(next);
}

std::string MetadataStore::computeDeviceId() {
    crypto::hash::Digest digest;

    char host[256] = {};
    if (::gethostname(host, sizeof(host) - 1) == 0) digest.update(std::string_view(host));

    utsname uts{};
    if (::uname(&uts) == 0) digest.update("|").update(std::string_view(uts.machine));

    std::error_code ec;
    if (std::filesystem::exists("/etc/machine-id", ec)) {
        try {
            digest.update("|").update(readFileToString("/etc/machine-id"));
        } catch (const std::exception& e) {
            Registry::meta()->debug("[MetadataStore] machine-id unreadable: {}", e.what());
        }
    }

    return digest.hex();
}
