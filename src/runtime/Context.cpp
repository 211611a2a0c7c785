#include "runtime/Context.hpp"
#include "backup/Manager.hpp"
#include "cloud/Transport.hpp"
#include "concurrency/ThreadPool.hpp"
#include "crypto/util/hash.hpp"
#include "fs/Hasher.hpp"
#include "log/Registry.hpp"
#include "sync/Engine.hpp"
#include "sync/MetadataStore.hpp"
#include "sync/ProcessProbe.hpp"
#include "sync/Watcher.hpp"
#include "util/errors.hpp"

#include <curl/curl.h>

using namespace ts::runtime;
using namespace ts::log;

Context::CurlGlobal::CurlGlobal() {
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) throw Error("libcurl failed to initialize");
}

Context::CurlGlobal::~CurlGlobal() {
    curl_global_cleanup();
}

Context::Context(std::filesystem::path configPath, const bool debug)
    : configPath_(std::move(configPath)), cfg_(config::loadConfig(configPath_)) {
    if (debug) {
        cfg_.logging.levels.console_log_level = spdlog::level::debug;
        cfg_.logging.levels.subsystem_levels = {
            spdlog::level::debug, spdlog::level::debug, spdlog::level::debug,
            spdlog::level::debug, spdlog::level::debug, spdlog::level::debug,
            spdlog::level::debug, spdlog::level::debug, spdlog::level::debug
        };
    }

    Registry::init(cfg_.logging, cfg_.logDir());
    crypto::hash::ensureSodiumInit();

    Registry::termsync()->debug("[Context] Config {} ({}), root {}", configPath_.string(),
                                cfg_.source.empty() ? "defaults" : "loaded", cfg_.sync.config_root.string());

    items_ = sync::model::itemsFromConfig(cfg_.sync);
    pool_ = std::make_unique<concurrency::ThreadPool>(cfg_.sync.workers);
    hasher_ = std::make_unique<fs::Hasher>(cfg_.sync.config_root, pool_.get());
    backups_ = std::make_unique<backup::Manager>(cfg_.backupDir(), cfg_.sync.max_backups, *hasher_, items_);

    store_ = std::make_unique<sync::MetadataStore>(cfg_.metadataPath(), cfg_.sync.history_limit,
                                                   sync::MetadataStore::computeDeviceId());
    store_->load();

    // the config file wins, the metadata hint covers a config that lost its id
    auto cloudCfg = cfg_.cloud;
    if (cloudCfg.record_id.empty()) cloudCfg.record_id = store_->snapshot().record_id;

    transport_ = std::make_unique<cloud::Transport>(cloudCfg, cfg_.backupDir(), cloud::transport::makeChain(cloudCfg));
    transport_->onRecordCreated([this](const std::string& id) { recordCreated(id); });

    engine_ = std::make_unique<sync::Engine>(cfg_, items_, *hasher_, *backups_, *transport_, *store_, pool_.get());
}

Context::~Context() {
    engine_.reset();
    if (pool_) pool_->stop();
    Registry::shutdown();
}

void Context::recordCreated(const std::string& id) {
    cfg_.cloud.record_id = id;

    // the record already exists remotely, losing its id here would fork the configuration
    try {
        store_->setRecordId(id);
    } catch (const MetadataError& e) {
        Registry::termsync()->error("[Context] {}", e.what());
    }

    try {
        if (configPath_.has_parent_path()) std::filesystem::create_directories(configPath_.parent_path());
        config::persistRecordId(configPath_, id);
        Registry::termsync()->info("[Context] Record id {} saved to {}", id, configPath_.string());
    } catch (const std::exception& e) {
        Registry::termsync()->error("[Context] Could not save record id {} to {}: {}. Add it as cloud.record_id manually.",
                                    id, configPath_.string(), e.what());
    }
}

std::unique_ptr<ts::sync::Watcher> Context::makeWatcher() const {
    return std::make_unique<sync::Watcher>(*engine_,
                                           std::make_shared<sync::ProcProbe>(cfg_.monitoring.process_name),
                                           std::chrono::duration_cast<std::chrono::milliseconds>(cfg_.monitoring.interval));
}
