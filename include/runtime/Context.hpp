#pragma once

#include "config/Config.hpp"
#include "sync/model/SyncItem.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <vector>

namespace ts::concurrency { class ThreadPool; }
namespace ts::fs { class Hasher; }
namespace ts::backup { class Manager; }
namespace ts::cloud { class Transport; }
namespace ts::sync { class Engine; class MetadataStore; class Watcher; }

namespace ts::runtime {

// Owns every long-lived component of one termsync invocation. Construction initialises libcurl,
// libsodium and logging; destruction stops the worker pool and drops the loggers.
class Context {
public:
    // Throws ts::ConfigError on an unusable configuration.
    explicit Context(std::filesystem::path configPath, bool debug = false);

    ~Context();

    Context(const Context&) = delete;
    Context& operator=(const Context&) = delete;

    [[nodiscard]] const config::Config& config() const { return cfg_; }
    [[nodiscard]] const std::filesystem::path& configPath() const { return configPath_; }

    [[nodiscard]] sync::Engine& engine() const { return *engine_; }
    [[nodiscard]] cloud::Transport& transport() const { return *transport_; }
    [[nodiscard]] backup::Manager& backups() const { return *backups_; }
    [[nodiscard]] sync::MetadataStore& store() const { return *store_; }

    // Watcher on the configured process name and interval, not started.
    [[nodiscard]] std::unique_ptr<sync::Watcher> makeWatcher() const;

private:
    struct CurlGlobal {
        CurlGlobal();
        ~CurlGlobal();
        CurlGlobal(const CurlGlobal&) = delete;
        CurlGlobal& operator=(const CurlGlobal&) = delete;
    };

    CurlGlobal curl_;
    std::filesystem::path configPath_;
    config::Config cfg_;
    std::vector<sync::model::SyncItem> items_;

    std::unique_ptr<concurrency::ThreadPool> pool_;
    std::unique_ptr<fs::Hasher> hasher_;
    std::unique_ptr<backup::Manager> backups_;
    std::unique_ptr<sync::MetadataStore> store_;
    std::unique_ptr<cloud::Transport> transport_;
    std::unique_ptr<sync::Engine> engine_;

    void recordCreated(const std::string& id);
};

}
