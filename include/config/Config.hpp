#pragma once

#include <chrono>
#include <filesystem>
#include <map>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

namespace ts::config {

constexpr static auto DEFAULT_API_BASE = "https://api.github.com/gists";
constexpr static auto DEFAULT_PRIMARY = "config.yaml";

struct CloudConfig {
    std::string api_base = DEFAULT_API_BASE;
    std::string token;
    std::string record_id;
    std::string primary_filename = DEFAULT_PRIMARY;
    std::string description = "Terminal configuration (termsync)";
    std::chrono::seconds timeout{30};
    std::string user_agent = "termsync/1.0";
    std::vector<std::string> mechanisms = {"libcurl", "curl-cli", "socket"};
};

struct ItemConfig {
    std::string path;                   // relative to config_root, trailing '/' marks a directory
    std::vector<std::string> exclude;   // appended to the global list
};

struct SyncConfig {
    std::filesystem::path config_root;
    std::string primary = DEFAULT_PRIMARY;
    std::vector<ItemConfig> items = {
        {"keymaps.yaml", {}},
        {"window-config.yaml", {}},
        {"profiles/", {}},
        {"plugins/", {}},
        {"themes/", {}},
    };
    std::vector<std::string> exclude = {"*.log", "*.tmp", "*.cache", "node_modules", ".gitkeep"};
    std::string conflict_strategy = "newest";
    std::map<std::string, std::string> keyed_lists = {{"profiles", "name"}};
    unsigned int max_backups = 10;
    std::filesystem::path backup_dir;   // empty -> <config_root>/backups
    std::string metadata_file = ".sync_metadata.json";
    unsigned int history_limit = 200;
    unsigned int workers = 4;
};

struct MonitoringConfig {
    bool enabled = true;
    std::string process_name = "tabby";
    std::chrono::seconds interval{5};
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum termsync = spdlog::level::info;   // Startup, shutdown, CLI entry points
    spdlog::level::level_enum hash     = spdlog::level::warn;   // Unreadable files skipped while fingerprinting
    spdlog::level::level_enum archive  = spdlog::level::warn;   // Rejected or failed archive entries
    spdlog::level::level_enum cloud    = spdlog::level::info;   // Mechanism failures, fallbacks, record creation
    spdlog::level::level_enum backup   = spdlog::level::info;   // Snapshots, pruning, restores
    spdlog::level::level_enum meta     = spdlog::level::warn;   // Corrupt metadata, persistence failures
    spdlog::level::level_enum sync     = spdlog::level::info;   // Classification and actions per cycle
    spdlog::level::level_enum merge    = spdlog::level::info;   // Structured merge decisions
    spdlog::level::level_enum watch    = spdlog::level::info;   // Process transitions
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::debug;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir;      // empty -> <config_root>/logs
    LogLevelsConfig levels;
};

struct Config {
    CloudConfig cloud;
    SyncConfig sync;
    MonitoringConfig monitoring;
    LoggingConfig logging;

    std::filesystem::path source;       // file this config was loaded from, empty if defaults

    [[nodiscard]] std::filesystem::path backupDir() const;
    [[nodiscard]] std::filesystem::path metadataPath() const;
    [[nodiscard]] std::filesystem::path logDir() const;

    void save(const std::filesystem::path& path) const;
};

std::filesystem::path defaultConfigPath();
std::filesystem::path defaultConfigRoot();

// Missing file -> defaults. Malformed file -> ConfigError. TERMSYNC_TOKEN overrides cloud.token.
Config loadConfig(const std::filesystem::path& path);

// Rewrites cloud.record_id in place, keeping every other key of the file.
void persistRecordId(const std::filesystem::path& path, const std::string& recordId);

}
