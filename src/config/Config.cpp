#include "config/Config.hpp"
#include "config/config_yaml.hpp"
#include "util/errors.hpp"
#include "util/files.hpp"

#include <cstdlib>
#include <yaml-cpp/yaml.h>
#include <fstream>
#include <type_traits>

namespace ts::config {

namespace fs = std::filesystem;

static fs::path homeDir() {
    if (const char* home = std::getenv("HOME"); home && *home) return home;
    throw ConfigError("HOME is not set, cannot resolve default paths");
}

fs::path defaultConfigPath() {
    if (const char* env = std::getenv("TERMSYNC_CONFIG"); env && *env) return env;
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) return fs::path(xdg) / "termsync" / "config.yaml";
    return homeDir() / ".config" / "termsync" / "config.yaml";
}

fs::path defaultConfigRoot() {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) return fs::path(xdg) / "tabby";
    return homeDir() / ".config" / "tabby";
}

fs::path Config::backupDir() const {
    if (!sync.backup_dir.empty()) return sync.backup_dir;
    return sync.config_root / "backups";
}

fs::path Config::metadataPath() const {
    return sync.config_root / sync.metadata_file;
}

fs::path Config::logDir() const {
    if (!logging.log_dir.empty()) return logging.log_dir;
    return sync.config_root / "logs";
}

Config loadConfig(const fs::path& path) {
    Config cfg;
    cfg.sync.config_root = defaultConfigRoot();

    if (fs::exists(path)) {
        try {
            const YAML::Node root = YAML::LoadFile(path.string());
            if (root && !root.IsNull() && !root.IsMap())
                throw ConfigError("Top level of " + path.string() + " must be a mapping");

            const auto section = [&](const char* name, auto& out) {
                const auto node = root[name];
                if (!node) return;
                if (!YAML::convert<std::decay_t<decltype(out)>>::decode(node, out))
                    throw ConfigError(std::string("Section '") + name + "' of " + path.string() + " must be a mapping");
            };

            section("cloud", cfg.cloud);
            section("sync", cfg.sync);
            section("monitoring", cfg.monitoring);
            section("logging", cfg.logging);
        } catch (const ConfigError&) {
            throw;
        } catch (const std::exception& e) {
            throw ConfigError("Failed to load config " + path.string() + ": " + e.what());
        }
        cfg.source = path;
    }

    if (const char* token = std::getenv("TERMSYNC_TOKEN"); token && *token) cfg.cloud.token = token;

    if (cfg.sync.primary.empty()) throw ConfigError("sync.primary must name the primary document");
    if (cfg.sync.max_backups == 0) throw ConfigError("sync.max_backups must be at least 1");
    if (cfg.sync.workers == 0) cfg.sync.workers = 1;

    return cfg;
}

void Config::save(const fs::path& path) const {
    YAML::Node root;
    root["cloud"] = cloud;
    root["sync"] = sync;
    root["monitoring"] = monitoring;
    root["logging"] = logging;

    YAML::Emitter out;
    out << root;
    if (!out.good()) throw ConfigError("Failed to emit config: " + out.GetLastError());

    try {
        util::writeFileAtomic(path, std::string(out.c_str()) + "\n");
    } catch (const std::exception& e) {
        throw ConfigError("Failed to write config " + path.string() + ": " + e.what());
    }
}

void persistRecordId(const fs::path& path, const std::string& recordId) {
    YAML::Node root;
    try {
        if (fs::exists(path)) root = YAML::LoadFile(path.string());
    } catch (const std::exception& e) {
        throw ConfigError("Failed to read config " + path.string() + ": " + e.what());
    }

    if (!root || root.IsNull()) root = YAML::Node(YAML::NodeType::Map);
    if (!root["cloud"] || !root["cloud"].IsMap()) root["cloud"] = YAML::Node(YAML::NodeType::Map);
    root["cloud"]["record_id"] = recordId;

    YAML::Emitter out;
    out << root;

    try {
        util::writeFileAtomic(path, std::string(out.c_str()) + "\n");
    } catch (const std::exception& e) {
        throw ConfigError("Failed to persist record id to " + path.string() + ": " + e.what());
    }
}

}
