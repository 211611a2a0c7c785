#pragma once

#include "config/Config.hpp"
#include "config/util.hpp"

#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace ts::config;

template<>
struct convert<CloudConfig> {
    static Node encode(const CloudConfig& rhs) {
        Node node;
        node["api_base"] = rhs.api_base;
        node["token"] = rhs.token;
        node["record_id"] = rhs.record_id;
        node["primary_filename"] = rhs.primary_filename;
        node["description"] = rhs.description;
        node["timeout"] = secondsToString(rhs.timeout);
        node["user_agent"] = rhs.user_agent;
        node["mechanisms"] = rhs.mechanisms;
        return node;
    }

    static bool decode(const Node& node, CloudConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.api_base = node["api_base"].as<std::string>(rhs.api_base);
        rhs.token = node["token"].as<std::string>(rhs.token);
        rhs.record_id = node["record_id"].as<std::string>(rhs.record_id);
        rhs.primary_filename = node["primary_filename"].as<std::string>(rhs.primary_filename);
        rhs.description = node["description"].as<std::string>(rhs.description);
        if (node["timeout"]) rhs.timeout = parseSeconds(node["timeout"].as<std::string>());
        rhs.user_agent = node["user_agent"].as<std::string>(rhs.user_agent);
        rhs.mechanisms = node["mechanisms"].as<std::vector<std::string>>(rhs.mechanisms);
        return true;
    }
};

// An item is either a bare path or {path, exclude}.
template<>
struct convert<ItemConfig> {
    static Node encode(const ItemConfig& rhs) {
        if (rhs.exclude.empty()) return Node(rhs.path);
        Node node;
        node["path"] = rhs.path;
        node["exclude"] = rhs.exclude;
        return node;
    }

    static bool decode(const Node& node, ItemConfig& rhs) {
        if (node.IsScalar()) {
            rhs.path = node.as<std::string>();
            rhs.exclude.clear();
            return true;
        }
        if (!node.IsMap() || !node["path"]) return false;
        rhs.path = node["path"].as<std::string>();
        rhs.exclude = node["exclude"].as<std::vector<std::string>>(std::vector<std::string>{});
        return true;
    }
};

template<>
struct convert<SyncConfig> {
    static Node encode(const SyncConfig& rhs) {
        Node node;
        node["config_root"] = rhs.config_root.string();
        node["primary"] = rhs.primary;
        node["items"] = rhs.items;
        node["exclude"] = rhs.exclude;
        node["conflict_strategy"] = rhs.conflict_strategy;
        node["keyed_lists"] = rhs.keyed_lists;
        node["max_backups"] = rhs.max_backups;
        node["backup_dir"] = rhs.backup_dir.string();
        node["metadata_file"] = rhs.metadata_file;
        node["history_limit"] = rhs.history_limit;
        node["workers"] = rhs.workers;
        return node;
    }

    static bool decode(const Node& node, SyncConfig& rhs) {
        if (!node.IsMap()) return false;
        if (node["config_root"]) rhs.config_root = node["config_root"].as<std::string>();
        rhs.primary = node["primary"].as<std::string>(rhs.primary);
        if (node["items"]) rhs.items = node["items"].as<std::vector<ItemConfig>>();
        rhs.exclude = node["exclude"].as<std::vector<std::string>>(rhs.exclude);
        rhs.conflict_strategy = node["conflict_strategy"].as<std::string>(rhs.conflict_strategy);
        if (node["keyed_lists"]) rhs.keyed_lists = node["keyed_lists"].as<std::map<std::string, std::string>>();
        rhs.max_backups = node["max_backups"].as<unsigned int>(rhs.max_backups);
        if (node["backup_dir"]) rhs.backup_dir = node["backup_dir"].as<std::string>();
        rhs.metadata_file = node["metadata_file"].as<std::string>(rhs.metadata_file);
        rhs.history_limit = node["history_limit"].as<unsigned int>(rhs.history_limit);
        rhs.workers = node["workers"].as<unsigned int>(rhs.workers);
        return true;
    }
};

template<>
struct convert<MonitoringConfig> {
    static Node encode(const MonitoringConfig& rhs) {
        Node node;
        node["enabled"] = rhs.enabled;
        node["process_name"] = rhs.process_name;
        node["interval"] = secondsToString(rhs.interval);
        return node;
    }

    static bool decode(const Node& node, MonitoringConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.enabled = node["enabled"].as<bool>(rhs.enabled);
        rhs.process_name = node["process_name"].as<std::string>(rhs.process_name);
        if (node["interval"]) rhs.interval = parseSeconds(node["interval"].as<std::string>());
        return true;
    }
};

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["termsync"] = to_std_string(spdlog::level::to_string_view(rhs.termsync));
        node["hash"]     = to_std_string(spdlog::level::to_string_view(rhs.hash));
        node["archive"]  = to_std_string(spdlog::level::to_string_view(rhs.archive));
        node["cloud"]    = to_std_string(spdlog::level::to_string_view(rhs.cloud));
        node["backup"]   = to_std_string(spdlog::level::to_string_view(rhs.backup));
        node["meta"]     = to_std_string(spdlog::level::to_string_view(rhs.meta));
        node["sync"]     = to_std_string(spdlog::level::to_string_view(rhs.sync));
        node["merge"]    = to_std_string(spdlog::level::to_string_view(rhs.merge));
        node["watch"]    = to_std_string(spdlog::level::to_string_view(rhs.watch));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.termsync = spdlog::level::from_str(node["termsync"].as<std::string>("info"));
        rhs.hash = spdlog::level::from_str(node["hash"].as<std::string>("warn"));
        rhs.archive = spdlog::level::from_str(node["archive"].as<std::string>("warn"));
        rhs.cloud = spdlog::level::from_str(node["cloud"].as<std::string>("info"));
        rhs.backup = spdlog::level::from_str(node["backup"].as<std::string>("info"));
        rhs.meta = spdlog::level::from_str(node["meta"].as<std::string>("warn"));
        rhs.sync = spdlog::level::from_str(node["sync"].as<std::string>("info"));
        rhs.merge = spdlog::level::from_str(node["merge"].as<std::string>("info"));
        rhs.watch = spdlog::level::from_str(node["watch"].as<std::string>("info"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("debug"));
        if (node["subsystem_levels"]) rhs.subsystem_levels = node["subsystem_levels"].as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["log_levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        if (node["log_dir"]) rhs.log_dir = node["log_dir"].as<std::string>();
        if (node["log_levels"]) rhs.levels = node["log_levels"].as<LogLevelsConfig>();
        return true;
    }
};

}
