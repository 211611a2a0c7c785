#include "sync/model/SyncItem.hpp"
#include "config/Config.hpp"
#include "util/errors.hpp"

#include <set>

using namespace ts::sync::model;

namespace {

std::string normalizeName(std::string name, const std::string& original) {
    while (!name.empty() && name.back() == '/') name.pop_back();
    while (name.starts_with("./")) name.erase(0, 2);

    const std::filesystem::path p(name);
    if (name.empty() || p.is_absolute())
        throw ts::ConfigError("Invalid sync item path: '" + original + "'");

    for (const auto& part : p)
        if (part == "..") throw ts::ConfigError("Sync item escapes the config root: '" + original + "'");

    return name;
}

}

std::vector<SyncItem> ts::sync::model::itemsFromConfig(const config::SyncConfig& cfg) {
    std::vector<SyncItem> items;
    std::set<std::string> seen;

    SyncItem primary;
    primary.name = normalizeName(cfg.primary, cfg.primary);
    primary.kind = SyncItem::Kind::File;
    primary.exclude = cfg.exclude;
    primary.structured = true;
    seen.insert(primary.name);
    items.push_back(std::move(primary));

    for (const auto& ic : cfg.items) {
        SyncItem item;
        item.kind = ic.path.ends_with('/') ? SyncItem::Kind::Directory : SyncItem::Kind::File;
        item.name = normalizeName(ic.path, ic.path);
        item.exclude = cfg.exclude;
        item.exclude.insert(item.exclude.end(), ic.exclude.begin(), ic.exclude.end());

        if (!seen.insert(item.name).second)
            throw ConfigError("Duplicate sync item: '" + item.name + "'");

        items.push_back(std::move(item));
    }

    return items;
}
