#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace ts::config {
struct SyncConfig;
}

namespace ts::sync::model {

struct SyncItem {
    enum class Kind { File, Directory };

    std::string name;                   // relative to the config root, generic form, no trailing '/'
    Kind kind{Kind::File};
    std::vector<std::string> exclude;   // effective list, global patterns first
    bool structured = false;            // the primary document

    [[nodiscard]] bool isDirectory() const { return kind == Kind::Directory; }
    [[nodiscard]] std::filesystem::path pathUnder(const std::filesystem::path& root) const { return root / name; }
};

// Primary document first, then auxiliary items in configured order. Throws ConfigError on
// duplicate names or names escaping the root.
std::vector<SyncItem> itemsFromConfig(const config::SyncConfig& cfg);

}
