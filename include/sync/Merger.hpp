#pragma once

#include "sync/model/ConflictStrategy.hpp"
#include "sync/model/Metadata.hpp"

#include <ctime>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace YAML {
class Node;
}

namespace ts::sync {

struct MergeDecision {
    std::string path;       // e.g. "appearance.font" or "profiles[name=ssh].host"
    model::Side winner{model::Side::Local};
};

struct MergeResult {
    std::string text;
    model::Fingerprint fingerprint;
    std::vector<MergeDecision> decisions;
};

// ####################################################################################
// ############################ Structured document merge #############################
// ####################################################################################

// Mappings merge recursively and keep one-sided keys. Sequences stored under a configured keyed
// section merge entry by entry on their identifier field, local order first. Every other
// differing value is settled as a whole by the conflict strategy.
class Merger {
public:
    // keyedLists: section name -> identifier field, e.g. {"profiles", "name"}.
    Merger(model::ConflictStrategy strategy, std::map<std::string, std::string> keyedLists);

    // Throws ts::ParseError when either side is not a YAML mapping.
    [[nodiscard]] MergeResult merge(std::string_view local,
                                    std::string_view remote,
                                    std::optional<std::time_t> localMtime,
                                    std::optional<std::time_t> remoteUpdatedAt) const;

    // Re-emits a document with sorted keys. Throws ts::ParseError.
    [[nodiscard]] static std::string canonical(std::string_view doc);

private:
    model::ConflictStrategy strategy_;
    std::map<std::string, std::string> keyedLists_;

    struct Pass {
        model::Side winner;
        std::vector<MergeDecision>* decisions;
    };

    YAML::Node mergeNodes(const YAML::Node& l, const YAML::Node& r, const std::string& path, const Pass& pass) const;
    YAML::Node mergeMaps(const YAML::Node& l, const YAML::Node& r, const std::string& path, const Pass& pass) const;
    YAML::Node mergeKeyedList(const YAML::Node& l, const YAML::Node& r, const std::string& section,
                              const std::string& key, const std::string& path, const Pass& pass) const;
};

}
