#pragma once

#include <ctime>
#include <optional>
#include <string>

namespace ts::sync::model {

enum class ConflictStrategy {
    Newest,
    Oldest,
    Local,
    Cloud,
    Merge,
    Manual
};

enum class Side { Local, Remote };

std::string to_string(ConflictStrategy s);
std::string to_string(Side s);

// Throws ts::ConfigError on an unknown name.
ConflictStrategy conflictStrategyFromString(const std::string& str);

// Picks the winning side of a whole-value conflict. A missing timestamp or a tie goes to local.
// Manual has no automatic winner and yields nullopt.
std::optional<Side> pickSide(ConflictStrategy s,
                             std::optional<std::time_t> localMtime,
                             std::optional<std::time_t> remoteUpdatedAt);

}
