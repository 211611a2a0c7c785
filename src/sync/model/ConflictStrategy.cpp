#include "sync/model/ConflictStrategy.hpp"
#include "util/errors.hpp"

using namespace ts::sync::model;

std::string ts::sync::model::to_string(const ConflictStrategy s) {
    switch (s) {
    case ConflictStrategy::Newest: return "newest";
    case ConflictStrategy::Oldest: return "oldest";
    case ConflictStrategy::Local: return "local";
    case ConflictStrategy::Cloud: return "cloud";
    case ConflictStrategy::Merge: return "merge";
    case ConflictStrategy::Manual: return "manual";
    }
    throw std::invalid_argument("Unknown conflict strategy");
}

std::string ts::sync::model::to_string(const Side s) {
    return s == Side::Local ? "local" : "remote";
}

ConflictStrategy ts::sync::model::conflictStrategyFromString(const std::string& str) {
    if (str == "newest") return ConflictStrategy::Newest;
    if (str == "oldest") return ConflictStrategy::Oldest;
    if (str == "local") return ConflictStrategy::Local;
    if (str == "cloud") return ConflictStrategy::Cloud;
    if (str == "merge") return ConflictStrategy::Merge;
    if (str == "manual") return ConflictStrategy::Manual;
    throw ConfigError("Unknown conflict strategy: " + str);
}

std::optional<Side> ts::sync::model::pickSide(const ConflictStrategy s,
                                              const std::optional<std::time_t> localMtime,
                                              const std::optional<std::time_t> remoteUpdatedAt) {
    switch (s) {
    case ConflictStrategy::Local:
    case ConflictStrategy::Merge:
        return Side::Local;
    case ConflictStrategy::Cloud:
        return Side::Remote;
    case ConflictStrategy::Manual:
        return std::nullopt;
    case ConflictStrategy::Newest:
    case ConflictStrategy::Oldest:
        if (!localMtime || !remoteUpdatedAt || *localMtime == *remoteUpdatedAt) return Side::Local;
        if (s == ConflictStrategy::Newest) return *remoteUpdatedAt > *localMtime ? Side::Remote : Side::Local;
        return *remoteUpdatedAt < *localMtime ? Side::Remote : Side::Local;
    }
    return Side::Local;
}
