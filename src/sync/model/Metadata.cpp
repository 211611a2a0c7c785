#include "sync/model/Metadata.hpp"
#include "util/timestamp.hpp"

#include <algorithm>
#include <stdexcept>
#include <nlohmann/json.hpp>

using namespace ts::sync::model;
using namespace ts::util;

namespace {

nlohmann::json optionalToJson(const std::optional<Fingerprint>& fp) {
    if (!fp) return nullptr;
    return *fp;
}

std::optional<Fingerprint> optionalFromJson(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null()) return std::nullopt;
    return j.at(key).get<std::string>();
}

std::time_t timeFromJson(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null()) return 0;
    const auto parsed = parseTimestampFromString(j.at(key).get<std::string>());
    if (!parsed) throw std::invalid_argument(std::string("Invalid timestamp in field '") + key + "'");
    return *parsed;
}

nlohmann::json timeToJson(const std::time_t t) {
    if (t == 0) return nullptr;
    return timestampToString(t);
}

}

std::time_t SyncMetadata::lastSync() const {
    std::time_t latest = 0;
    for (const auto& [_, t] : targets) latest = std::max(latest, t.last_sync);
    return latest;
}

void ts::sync::model::to_json(nlohmann::json& j, const HistoryEntry& h) {
    j = {
        {"time", timestampToString(h.time)},
        {"action", h.action},
        {"device_id", h.device_id},
        {"item", h.item}
    };
}

void ts::sync::model::from_json(const nlohmann::json& j, HistoryEntry& h) {
    h.time = timeFromJson(j, "time");
    h.action = j.at("action").get<std::string>();
    h.device_id = j.value("device_id", "");
    h.item = j.value("item", "");
}

void ts::sync::model::to_json(nlohmann::json& j, const TargetState& t) {
    j = {
        {"last_local", optionalToJson(t.last_local)},
        {"last_remote", optionalToJson(t.last_remote)},
        {"last_sync", timeToJson(t.last_sync)},
        {"history", t.history}
    };
}

void ts::sync::model::from_json(const nlohmann::json& j, TargetState& t) {
    t.last_local = optionalFromJson(j, "last_local");
    t.last_remote = optionalFromJson(j, "last_remote");
    t.last_sync = timeFromJson(j, "last_sync");
    t.history = j.value("history", std::vector<HistoryEntry>{});
}

void ts::sync::model::to_json(nlohmann::json& j, const SyncMetadata& m) {
    j = {
        {"version", 1},
        {"device_id", m.device_id},
        {"record_id", m.record_id},
        {"targets", m.targets}
    };
}

void ts::sync::model::from_json(const nlohmann::json& j, SyncMetadata& m) {
    if (!j.is_object()) throw std::invalid_argument("Sync metadata must be a JSON object");
    m.device_id = j.value("device_id", "");
    m.record_id = j.value("record_id", "");
    m.targets = j.value("targets", std::map<std::string, TargetState>{});
}
