#include "backup/model/Entry.hpp"

#include <nlohmann/json.hpp>

using namespace ts::backup::model;

void ts::backup::model::to_json(nlohmann::json& j, const Entry& e) {
    j = {
        {"id", e.id},
        {"item", e.item},
        {"directory", e.directory},
        {"structured", e.structured},
        {"absent", e.absent},
        {"captured_at_ms", e.captured_at_ms},
        {"fingerprint", e.fingerprint ? nlohmann::json(*e.fingerprint) : nlohmann::json(nullptr)},
        {"reason", e.reason}
    };
}

void ts::backup::model::from_json(const nlohmann::json& j, Entry& e) {
    e.id = j.at("id").get<std::string>();
    e.item = j.at("item").get<std::string>();
    e.directory = j.value("directory", false);
    e.structured = j.value("structured", false);
    e.absent = j.value("absent", false);
    e.captured_at_ms = j.at("captured_at_ms").get<int64_t>();
    if (j.contains("fingerprint") && !j.at("fingerprint").is_null()) e.fingerprint = j.at("fingerprint").get<std::string>();
    else e.fingerprint.reset();
    e.reason = j.value("reason", "");
}
