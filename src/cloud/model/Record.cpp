#include "cloud/model/Record.hpp"
#include "util/timestamp.hpp"

#include <nlohmann/json.hpp>

using namespace ts::cloud::model;

bool ts::cloud::model::isBinaryName(const std::string& name) {
    return name.ends_with(".zip");
}

void ts::cloud::model::from_json(const nlohmann::json& j, RecordFile& f) {
    f.content = j.contains("content") && j.at("content").is_string() ? j.at("content").get<std::string>() : "";
    f.base64 = j.value("encoding", "") == "base64";
    f.truncated = j.value("truncated", false);
    f.raw_url = j.contains("raw_url") && j.at("raw_url").is_string() ? j.at("raw_url").get<std::string>() : "";
}

void ts::cloud::model::from_json(const nlohmann::json& j, RemoteRecord& r) {
    r.id = j.at("id").get<std::string>();

    r.updated_at.reset();
    if (j.contains("updated_at") && j.at("updated_at").is_string())
        r.updated_at = util::parseTimestampFromString(j.at("updated_at").get<std::string>());

    r.files.clear();
    if (j.contains("files") && j.at("files").is_object()) {
        for (const auto& [name, file] : j.at("files").items()) {
            if (file.is_null()) continue;
            auto rf = file.get<RecordFile>();
            if (isBinaryName(name)) rf.base64 = true;
            r.files.emplace(name, std::move(rf));
        }
    }
}

nlohmann::json ts::cloud::model::toRequestBody(const RecordPatch& patch, const bool create) {
    nlohmann::json files = nlohmann::json::object();

    for (const auto& [name, file] : patch.files) {
        if (!file) {
            if (!create) files[name] = nullptr;
            continue;
        }

        nlohmann::json entry = {{"content", file->content}};
        if (file->base64) entry["encoding"] = "base64";
        files[name] = std::move(entry);
    }

    nlohmann::json body = {{"files", std::move(files)}};
    if (!patch.description.empty()) body["description"] = patch.description;
    if (create) body["public"] = false;
    return body;
}
