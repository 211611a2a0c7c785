#pragma once

#include <ctime>
#include <map>
#include <optional>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace ts::cloud::model {

struct RecordFile {
    std::string content;        // raw text, or base64 when `base64` is set
    bool base64 = false;
    bool truncated = false;
    std::string raw_url;
};

// The hosted text-blob record as returned by GET.
struct RemoteRecord {
    std::string id;
    std::optional<std::time_t> updated_at;
    std::map<std::string, RecordFile> files;
};

// Files to create, replace (value) or delete (nullopt) in one PATCH.
struct RecordPatch {
    std::string description;
    std::map<std::string, std::optional<RecordFile>> files;

    [[nodiscard]] bool empty() const { return files.empty(); }
};

// Files whose content is always transported base64-encoded.
[[nodiscard]] bool isBinaryName(const std::string& name);

void from_json(const nlohmann::json& j, RecordFile& f);
void from_json(const nlohmann::json& j, RemoteRecord& r);

// Request body for PATCH, or POST when `create` is set (deleted files are omitted on create).
nlohmann::json toRequestBody(const RecordPatch& patch, bool create);

}
