#include "sync/RecordLayout.hpp"
#include "crypto/util/encode.hpp"
#include "fs/Hasher.hpp"
#include "log/Registry.hpp"
#include "util/errors.hpp"
#include "util/files.hpp"
#include "util/timestamp.hpp"

#include <nlohmann/json.hpp>

using namespace ts::sync;
using namespace ts::sync::model;
using namespace ts::cloud::model;
using namespace ts::log;

std::string RecordLayout::containerName(const SyncItem& item) {
    return "termsync-" + util::slugify(item.name) + ".zip";
}

std::string RecordLayout::fileName(const SyncItem& item, const std::string& primaryFilename) {
    return item.structured ? primaryFilename : containerName(item);
}

namespace {

std::map<std::string, Fingerprint> parseManifest(const RecordFile& file, std::string& deviceId) {
    const auto j = nlohmann::json::parse(file.content);
    if (!j.is_object()) throw ts::IntegrityError("Manifest is not a JSON object");

    const auto version = j.value("version", 0);
    if (version != RecordLayout::MANIFEST_VERSION)
        throw ts::IntegrityError("Unsupported manifest version " + std::to_string(version));

    deviceId = j.value("device_id", "");
    std::map<std::string, Fingerprint> out;
    if (j.contains("items") && j.at("items").is_object())
        for (const auto& [name, fp] : j.at("items").items())
            if (fp.is_string()) out.emplace(name, fp.get<std::string>());
    return out;
}

}

RemoteSnapshot RecordLayout::toSnapshot(const std::optional<RemoteRecord>& record,
                                        const std::vector<SyncItem>& items,
                                        const std::string& primaryFilename,
                                        const bool lenient) {
    RemoteSnapshot snap;
    if (!record) return snap;

    snap.exists = true;
    snap.record_id = record->id;
    snap.updated_at = record->updated_at;

    if (const auto it = record->files.find(MANIFEST_NAME); it != record->files.end()) {
        try {
            snap.manifest = parseManifest(it->second, snap.device_id);
        } catch (const nlohmann::json::exception& e) {
            if (!lenient) throw IntegrityError(std::string("Corrupt manifest in hosted record: ") + e.what());
            Registry::sync()->warn("[RecordLayout] Ignoring corrupt manifest: {}", e.what());
        } catch (const IntegrityError& e) {
            if (!lenient) throw;
            Registry::sync()->warn("[RecordLayout] Ignoring manifest: {}", e.what());
        }
    }

    for (const auto& item : items) {
        const auto name = fileName(item, primaryFilename);
        const auto it = record->files.find(name);
        if (it == record->files.end()) continue;

        RemoteItem ri;
        if (item.structured) {
            ri.content.assign(it->second.content.begin(), it->second.content.end());
            ri.fingerprint = fs::Hasher::digest(it->second.content);
        } else {
            try {
                ri.content = it->second.base64 ? crypto::encode::fromBase64(it->second.content)
                                               : util::Blob(it->second.content.begin(), it->second.content.end());
            } catch (const IntegrityError& e) {
                if (!lenient) throw IntegrityError("Container " + name + " is not valid base64: " + e.what());
                Registry::sync()->warn("[RecordLayout] Treating damaged container {} as absent: {}", name, e.what());
                continue;
            }

            const auto mf = snap.manifest.find(item.name);
            ri.fingerprint = mf != snap.manifest.end() ? mf->second : fs::Hasher::digest(ri.content);
        }

        snap.items.emplace(item.name, std::move(ri));
    }

    return snap;
}

RecordFile RecordLayout::manifestFile(const std::string& deviceId, const std::map<std::string, Fingerprint>& items) {
    const nlohmann::json j = {
        {"version", MANIFEST_VERSION},
        {"device_id", deviceId},
        {"updated_at", util::getCurrentTimestamp()},
        {"items", items}
    };

    RecordFile file;
    file.content = j.dump(2);
    return file;
}
