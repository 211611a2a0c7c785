#pragma once

#include "cloud/model/Record.hpp"
#include "sync/model/RemoteSnapshot.hpp"
#include "sync/model/SyncItem.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace ts::sync {

// Maps sync items onto the files of the hosted record:
//   <primary filename>          primary document text
//   termsync-manifest.json      {"version":1, "device_id", "updated_at", "items": {name: fingerprint}}
//   termsync-<slug>.zip         base64 zip of one auxiliary item
struct RecordLayout {
    static constexpr auto MANIFEST_NAME = "termsync-manifest.json";
    static constexpr int MANIFEST_VERSION = 1;

    [[nodiscard]] static std::string containerName(const model::SyncItem& item);

    // Name of the record file that carries `item`.
    [[nodiscard]] static std::string fileName(const model::SyncItem& item, const std::string& primaryFilename);

    // Decodes containers and attaches fingerprints. The manifest fingerprint is used for auxiliary
    // items when present, otherwise the digest of the container bytes.
    // Throws ts::IntegrityError on undecodable base64 or manifest when `lenient` is unset; with it,
    // the damaged item is treated as absent.
    static model::RemoteSnapshot toSnapshot(const std::optional<cloud::model::RemoteRecord>& record,
                                            const std::vector<model::SyncItem>& items,
                                            const std::string& primaryFilename,
                                            bool lenient = false);

    static cloud::model::RecordFile manifestFile(const std::string& deviceId,
                                                 const std::map<std::string, model::Fingerprint>& items);
};

}
