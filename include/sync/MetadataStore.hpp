#pragma once

#include "sync/model/Metadata.hpp"

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>

namespace ts::sync {

// Per-item reconciliation state for one config root, persisted as JSON beside the config.
class MetadataStore {
public:
    MetadataStore(std::filesystem::path file, unsigned int historyLimit, std::string deviceId);

    // Missing file -> fresh record. A corrupt file is moved aside to <file>.corrupt-<stamp>
    // and treated as "no prior state".
    void load();

    [[nodiscard]] std::optional<model::TargetState> get(const std::string& item) const;

    // Records the fingerprints both sides agree on after `action`, appends a history entry and
    // persists. Throws ts::MetadataError when the record cannot be written; memory is left as it was.
    void commit(const std::string& item,
                const std::optional<model::Fingerprint>& local,
                const std::optional<model::Fingerprint>& remote,
                const std::string& action);

    // Remembers the hosted record id as a hint for the next run. Persists.
    void setRecordId(const std::string& id);

    [[nodiscard]] model::SyncMetadata snapshot() const;
    [[nodiscard]] const std::string& deviceId() const { return deviceId_; }
    [[nodiscard]] const std::filesystem::path& file() const { return file_; }

    // BLAKE2b-128 over hostname, machine architecture and /etc/machine-id when readable.
    static std::string computeDeviceId();

private:
    std::filesystem::path file_;
    unsigned int historyLimit_;
    std::string deviceId_;

    mutable std::mutex mutex_;
    model::SyncMetadata meta_;

    void persist(const model::SyncMetadata& meta) const;
};

}
