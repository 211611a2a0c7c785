#pragma once

#include "cloud/model/Record.hpp"
#include "cloud/transport/Mechanism.hpp"
#include "config/Config.hpp"

#include <ctime>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace ts::cloud {

enum class UploadStatus { Synced, OfflineSaved };

struct UploadOutcome {
    UploadStatus status{UploadStatus::Synced};
    std::string record_id;
    std::optional<std::time_t> updated_at;
    std::optional<std::filesystem::path> fallbackFile;
};

// ####################################################################################
// ############################ Hosted record transport ###############################
// ####################################################################################

class Transport {
public:
    using RecordCreatedFn = std::function<void(const std::string&)>;

    Transport(config::CloudConfig cfg,
              std::filesystem::path fallbackDir,
              std::vector<std::shared_ptr<transport::Mechanism>> chain);

    // nullopt when no record id is known or the store answers 404.
    // Throws ts::TransportError when every mechanism fails or the store rejects the request.
    std::optional<model::RemoteRecord> download();

    // Creates the record when no id is known yet. When every mechanism fails the request body is
    // parked in a fallback file and OfflineSaved is returned. Throws ts::TransportError if the store
    // rejects the request or the fallback file cannot be written.
    UploadOutcome upload(const model::RecordPatch& patch);

    [[nodiscard]] std::optional<std::time_t> probeRemoteTimestamp() noexcept;

    [[nodiscard]] std::string recordId() const;
    void setRecordId(const std::string& id);
    void onRecordCreated(RecordCreatedFn fn);

    [[nodiscard]] std::vector<std::string> mechanismNames() const;
    [[nodiscard]] const std::filesystem::path& fallbackDir() const { return fallbackDir_; }

    static constexpr auto FALLBACK_PREFIX = "fallback-";

private:
    config::CloudConfig cfg_;
    std::filesystem::path fallbackDir_;
    std::vector<std::shared_ptr<transport::Mechanism>> chain_;

    mutable std::mutex mutex_;
    std::string recordId_;
    RecordCreatedFn onRecordCreated_;

    transport::Response sendWithFallback(const transport::Request& req) const;
    [[nodiscard]] transport::Request makeRequest(const std::string& method, const std::string& url,
                                                 std::string body = {}, bool json = true) const;
    [[nodiscard]] std::string recordUrl(const std::string& id) const;

    void resolveTruncated(model::RemoteRecord& record) const;
    UploadOutcome adoptResponse(const transport::Response& resp, bool created);
    std::filesystem::path writeFallback(const nlohmann::json& body, const std::string& method, const std::string& id) const;
};

}
