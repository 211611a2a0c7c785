#include "cloud/Transport.hpp"
#include "log/Registry.hpp"
#include "util/errors.hpp"
#include "util/files.hpp"
#include "util/timestamp.hpp"

#include <nlohmann/json.hpp>

using namespace ts::cloud;
using namespace ts::cloud::model;
using namespace ts::cloud::transport;
using namespace ts::log;
using namespace ts::util;

Transport::Transport(config::CloudConfig cfg,
                     std::filesystem::path fallbackDir,
                     std::vector<std::shared_ptr<Mechanism>> chain)
    : cfg_(std::move(cfg)),
      fallbackDir_(std::move(fallbackDir)),
      chain_(std::move(chain)),
      recordId_(cfg_.record_id) {
    if (chain_.empty()) throw ConfigError("Transport needs at least one delivery mechanism");
    while (!cfg_.api_base.empty() && cfg_.api_base.back() == '/') cfg_.api_base.pop_back();
}

std::string Transport::recordId() const {
    std::scoped_lock lock(mutex_);
    return recordId_;
}

void Transport::setRecordId(const std::string& id) {
    std::scoped_lock lock(mutex_);
    recordId_ = id;
}

void Transport::onRecordCreated(RecordCreatedFn fn) {
    std::scoped_lock lock(mutex_);
    onRecordCreated_ = std::move(fn);
}

std::vector<std::string> Transport::mechanismNames() const {
    std::vector<std::string> names;
    for (const auto& m : chain_) names.push_back(m->name());
    return names;
}

std::string Transport::recordUrl(const std::string& id) const {
    return cfg_.api_base + "/" + id;
}

Request Transport::makeRequest(const std::string& method, const std::string& url, std::string body, const bool json) const {
    Request req;
    req.method = method;
    req.url = url;
    req.body = std::move(body);
    req.timeout = cfg_.timeout;
    if (json) req.headers.emplace_back("Accept", "application/vnd.github+json");
    if (!cfg_.token.empty()) req.headers.emplace_back("Authorization", "Bearer " + cfg_.token);
    req.headers.emplace_back("User-Agent", cfg_.user_agent);
    return req;
}

Response Transport::sendWithFallback(const Request& req) const {
    std::string failures;

    for (const auto& mechanism : chain_) {
        try {
            auto resp = mechanism->send(req);

            if (resp.serverError()) {
                Registry::cloud()->warn("[Transport] {} {} via {} answered {}", req.method, req.url, mechanism->name(), resp.status);
                failures += mechanism->name() + ": HTTP " + std::to_string(resp.status) + "; ";
                continue;
            }

            if (mechanism != chain_.front())
                Registry::cloud()->info("[Transport] {} {} served by fallback mechanism {}", req.method, req.url, mechanism->name());

            return resp;
        } catch (const std::exception& e) {
            Registry::cloud()->warn("[Transport] {} {} via {} failed: {}", req.method, req.url, mechanism->name(), e.what());
            failures += mechanism->name() + ": " + e.what() + "; ";
        }
    }

    throw TransportError("All transport mechanisms failed for " + req.method + " " + req.url + " (" + failures + ")");
}

void Transport::resolveTruncated(RemoteRecord& record) const {
    for (auto& [name, file] : record.files) {
        if (!file.truncated) continue;
        if (file.raw_url.empty()) throw TransportError("File " + name + " is truncated and has no raw_url");

        const auto resp = sendWithFallback(makeRequest("GET", file.raw_url, {}, false));
        if (!resp.ok()) throw TransportError("Fetching raw content of " + name + " failed with HTTP " + std::to_string(resp.status));

        file.content = resp.body;
        file.truncated = false;
    }
}

std::optional<RemoteRecord> Transport::download() {
    const auto id = recordId();
    if (id.empty()) return std::nullopt;

    const auto resp = sendWithFallback(makeRequest("GET", recordUrl(id)));

    if (resp.status == 404) {
        Registry::cloud()->warn("[Transport] Record {} not found on the hosted store", id);
        return std::nullopt;
    }
    if (!resp.ok()) throw TransportError("Hosted store rejected GET with HTTP " + std::to_string(resp.status) + ": " + resp.body);

    RemoteRecord record;
    try {
        record = nlohmann::json::parse(resp.body).get<RemoteRecord>();
    } catch (const nlohmann::json::exception& e) {
        throw TransportError(std::string("Malformed record response: ") + e.what());
    }

    resolveTruncated(record);

    Registry::cloud()->debug("[Transport] Downloaded record {} ({} files)", record.id, record.files.size());
    return record;
}

UploadOutcome Transport::adoptResponse(const Response& resp, const bool created) {
    UploadOutcome out;
    out.status = UploadStatus::Synced;

    try {
        const auto j = nlohmann::json::parse(resp.body);
        out.record_id = j.value("id", "");
        if (j.contains("updated_at") && j.at("updated_at").is_string())
            out.updated_at = parseTimestampFromString(j.at("updated_at").get<std::string>());
    } catch (const nlohmann::json::exception& e) {
        if (created) throw TransportError(std::string("Record created but the response is unreadable: ") + e.what());
        Registry::cloud()->warn("[Transport] Unreadable PATCH response: {}", e.what());
    }

    if (!created) {
        if (out.record_id.empty()) out.record_id = recordId();
        return out;
    }

    if (out.record_id.empty()) throw TransportError("Record created but the response carries no id");

    RecordCreatedFn callback;
    {
        std::scoped_lock lock(mutex_);
        recordId_ = out.record_id;
        callback = onRecordCreated_;
    }

    Registry::cloud()->info("[Transport] Created record {}", out.record_id);
    Registry::audit()->info("[Transport] record created id={}", out.record_id);
    if (callback) callback(out.record_id);
    return out;
}

UploadOutcome Transport::upload(const RecordPatch& patch) {
    const auto id = recordId();

    if (patch.empty()) {
        UploadOutcome out;
        out.record_id = id;
        return out;
    }

    bool create = id.empty();
    auto body = toRequestBody(patch, create);
    std::string method = create ? "POST" : "PATCH";

    // nullopt: the store was unreachable through every mechanism
    const auto attempt = [this](const Request& req) -> std::optional<Response> {
        try {
            return sendWithFallback(req);
        } catch (const TransportError& e) {
            Registry::cloud()->error("[Transport] {}", e.what());
            return std::nullopt;
        }
    };

    auto resp = attempt(makeRequest(method, create ? cfg_.api_base : recordUrl(id), body.dump()));

    if (resp && !create && resp->status == 404) {
        Registry::cloud()->warn("[Transport] Record {} vanished, creating a new one", id);
        create = true;
        method = "POST";
        body = toRequestBody(patch, true);
        resp = attempt(makeRequest(method, cfg_.api_base, body.dump()));
    }

    if (!resp) {
        UploadOutcome out;
        out.status = UploadStatus::OfflineSaved;
        out.record_id = id;
        out.fallbackFile = writeFallback(body, method, create ? "" : id);
        Registry::cloud()->warn("[Transport] Store unreachable, payload saved to {}", out.fallbackFile->string());
        return out;
    }

    if (!resp->ok())
        throw TransportError("Hosted store rejected " + method + " with HTTP " + std::to_string(resp->status) + ": " + resp->body);

    return adoptResponse(*resp, create);
}

std::optional<std::time_t> Transport::probeRemoteTimestamp() noexcept {
    try {
        const auto id = recordId();
        if (id.empty()) return std::nullopt;

        const auto resp = sendWithFallback(makeRequest("GET", recordUrl(id)));
        if (!resp.ok()) return std::nullopt;

        const auto j = nlohmann::json::parse(resp.body);
        if (!j.contains("updated_at") || !j.at("updated_at").is_string()) return std::nullopt;
        return parseTimestampFromString(j.at("updated_at").get<std::string>());
    } catch (const std::exception& e) {
        if (Registry::isInitialized()) Registry::cloud()->debug("[Transport] Timestamp probe failed: {}", e.what());
        return std::nullopt;
    }
}

std::filesystem::path Transport::writeFallback(const nlohmann::json& body, const std::string& method, const std::string& id) const {
    const auto path = fallbackDir_ / (std::string(FALLBACK_PREFIX) + fileStamp() + ".json");

    const nlohmann::json doc = {
        {"saved_at", getCurrentTimestamp()},
        {"method", method},
        {"record_id", id.empty() ? nlohmann::json(nullptr) : nlohmann::json(id)},
        {"body", body}
    };

    try {
        std::filesystem::create_directories(fallbackDir_);
        writeFileAtomic(path, doc.dump(2));
    } catch (const std::exception& e) {
        throw TransportError("Store unreachable and the fallback file could not be written: " + std::string(e.what()));
    }

    return path;
}
