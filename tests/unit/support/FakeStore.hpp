#pragma once

#include "cloud/transport/Mechanism.hpp"
#include "util/errors.hpp"
#include "util/timestamp.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <mutex>
#include <string>

namespace ts::test {

constexpr auto STORE_BASE = "https://store.test/gists";

// In-memory hosted text-blob store speaking the GET/PATCH/POST record protocol.
class FakeStore final : public cloud::transport::Mechanism {
public:
    bool offline = false;
    bool writesOffline = false;     // reads succeed, PATCH and POST fail to connect
    long forcedStatus = 0;          // answer every request with this status when set
    std::size_t truncateAbove = 0;  // files longer than this come back truncated with a raw_url

    int gets = 0, patches = 0, posts = 0;
    std::time_t clock = 1767225600; // 2026-01-01T00:00:00Z, advances one second per write

    [[nodiscard]] std::string name() const override { return "fake-store"; }

    cloud::transport::Response send(const cloud::transport::Request& req) override {
        std::scoped_lock lock(mutex_);
        if (offline) throw TransportError("fake store offline");
        if (writesOffline && req.method != "GET") throw TransportError("fake store refuses writes");

        cloud::transport::Response resp;
        if (forcedStatus) {
            resp.status = forcedStatus;
            resp.body = R"({"message":"forced"})";
            return resp;
        }

        const std::string base = STORE_BASE;
        if (!req.url.starts_with(base)) return status(404);
        const auto rest = req.url.substr(base.size());

        if (rest.starts_with("/raw/")) {
            const auto tail = rest.substr(5);
            const auto slash = tail.find('/');
            const auto rec = records_.find(tail.substr(0, slash));
            if (rec == records_.end() || !rec->second["files"].contains(tail.substr(slash + 1))) return status(404);
            resp.status = 200;
            resp.body = rec->second["files"][tail.substr(slash + 1)]["content"].get<std::string>();
            return resp;
        }

        if (rest.empty() && req.method == "POST") {
            ++posts;
            const auto id = "rec" + std::to_string(++nextId_);
            records_[id] = {{"id", id}, {"files", nlohmann::json::object()}};
            apply(records_[id], nlohmann::json::parse(req.body));
            return render(records_[id], 201);
        }

        const auto id = rest.substr(1);
        const auto it = records_.find(id);
        if (it == records_.end()) return status(404);

        if (req.method == "GET") {
            ++gets;
            return render(it->second, 200);
        }
        if (req.method == "PATCH") {
            ++patches;
            apply(it->second, nlohmann::json::parse(req.body));
            return render(it->second, 200);
        }
        return status(405);
    }

    // Direct access for assertions and for simulating foreign writes.
    nlohmann::json& record(const std::string& id) { return records_.at(id); }
    [[nodiscard]] bool has(const std::string& id) const { return records_.contains(id); }
    void erase(const std::string& id) { records_.erase(id); }

private:
    std::mutex mutex_;
    std::map<std::string, nlohmann::json> records_;
    int nextId_ = 0;

    static cloud::transport::Response status(const long code) {
        cloud::transport::Response resp;
        resp.status = code;
        resp.body = R"({"message":"error"})";
        return resp;
    }

    void apply(nlohmann::json& rec, const nlohmann::json& body) {
        if (body.contains("description")) rec["description"] = body["description"];
        for (const auto& [name, file] : body["files"].items()) {
            if (file.is_null()) rec["files"].erase(name);
            else rec["files"][name] = file;
        }
        rec["updated_at"] = util::timestampToString(++clock);
    }

    cloud::transport::Response render(const nlohmann::json& rec, const long code) const {
        auto out = rec;
        for (auto it = out["files"].begin(); it != out["files"].end(); ++it) {
            const auto& name = it.key();
            auto& file = it.value();
            const auto content = file["content"].get<std::string>();
            if (truncateAbove && content.size() > truncateAbove) {
                file["content"] = content.substr(0, truncateAbove);
                file["truncated"] = true;
                file["raw_url"] = std::string(STORE_BASE) + "/raw/" + rec.at("id").get<std::string>() + "/" + name;
            }
        }

        cloud::transport::Response resp;
        resp.status = code;
        resp.body = out.dump();
        return resp;
    }
};

}
