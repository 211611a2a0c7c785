#include "fs/Hasher.hpp"
#include "concurrency/ThreadPool.hpp"
#include "crypto/util/hash.hpp"
#include "log/Registry.hpp"
#include "util/glob.hpp"
#include "util/timestamp.hpp"

#include <algorithm>
#include <future>

using namespace ts::fs;
using namespace ts::sync::model;
using namespace ts::log;
namespace stdfs = std::filesystem;

Hasher::Hasher(stdfs::path root, concurrency::ThreadPool* pool)
    : root_(std::move(root)), pool_(pool) {}

std::vector<std::string> Hasher::collectFiles(const SyncItem& item) const {
    std::vector<std::string> files;
    const auto base = item.pathUnder(root_);

    std::error_code ec;
    if (!stdfs::is_directory(base, ec)) return files;

    try {
        for (auto it = stdfs::recursive_directory_iterator(base, stdfs::directory_options::skip_permission_denied);
             it != stdfs::recursive_directory_iterator(); ++it) {
            const auto& entry = *it;

            if (util::matchesAny(entry.path().filename().string(), item.exclude)) {
                if (entry.is_directory(ec)) it.disable_recursion_pending();
                continue;
            }

            if (entry.is_regular_file(ec))
                files.push_back(entry.path().lexically_relative(base).generic_string());
        }
    } catch (const stdfs::filesystem_error& e) {
        Registry::hash()->warn("[Hasher] Walk of {} stopped early: {}", base.string(), e.what());
    }

    std::ranges::sort(files);
    return files;
}

std::optional<Fingerprint> Hasher::fingerprint(const SyncItem& item) const {
    const auto path = item.pathUnder(root_);

    std::error_code ec;
    if (!stdfs::exists(path, ec)) return std::nullopt;

    crypto::hash::Digest digest;

    if (!item.isDirectory() || !stdfs::is_directory(path, ec)) {
        if (stdfs::is_directory(path, ec)) {
            Registry::hash()->warn("[Hasher] Expected a file but found a directory: {}", path.string());
            return digest.hex();
        }
        try {
            digest.updateFromFile(path);
        } catch (const std::exception& e) {
            Registry::hash()->warn("[Hasher] Skipping unreadable file {}: {}", path.string(), e.what());
        }
        return digest.hex();
    }

    for (const auto& rel : collectFiles(item)) {
        // read fully before feeding the digest so an unreadable file contributes nothing
        try {
            const auto bytes = util::readFileToVector(path / rel);
            digest.update(rel);
            digest.update(bytes.data(), bytes.size());
        } catch (const std::exception& e) {
            Registry::hash()->warn("[Hasher] Skipping unreadable file {}: {}", (path / rel).string(), e.what());
        }
    }

    return digest.hex();
}

std::map<std::string, std::optional<Fingerprint>>
Hasher::fingerprintAll(const std::vector<SyncItem>& items) const {
    std::map<std::string, std::optional<Fingerprint>> out;

    if (!pool_) {
        for (const auto& item : items) out[item.name] = fingerprint(item);
        return out;
    }

    std::vector<std::pair<std::string, std::future<std::optional<Fingerprint>>>> futures;
    futures.reserve(items.size());
    for (const auto& item : items)
        futures.emplace_back(item.name, pool_->submit([this, &item] { return fingerprint(item); }));

    for (auto& [name, f] : futures) out[name] = f.get();
    return out;
}

std::optional<std::time_t> Hasher::newestWriteTime(const SyncItem& item) const {
    const auto path = item.pathUnder(root_);

    std::error_code ec;
    if (!stdfs::exists(path, ec)) return std::nullopt;

    auto newest = stdfs::last_write_time(path, ec);
    if (ec) return std::nullopt;

    if (stdfs::is_directory(path, ec)) {
        for (const auto& rel : collectFiles(item)) {
            const auto t = stdfs::last_write_time(path / rel, ec);
            if (!ec && t > newest) newest = t;
        }
    }

    return util::toTimeT(newest);
}

Fingerprint Hasher::digest(const util::Blob& bytes) {
    return crypto::hash::blake2b128(bytes);
}

Fingerprint Hasher::digest(const std::string_view bytes) {
    return crypto::hash::blake2b128(bytes);
}
