#pragma once

#include "sync/model/Metadata.hpp"
#include "sync/model/SyncItem.hpp"
#include "util/files.hpp"

#include <ctime>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace ts::concurrency {
class ThreadPool;
}

namespace ts::fs {

class Hasher {
public:
    explicit Hasher(std::filesystem::path root, concurrency::ThreadPool* pool = nullptr);

    // nullopt when the item does not exist on disk.
    [[nodiscard]] std::optional<sync::model::Fingerprint> fingerprint(const sync::model::SyncItem& item) const;

    // Independent items are hashed in parallel when a pool was supplied.
    [[nodiscard]] std::map<std::string, std::optional<sync::model::Fingerprint>>
    fingerprintAll(const std::vector<sync::model::SyncItem>& items) const;

    // Latest modification time across the item, nullopt when absent.
    [[nodiscard]] std::optional<std::time_t> newestWriteTime(const sync::model::SyncItem& item) const;

    // Files beneath a directory item that survive exclusion, sorted, relative to the item in '/' form.
    [[nodiscard]] std::vector<std::string> collectFiles(const sync::model::SyncItem& item) const;

    [[nodiscard]] const std::filesystem::path& root() const { return root_; }

    static sync::model::Fingerprint digest(const util::Blob& bytes);
    static sync::model::Fingerprint digest(std::string_view bytes);

private:
    std::filesystem::path root_;
    concurrency::ThreadPool* pool_;
};

}
