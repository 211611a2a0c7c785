#pragma once

#include "sync/model/SyncItem.hpp"
#include "util/files.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace ts::fs {
class Hasher;
}

namespace ts::concurrency {
class ThreadPool;
}

namespace ts::archive {

// In-memory zip containers for auxiliary items. Entry names are relative to the config root in '/' form.
class Packer {
public:
    // Deflates every non-excluded file beneath the items. Throws ts::Error when a file cannot be read.
    static util::Blob pack(const fs::Hasher& hasher, const std::vector<sync::model::SyncItem>& items);

    // Extracts every entry under destRoot, writing files in parallel when a pool is given.
    // Throws ts::IntegrityError on a corrupt container or an entry escaping destRoot. A failure
    // can leave destRoot partially written.
    static void unpack(const util::Blob& blob,
                       const std::filesystem::path& destRoot,
                       concurrency::ThreadPool* pool = nullptr);

    [[nodiscard]] static std::vector<std::string> entries(const util::Blob& blob);

    // Local file header or end-of-central-directory signature.
    [[nodiscard]] static bool looksLikeZip(const util::Blob& blob);
};

}
