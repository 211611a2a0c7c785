#include "archive/Packer.hpp"
#include "concurrency/ThreadPool.hpp"
#include "fs/Hasher.hpp"
#include "log/Registry.hpp"
#include "util/errors.hpp"

#include <zip.h>

#include <deque>
#include <future>

using namespace ts::archive;
using namespace ts::sync::model;
using namespace ts::log;
namespace stdfs = std::filesystem;

namespace {

// An archive with zero entries is just the end-of-central-directory record.
constexpr uint8_t EMPTY_ZIP[22] = {'P', 'K', 0x05, 0x06};

class ZipError {
public:
    ZipError() { zip_error_init(&err_); }
    ~ZipError() { zip_error_fini(&err_); }
    ZipError(const ZipError&) = delete;
    ZipError& operator=(const ZipError&) = delete;

    zip_error_t* get() { return &err_; }
    [[nodiscard]] std::string str() { return zip_error_strerror(&err_); }

private:
    zip_error_t err_{};
};

class ZipSource {
public:
    explicit ZipSource(zip_source_t* s) : s_(s) {}
    ~ZipSource() { if (s_) zip_source_free(s_); }
    ZipSource(const ZipSource&) = delete;
    ZipSource& operator=(const ZipSource&) = delete;

    operator zip_source_t*() const { return s_; }

private:
    zip_source_t* s_;
};

// Owns an archive opened over a ZipSource. Discarded unless closed explicitly.
class ZipArchive {
public:
    ZipArchive(zip_source_t* src, const int flags) {
        ZipError err;
        za_ = zip_open_from_source(src, flags, err.get());
        if (!za_) throw ts::IntegrityError("Cannot open zip container: " + err.str());
        zip_source_keep(src); // the archive took ownership, ZipSource still frees its own reference
    }
    ~ZipArchive() { if (za_) zip_discard(za_); }
    ZipArchive(const ZipArchive&) = delete;
    ZipArchive& operator=(const ZipArchive&) = delete;

    operator zip_t*() const { return za_; }

    void close() {
        if (zip_close(za_) < 0) throw ts::Error(std::string("Failed to finalize zip container: ") + zip_strerror(za_));
        za_ = nullptr;
    }

private:
    zip_t* za_ = nullptr;
};

ts::util::Blob readBack(zip_source_t* src) {
    if (zip_source_open(src) < 0)
        throw ts::Error(std::string("Failed to reopen zip buffer: ") + zip_error_strerror(zip_source_error(src)));

    ts::util::Blob out;
    zip_source_seek(src, 0, SEEK_END);
    const auto size = zip_source_tell(src);
    zip_source_seek(src, 0, SEEK_SET);

    if (size > 0) {
        out.resize(static_cast<size_t>(size));
        if (zip_source_read(src, out.data(), static_cast<zip_uint64_t>(size)) != size) {
            zip_source_close(src);
            throw ts::Error("Short read while collecting zip buffer");
        }
    }

    zip_source_close(src);
    return out;
}

bool escapesRoot(const std::string& name) {
    const stdfs::path p(name);
    if (name.empty() || p.is_absolute() || name.front() == '/' || name.front() == '\\') return true;
    for (const auto& part : p)
        if (part == "..") return true;
    return false;
}

}

ts::util::Blob Packer::pack(const fs::Hasher& hasher, const std::vector<SyncItem>& items) {
    std::vector<std::pair<std::string, stdfs::path>> files;
    for (const auto& item : items) {
        const auto path = item.pathUnder(hasher.root());
        std::error_code ec;
        if (!stdfs::exists(path, ec)) continue;

        if (stdfs::is_directory(path, ec)) {
            for (const auto& rel : hasher.collectFiles(item))
                files.emplace_back(item.name + "/" + rel, path / rel);
        } else {
            files.emplace_back(item.name, path);
        }
    }

    if (files.empty()) return {std::begin(EMPTY_ZIP), std::end(EMPTY_ZIP)};

    ZipError err;
    const ZipSource src(zip_source_buffer_create(nullptr, 0, 0, err.get()));
    if (!src) throw Error("Cannot allocate zip buffer: " + err.str());

    ZipArchive za(src, ZIP_TRUNCATE);

    // libzip reads these lazily at close time, so they must outlive the archive
    std::deque<util::Blob> buffers;

    for (const auto& [name, path] : files) {
        try {
            buffers.push_back(util::readFileToVector(path));
        } catch (const std::exception& e) {
            throw Error("Cannot pack " + path.string() + ": " + e.what());
        }

        const auto& data = buffers.back();
        zip_source_t* fs = zip_source_buffer(za, data.data(), data.size(), 0);
        if (!fs) throw Error(std::string("Cannot create zip source: ") + zip_strerror(za));

        const auto idx = zip_file_add(za, name.c_str(), fs, ZIP_FL_ENC_UTF_8 | ZIP_FL_OVERWRITE);
        if (idx < 0) {
            zip_source_free(fs);
            throw Error("Cannot add " + name + " to zip: " + zip_strerror(za));
        }

        zip_set_file_compression(za, static_cast<zip_uint64_t>(idx), ZIP_CM_DEFLATE, 0);
    }

    za.close();
    auto blob = readBack(src);

    Registry::archive()->debug("[Packer] Packed {} file(s) into {} bytes", files.size(), blob.size());
    return blob;
}

std::vector<std::string> Packer::entries(const util::Blob& blob) {
    ZipError err;
    const ZipSource src(zip_source_buffer_create(blob.data(), blob.size(), 0, err.get()));
    if (!src) throw IntegrityError("Cannot read zip buffer: " + err.str());

    const ZipArchive za(src, ZIP_RDONLY);

    std::vector<std::string> names;
    const auto count = zip_get_num_entries(za, 0);
    for (zip_int64_t i = 0; i < count; ++i)
        if (const char* name = zip_get_name(za, static_cast<zip_uint64_t>(i), 0)) names.emplace_back(name);

    return names;
}

void Packer::unpack(const util::Blob& blob, const stdfs::path& destRoot, concurrency::ThreadPool* pool) {
    if (!looksLikeZip(blob)) throw IntegrityError("Container is not a zip archive");

    ZipError err;
    const ZipSource src(zip_source_buffer_create(blob.data(), blob.size(), 0, err.get()));
    if (!src) throw IntegrityError("Cannot read zip buffer: " + err.str());

    const ZipArchive za(src, ZIP_RDONLY | ZIP_CHECKCONS);

    // libzip handles are not shared across threads: decompress here, write in parallel
    std::vector<std::pair<stdfs::path, util::Blob>> outputs;

    const auto count = zip_get_num_entries(za, 0);
    for (zip_int64_t i = 0; i < count; ++i) {
        const auto index = static_cast<zip_uint64_t>(i);

        zip_stat_t st;
        zip_stat_init(&st);
        if (zip_stat_index(za, index, 0, &st) < 0 || !(st.valid & ZIP_STAT_NAME))
            throw IntegrityError(std::string("Unreadable zip entry: ") + zip_strerror(za));

        const std::string name = st.name;
        if (escapesRoot(name)) {
            Registry::archive()->warn("[Packer] Rejecting entry outside the config root: {}", name);
            throw IntegrityError("Zip entry escapes the destination: " + name);
        }

        if (name.back() == '/') {
            stdfs::create_directories(destRoot / name);
            continue;
        }

        zip_file_t* zf = zip_fopen_index(za, index, 0);
        if (!zf) throw IntegrityError("Cannot open zip entry " + name + ": " + zip_strerror(za));

        util::Blob data(static_cast<size_t>(st.valid & ZIP_STAT_SIZE ? st.size : 0));
        const auto read = data.empty() ? 0 : zip_fread(zf, data.data(), data.size());
        zip_fclose(zf);

        if (read < 0 || static_cast<size_t>(read) != data.size())
            throw IntegrityError("Truncated zip entry: " + name);

        outputs.emplace_back(destRoot / name, std::move(data));
    }

    const auto write = [](const stdfs::path& path, const util::Blob& data) {
        stdfs::create_directories(path.parent_path());
        util::writeFileAtomic(path, data);
    };

    if (!pool) {
        for (const auto& [path, data] : outputs) write(path, data);
        return;
    }

    std::vector<std::future<void>> futures;
    futures.reserve(outputs.size());
    for (const auto& [path, data] : outputs)
        futures.push_back(pool->submit([&write, &path, &data] { write(path, data); }));

    // wait for every writer before reporting the first failure
    std::exception_ptr first;
    for (auto& f : futures) {
        try {
            f.get();
        } catch (const std::exception&) {
            if (!first) first = std::current_exception();
        }
    }
    if (first) std::rethrow_exception(first);

    Registry::archive()->debug("[Packer] Extracted {} file(s) into {}", outputs.size(), destRoot.string());
}

bool Packer::looksLikeZip(const util::Blob& blob) {
    if (blob.size() < 4 || blob[0] != 'P' || blob[1] != 'K') return false;
    return (blob[2] == 0x03 && blob[3] == 0x04) || (blob[2] == 0x05 && blob[3] == 0x06);
}
