#include "util/files.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <random>
#include <stdexcept>

namespace fs = std::filesystem;

namespace ts::util {

template <class Buffer>
static Buffer readWhole(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw std::runtime_error("Cannot open " + path.string());

    std::error_code ec;
    const auto expected = fs::file_size(path, ec);

    Buffer out;
    if (!ec) out.reserve(static_cast<size_t>(expected));

    char chunk[64 * 1024];
    while (in.read(chunk, sizeof(chunk)) || in.gcount() > 0)
        out.insert(out.end(), chunk, chunk + in.gcount());

    if (in.bad()) throw std::runtime_error("Read error on " + path.string());
    return out;
}

Blob readFileToVector(const fs::path& path) { return readWhole<Blob>(path); }

std::string readFileToString(const fs::path& path) { return readWhole<std::string>(path); }

static bool writen(const int fd, const void* b, size_t n) {
    const auto* p = static_cast<const uint8_t*>(b);
    while (n) {
        const ssize_t w = ::write(fd, p, n);
        if (w < 0 && errno == EINTR) continue;
        if (w <= 0) return false;
        p += w;
        n -= static_cast<size_t>(w);
    }
    return true;
}

void writeFileAtomic(const fs::path& path, const std::string_view data) {
    if (path.has_parent_path()) fs::create_directories(path.parent_path());

    const auto tmp = path.parent_path() / ("." + path.filename().string() + ".tmp-" + randomSuffix());

    const int fd = ::open(tmp.c_str(), O_CREAT | O_WRONLY | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) throw std::runtime_error("Failed to open temp file " + tmp.string() + ": " + std::strerror(errno));

    const bool ok = writen(fd, data.data(), data.size()) && ::fsync(fd) == 0;
    const int savedErrno = errno;
    ::close(fd);

    if (!ok) {
        std::error_code ec;
        fs::remove(tmp, ec);
        throw std::runtime_error("Failed to write " + path.string() + ": " + std::strerror(savedErrno));
    }

    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        throw std::runtime_error("Failed to replace " + path.string() + ": " + ec.message());
    }
}

void writeFileAtomic(const fs::path& path, const Blob& data) {
    writeFileAtomic(path, std::string_view(reinterpret_cast<const char*>(data.data()), data.size()));
}

std::string randomSuffix(const size_t length) {
    static constexpr char charset[] =
        "0123456789"
        "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
        "abcdefghijklmnopqrstuvwxyz";
    thread_local std::mt19937 rng{std::random_device{}()};
    thread_local std::uniform_int_distribution<> dist(0, sizeof(charset) - 2);

    std::string result;
    result.reserve(length);
    for (size_t i = 0; i < length; ++i) result += charset[dist(rng)];
    return result;
}

std::string shellQuote(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 2);
    out.push_back('\'');
    for (const char ch : s) {
        if (ch == '\'') out += "'\\''";
        else out.push_back(ch);
    }
    out.push_back('\'');
    return out;
}

std::string slugify(const std::string_view relPath) {
    std::string_view trimmed = relPath;
    while (!trimmed.empty() && trimmed.back() == '/') trimmed.remove_suffix(1);

    std::string out;
    out.reserve(trimmed.size());
    for (const char c : trimmed) {
        if (c == '/') out += "__";
        else out.push_back(c);
    }
    return out;
}

}
