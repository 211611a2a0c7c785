#pragma once

#include <filesystem>

namespace ts::util {

// Exclusive advisory flock(2), released on destruction.
class FileLock {
public:
    explicit FileLock(std::filesystem::path p);
    ~FileLock();
    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

private:
    std::filesystem::path path_;
    int fd_{-1};
};

}
