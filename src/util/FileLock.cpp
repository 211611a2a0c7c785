#include "util/FileLock.hpp"
#include "util/errors.hpp"

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

using namespace ts::util;

FileLock::FileLock(std::filesystem::path p) : path_(std::move(p)) {
    if (path_.has_parent_path()) std::filesystem::create_directories(path_.parent_path());

    fd_ = ::open(path_.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644);
    if (fd_ < 0) throw Error("FileLock: open failed for " + path_.string() + ": " + std::strerror(errno));

    if (flock(fd_, LOCK_EX) != 0) {
        const int err = errno;
        ::close(fd_);
        fd_ = -1;
        throw Error("FileLock: flock failed for " + path_.string() + ": " + std::strerror(err));
    }
}

FileLock::~FileLock() {
    if (fd_ >= 0) {
        flock(fd_, LOCK_UN);
        ::close(fd_);
    }
}
