#include "sync/ProcessProbe.hpp"
#include "log/Registry.hpp"

#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <fstream>

using namespace ts::sync;
namespace stdfs = std::filesystem;

namespace {

std::string firstLine(const stdfs::path& p) {
    std::ifstream in(p);
    std::string line;
    std::getline(in, line);
    return line;
}

// argv[0] of a NUL-separated cmdline
std::string argv0(const stdfs::path& p) {
    std::ifstream in(p, std::ios::binary);
    std::string arg;
    std::getline(in, arg, '\0');
    return arg;
}

}

ProcProbe::ProcProbe(std::string processName, stdfs::path procRoot)
    : name_(std::move(processName)), procRoot_(std::move(procRoot)) {}

bool ProcProbe::matches(const stdfs::path& pidDir) const {
    // comm is truncated to 15 characters by the kernel
    const auto comm = firstLine(pidDir / "comm");
    if (!comm.empty() && (comm == name_ || (comm.size() == 15 && name_.starts_with(comm)))) return true;

    const auto exe = argv0(pidDir / "cmdline");
    return !exe.empty() && stdfs::path(exe).filename() == name_;
}

bool ProcProbe::isRunning() {
    if (name_.empty()) return false;

    const auto self = std::to_string(::getpid());
    std::error_code ec;

    for (const auto& de : stdfs::directory_iterator(procRoot_, ec)) {
        const auto pid = de.path().filename().string();
        if (pid.empty() || pid == self) continue;
        if (!std::ranges::all_of(pid, [](const unsigned char c) { return std::isdigit(c); })) continue;

        // processes exit mid-scan, unreadable entries simply do not match
        if (matches(de.path())) return true;
    }

    if (ec) log::Registry::watch()->warn("[ProcProbe] Cannot scan {}: {}", procRoot_.string(), ec.message());
    return false;
}
