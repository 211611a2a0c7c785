#include "cloud/transport/CommandMechanism.hpp"
#include "log/Registry.hpp"
#include "util/errors.hpp"
#include "util/files.hpp"

#include <fmt/format.h>

#include <array>
#include <cstdio>
#include <filesystem>
#include <sys/wait.h>

using namespace ts::cloud::transport;
using namespace ts::util;
using namespace ts::log;

namespace {

// Private scratch directory, removed with everything in it.
class ScratchDir {
public:
    ScratchDir() {
        path_ = std::filesystem::temp_directory_path() / ("termsync-" + randomSuffix(12));
        std::filesystem::create_directory(path_);
        std::filesystem::permissions(path_, std::filesystem::perms::owner_all,
                                     std::filesystem::perm_options::replace);
    }
    ~ScratchDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    ScratchDir(const ScratchDir&) = delete;
    ScratchDir& operator=(const ScratchDir&) = delete;

    [[nodiscard]] std::filesystem::path operator/(const char* name) const { return path_ / name; }

private:
    std::filesystem::path path_;
};

}

Response CommandMechanism::send(const Request& req) {
    ScratchDir scratch;
    const auto headerFile = scratch / "request-headers";
    const auto bodyFile = scratch / "request-body";
    const auto respHeaderFile = scratch / "response-headers";
    const auto respBodyFile = scratch / "response-body";

    std::string headerLines;
    for (const auto& [k, v] : req.headers) headerLines += k + ": " + v + "\n";
    if (!req.body.empty()) headerLines += "Content-Type: application/json\n";

    try {
        writeFileAtomic(headerFile, headerLines);
        if (!req.body.empty()) writeFileAtomic(bodyFile, req.body);
    } catch (const std::exception& e) {
        throw TransportError(std::string("curl-cli could not stage request: ") + e.what());
    }

    auto cmd = fmt::format("{} -s -S -X {} -H @{} -o {} -D {} -w '%{{http_code}}' --max-time {} --connect-timeout {}",
                           shellQuote(binary_), shellQuote(req.method), shellQuote(headerFile.string()),
                           shellQuote(respBodyFile.string()), shellQuote(respHeaderFile.string()),
                           req.timeout.count(), req.timeout.count());
    if (!req.body.empty()) cmd += " --data-binary @" + shellQuote(bodyFile.string());
    cmd += " " + shellQuote(req.url) + " 2>&1";

    FILE* pipe = popen(cmd.c_str(), "r");
    if (!pipe) throw TransportError("curl-cli could not spawn " + binary_);

    std::string output;
    std::array<char, 256> buf{};
    while (const auto n = fread(buf.data(), 1, buf.size(), pipe)) output.append(buf.data(), n);

    const int rc = pclose(pipe);
    if (rc == -1) throw TransportError("curl-cli lost track of the child process");

    const int exitCode = WIFEXITED(rc) ? WEXITSTATUS(rc) : -1;
    if (exitCode != 0) {
        // 127: binary missing, 28: timeout, anything else: network or protocol failure
        throw TransportError(fmt::format("curl-cli {} {} exited with {}: {}", req.method, req.url, exitCode, output));
    }

    // -w prints the status code last, after any diagnostics
    const auto digits = output.size() >= 3 ? output.substr(output.size() - 3) : output;

    Response out;
    try {
        out.status = std::stol(digits);
    } catch (const std::exception&) {
        throw TransportError("curl-cli produced no status code: " + output);
    }
    if (out.status == 0) throw TransportError("curl-cli received no HTTP response");

    try {
        if (std::filesystem::exists(respBodyFile)) out.body = readFileToString(respBodyFile);
        if (std::filesystem::exists(respHeaderFile)) out.headers = parseHeaderBlock(readFileToString(respHeaderFile));
    } catch (const std::exception& e) {
        throw TransportError(std::string("curl-cli could not collect response: ") + e.what());
    }

    Registry::cloud()->debug("[CommandMechanism] {} {} -> {}", req.method, req.url, out.status);
    return out;
}
