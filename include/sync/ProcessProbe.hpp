#pragma once

#include <filesystem>
#include <string>

namespace ts::sync {

class ProcessProbe {
public:
    virtual ~ProcessProbe() = default;

    [[nodiscard]] virtual bool isRunning() = 0;
};

// Matches the executable name against /proc/<pid>/comm and the basename of argv[0] in
// /proc/<pid>/cmdline.
class ProcProbe final : public ProcessProbe {
public:
    explicit ProcProbe(std::string processName, std::filesystem::path procRoot = "/proc");

    [[nodiscard]] bool isRunning() override;

private:
    std::string name_;
    std::filesystem::path procRoot_;

    [[nodiscard]] bool matches(const std::filesystem::path& pidDir) const;
};

}
