#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <filesystem>

namespace ts::config { struct LoggingConfig; }

namespace ts::log {

class Registry {
public:
    // Initialize all loggers with sinks/levels.
    static void init(const config::LoggingConfig& cfg, const std::filesystem::path& logDir);

    // Console-only loggers, used before a config is available and by the test runner.
    static void initConsoleOnly(spdlog::level::level_enum level = spdlog::level::warn);

    static void shutdown();

    // Generic access by name
    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    // Subsystem shorthands
    static std::shared_ptr<spdlog::logger> termsync() { return get("termsync"); }
    static std::shared_ptr<spdlog::logger> hash()     { return get("hash"); }
    static std::shared_ptr<spdlog::logger> archive()  { return get("archive"); }
    static std::shared_ptr<spdlog::logger> cloud()    { return get("cloud"); }
    static std::shared_ptr<spdlog::logger> backup()   { return get("backup"); }
    static std::shared_ptr<spdlog::logger> meta()     { return get("meta"); }
    static std::shared_ptr<spdlog::logger> sync()     { return get("sync"); }
    static std::shared_ptr<spdlog::logger> merge()    { return get("merge"); }
    static std::shared_ptr<spdlog::logger> watch()    { return get("watch"); }
    static std::shared_ptr<spdlog::logger> audit()    { return get("audit"); }

    [[nodiscard]] static bool isInitialized();

private:
    static constexpr const auto* LOG_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";

    static inline bool initialized_ = false;

    static inline std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> console_sink_;
    static inline std::shared_ptr<spdlog::sinks::rotating_file_sink_mt> main_file_sink_;
    static inline std::shared_ptr<spdlog::sinks::basic_file_sink_mt>    audit_file_sink_;

    static inline size_t main_max_bytes_ = 5 * 1024 * 1024; // 5 MiB
    static inline size_t main_max_files_ = 3;

    static void registerAll_(const std::vector<spdlog::sink_ptr>& sinks,
                             const std::vector<spdlog::sink_ptr>& auditSinks,
                             const config::LoggingConfig* cfg);
};

}
