#include "log/Registry.hpp"
#include "config/Config.hpp"

#include <spdlog/sinks/null_sink.h>

#include <filesystem>

using namespace ts::log;

void Registry::init(const config::LoggingConfig& cfg, const std::filesystem::path& logDir) {
    if (initialized_) {
        spdlog::warn("[LogRegistry] Already initialized, ignoring second init()");
        return;
    }

    namespace fs = std::filesystem;
    if (!fs::exists(logDir)) fs::create_directories(logDir);

    // console
    console_sink_ = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink_->set_level(cfg.levels.console_log_level);
    console_sink_->set_color_mode(spdlog::color_mode::automatic);
    console_sink_->set_pattern(LOG_FORMAT);

    // main file sink (rotating)
    main_file_sink_ = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        (logDir / "termsync.log").string(), main_max_bytes_, main_max_files_);
    main_file_sink_->set_level(cfg.levels.file_log_level);
    main_file_sink_->set_pattern(LOG_FORMAT);

    // audit: file-only sink (append)
    audit_file_sink_ = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
        (logDir / "audit.log").string(), /*truncate=*/false);

    registerAll_({console_sink_, main_file_sink_}, {audit_file_sink_}, &cfg);

    initialized_ = true;
    termsync()->debug("[LogRegistry] Initialized, log dir: {}", logDir.string());
}

void Registry::initConsoleOnly(const spdlog::level::level_enum level) {
    if (initialized_) return;

    console_sink_ = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink_->set_level(level);
    console_sink_->set_pattern(LOG_FORMAT);

    registerAll_({console_sink_}, {std::make_shared<spdlog::sinks::null_sink_mt>()}, nullptr);
    initialized_ = true;
}

void Registry::registerAll_(const std::vector<spdlog::sink_ptr>& sinks,
                            const std::vector<spdlog::sink_ptr>& auditSinks,
                            const config::LoggingConfig* cfg) {
    auto makeLogger = [&](const std::string& name, const spdlog::level::level_enum lvl) {
        const auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(cfg ? lvl : spdlog::level::debug);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    };

    const config::SubsystemLogLevelsConfig defaults;
    const auto& sub_levels = cfg ? cfg->levels.subsystem_levels : defaults;
    makeLogger("termsync", sub_levels.termsync);
    makeLogger("hash",     sub_levels.hash);
    makeLogger("archive",  sub_levels.archive);
    makeLogger("cloud",    sub_levels.cloud);
    makeLogger("backup",   sub_levels.backup);
    makeLogger("meta",     sub_levels.meta);
    makeLogger("sync",     sub_levels.sync);
    makeLogger("merge",    sub_levels.merge);
    makeLogger("watch",    sub_levels.watch);

    const auto logger = std::make_shared<spdlog::logger>("audit", auditSinks.begin(), auditSinks.end());
    logger->set_level(spdlog::level::info);
    logger->flush_on(spdlog::level::info);
    spdlog::register_logger(logger);
}

void Registry::shutdown() {
    if (!initialized_) return;
    spdlog::apply_all([](const std::shared_ptr<spdlog::logger>& lg) { lg->flush(); });
    spdlog::drop_all();
    console_sink_.reset();
    main_file_sink_.reset();
    audit_file_sink_.reset();
    initialized_ = false;
}

std::shared_ptr<spdlog::logger> Registry::get(const std::string& name) {
    auto logger = spdlog::get(name);
    if (!logger) {
        if (!initialized_) throw std::runtime_error("[LogRegistry] LogRegistry not initialized, cannot get logger: " + name);
        throw std::runtime_error("[LogRegistry] Logger not found: " + name);
    }
    return logger;
}

bool Registry::isInitialized() { return initialized_; }
