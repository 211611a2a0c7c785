#include "runtime/Context.hpp"
#include "backup/Manager.hpp"
#include "config/Config.hpp"
#include "log/Registry.hpp"
#include "sync/Engine.hpp"
#include "sync/Watcher.hpp"
#include "util/errors.hpp"
#include "util/timestamp.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <atomic>
#include <csignal>
#include <cstdlib>
#include <string>
#include <thread>
#include <vector>

using namespace ts;
using namespace ts::sync::model;

namespace {

constexpr int EXIT_OFFLINE = 2;
constexpr int EXIT_PENDING = 3;
constexpr int EXIT_USAGE = 64;

std::atomic shouldExit = false;

void signalHandler(const int) {
    shouldExit = true;
}

void printUsage() {
    fmt::print(stderr,
               "usage: termsync [--config PATH] [--debug] <command>\n"
               "\n"
               "commands:\n"
               "  init             write a default configuration file\n"
               "  sync             reconcile local and hosted configuration\n"
               "  force-upload     make the hosted record match this machine\n"
               "  force-download   make this machine match the hosted record\n"
               "  pull             apply remote changes only\n"
               "  push             publish local changes only\n"
               "  status           show sync state per item\n"
               "  list-backups     list local snapshots, newest first\n"
               "  restore <id>     restore a snapshot (a pre-restore snapshot is taken first)\n"
               "  rollback <id>    re-apply a snapshot without taking another one\n"
               "  watch            pull when the application starts, push when it stops\n");
}

std::string fp(const std::optional<Fingerprint>& f) {
    return f ? f->substr(0, 12) : "-";
}

std::string when(const std::time_t t) {
    return t == 0 ? "never" : util::timestampToString(t);
}

int exitCode(const Outcome o) {
    switch (o) {
    case Outcome::NoChanges:
    case Outcome::Synced: return EXIT_SUCCESS;
    case Outcome::OfflineSaved: return EXIT_OFFLINE;
    case Outcome::Pending: return EXIT_PENDING;
    case Outcome::Failed: return EXIT_FAILURE;
    }
    return EXIT_FAILURE;
}

int printReport(const Report& report) {
    for (const auto& item : report.items) {
        if (item.action == ActionType::None && item.ok) continue;
        fmt::print("  {:<24} {:<9} {:<5} {}\n", item.item, to_string(item.action), item.ok ? "ok" : "FAIL", item.detail);
    }
    fmt::print("{}: {}\n", to_string(report.outcome), report.message);
    if (report.fallbackFile) fmt::print("offline payload: {}\n", report.fallbackFile->string());
    return exitCode(report.outcome);
}

int cmdInit(const std::filesystem::path& path) {
    if (std::filesystem::exists(path)) {
        fmt::print("Configuration already exists at {}\n", path.string());
        return EXIT_SUCCESS;
    }

    auto cfg = config::loadConfig(path);
    if (path.has_parent_path()) std::filesystem::create_directories(path.parent_path());
    cfg.save(path);
    fmt::print("Wrote default configuration to {}\nSet cloud.token (or TERMSYNC_TOKEN) before the first sync.\n", path.string());
    return EXIT_SUCCESS;
}

int cmdStatus(const runtime::Context& ctx) {
    const auto s = ctx.engine().status();
    fmt::print("config:        {}\n", s.config_path.empty() ? ctx.configPath().string() + " (defaults)" : s.config_path.string());
    fmt::print("config root:   {}\n", s.config_root.string());
    fmt::print("record id:     {}\n", s.record_id.empty() ? "(not created yet)" : s.record_id);
    fmt::print("device id:     {}\n", s.device_id);
    fmt::print("strategy:      {}\n", s.strategy);
    fmt::print("last sync:     {}\n", when(s.last_sync));
    fmt::print("remote update: {}\n", s.remote_updated_at ? util::timestampToString(*s.remote_updated_at) : "unknown");
    fmt::print("backups:       {}\n\n", s.backups);

    fmt::print("  {:<24} {:<12} {:<12} {:<12} {}\n", "item", "local", "last local", "last remote", "state");
    for (const auto& i : s.items)
        fmt::print("  {:<24} {:<12} {:<12} {:<12} {}\n", i.name + (i.directory ? "/" : ""), fp(i.local),
                   fp(i.last_local), fp(i.last_remote), i.changedLocally ? "changed" : "clean");
    return EXIT_SUCCESS;
}

int cmdListBackups(const runtime::Context& ctx) {
    const auto entries = ctx.engine().listBackups();
    if (entries.empty()) {
        fmt::print("No backups in {}\n", ctx.backups().area().string());
        return EXIT_SUCCESS;
    }

    for (const auto& e : entries)
        fmt::print("{:<44} {:<24} {:<20} {}{}\n", e.id, e.item, util::timestampToString(e.capturedAt()), e.reason,
                   e.absent ? " (absent)" : "");
    return EXIT_SUCCESS;
}

int cmdRestore(const runtime::Context& ctx, const std::string& id) {
    const auto result = ctx.engine().restore(id);
    if (result.ok) {
        fmt::print("Restored {} from {}\n", result.restored.item, id);
        return EXIT_SUCCESS;
    }

    fmt::print(stderr, "Restored content of {} is invalid: {}\nUndo with: termsync rollback {}\n",
               result.restored.item, result.error, result.rollbackOffer.id);
    return EXIT_FAILURE;
}

int cmdWatch(const runtime::Context& ctx) {
    if (!ctx.config().monitoring.enabled) {
        fmt::print(stderr, "Process monitoring is disabled (monitoring.enabled: false)\n");
        return EXIT_FAILURE;
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    const auto watcher = ctx.makeWatcher();
    watcher->start();
    fmt::print("Watching for '{}', Ctrl-C to stop\n", ctx.config().monitoring.process_name);

    while (!shouldExit && watcher->isRunning()) std::this_thread::sleep_for(std::chrono::milliseconds(200));

    watcher->stop();
    return EXIT_SUCCESS;
}

}

int main(const int argc, char** argv) {
    std::filesystem::path configPath;
    bool debug = false;
    std::vector<std::string> args;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config") {
            if (++i >= argc) {
                printUsage();
                return EXIT_USAGE;
            }
            configPath = argv[i];
        } else if (arg.starts_with("--config=")) {
            configPath = arg.substr(9);
        } else if (arg == "--debug") {
            debug = true;
        } else if (arg == "-h" || arg == "--help") {
            printUsage();
            return EXIT_SUCCESS;
        } else {
            args.push_back(arg);
        }
    }

    if (args.empty()) {
        printUsage();
        return EXIT_USAGE;
    }

    const auto& cmd = args.front();
    const bool needsId = cmd == "restore" || cmd == "rollback";
    if (args.size() != (needsId ? 2u : 1u)) {
        printUsage();
        return EXIT_USAGE;
    }

    try {
        if (configPath.empty()) configPath = config::defaultConfigPath();

        if (cmd == "init") {
            log::Registry::initConsoleOnly();
            return cmdInit(configPath);
        }

        static const std::vector<std::string> known = {
            "sync", "force-upload", "force-download", "pull", "push", "status", "list-backups", "restore", "rollback", "watch"
        };
        if (std::ranges::find(known, cmd) == known.end()) {
            fmt::print(stderr, "unknown command: {}\n", cmd);
            printUsage();
            return EXIT_USAGE;
        }

        runtime::Context ctx(configPath, debug);
        auto& engine = ctx.engine();

        if (cmd == "sync") return printReport(engine.sync());
        if (cmd == "force-upload") return printReport(engine.forceUpload());
        if (cmd == "force-download") return printReport(engine.forceDownload());
        if (cmd == "pull") return printReport(engine.pull());
        if (cmd == "push") return printReport(engine.push());
        if (cmd == "status") return cmdStatus(ctx);
        if (cmd == "list-backups") return cmdListBackups(ctx);
        if (cmd == "restore") return cmdRestore(ctx, args[1]);
        if (cmd == "rollback") {
            engine.rollback(args[1]);
            fmt::print("Rolled back to {}\n", args[1]);
            return EXIT_SUCCESS;
        }
        return cmdWatch(ctx);
    } catch (const ConfigError& e) {
        fmt::print(stderr, "configuration error: {}\n", e.what());
        return EXIT_FAILURE;
    } catch (const std::exception& e) {
        fmt::print(stderr, "termsync: {}\n", e.what());
        return EXIT_FAILURE;
    }
}
