#include "sync/Watcher.hpp"
#include "sync/Engine.hpp"
#include "sync/ProcessProbe.hpp"
#include "log/Registry.hpp"

using namespace ts::sync;
using namespace ts::sync::model;
using namespace ts::log;

Watcher::Watcher(Engine& engine, std::shared_ptr<ProcessProbe> probe, const std::chrono::milliseconds interval)
    : AsyncService("Watcher"), engine_(engine), probe_(std::move(probe)), interval_(interval) {}

Watcher::~Watcher() {
    stop();
}

std::optional<Report> Watcher::poll() {
    const bool running = probe_->isRunning();

    if (!wasRunning_) {
        wasRunning_ = running;
        if (running) {
            Registry::watch()->info("[Watcher] Application already running, waiting for it to stop");
            atStart_ = engine_.localFingerprints();
        }
        return std::nullopt;
    }

    if (running == *wasRunning_) return std::nullopt;
    wasRunning_ = running;

    if (running) {
        Registry::watch()->info("[Watcher] Application started, pulling remote configuration");
        auto report = engine_.pull();
        atStart_ = engine_.localFingerprints();
        return report;
    }

    const auto now = engine_.localFingerprints();
    if (now == atStart_ && !unpublished_) {
        Registry::watch()->info("[Watcher] Application stopped, configuration unchanged");
        return std::nullopt;
    }

    Registry::watch()->info("[Watcher] Application stopped with local changes, pushing");
    auto report = engine_.push();
    atStart_ = now;
    unpublished_ = report.outcome != Outcome::Synced && report.outcome != Outcome::NoChanges;
    if (unpublished_)
        Registry::watch()->warn("[Watcher] Push ended {}, retrying on the next stop", to_string(report.outcome));
    return report;
}

void Watcher::runLoop() {
    Registry::watch()->info("[Watcher] Watching for the application every {} ms", interval_.count());

    while (!interruptFlag_.load()) {
        if (const auto report = poll())
            Registry::watch()->info("[Watcher] {}: {}", to_string(report->outcome), report->message);

        if (!sleepFor(interval_)) break;
    }

    Registry::watch()->info("[Watcher] Stopped");
}
