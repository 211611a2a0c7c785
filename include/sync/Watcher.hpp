#pragma once

#include "services/AsyncService.hpp"
#include "sync/model/Metadata.hpp"
#include "sync/model/Report.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace ts::sync {

class Engine;
class ProcessProbe;

// Polls the application process and reacts to transitions only: a start pulls, a stop pushes
// when the local configuration changed while the application ran or an earlier push did not publish.
// The first observation only records whether the application is running.
class Watcher final : public services::AsyncService {
public:
    Watcher(Engine& engine, std::shared_ptr<ProcessProbe> probe, std::chrono::milliseconds interval);

    ~Watcher() override;

    // One observation. Returns the report of the triggered operation, if any.
    std::optional<model::Report> poll();

protected:
    void runLoop() override;

private:
    Engine& engine_;
    std::shared_ptr<ProcessProbe> probe_;
    std::chrono::milliseconds interval_;

    std::optional<bool> wasRunning_;
    bool unpublished_ = false;
    std::map<std::string, std::optional<model::Fingerprint>> atStart_;
};

}
