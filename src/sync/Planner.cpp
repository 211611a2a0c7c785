#include "sync/Planner.hpp"
#include "sync/Cycle.hpp"
#include "log/Registry.hpp"

using namespace ts::sync;
using namespace ts::sync::model;
using namespace ts::log;

std::string ts::sync::to_string(const Mode m) {
    switch (m) {
    case Mode::Sync: return "sync";
    case Mode::Pull: return "pull";
    case Mode::Push: return "push";
    case Mode::ForceUpload: return "force-upload";
    case Mode::ForceDownload: return "force-download";
    }
    return "unknown";
}

std::vector<Action> Planner::build(const Cycle& cycle) {
    std::vector<Action> plan;
    plan.reserve(cycle.items.size());

    for (const auto& item : cycle.items) {
        auto a = classify(cycle, item);
        Registry::sync()->debug("[Planner] {} -> {} ({})", item.name, to_string(a.type), a.reason);
        plan.push_back(std::move(a));
    }

    return plan;
}

Action Planner::classify(const Cycle& cycle, const SyncItem& item) {
    Action a{ActionType::None, item, cycle.localOf(item.name), cycle.remote.fingerprint(item.name), ""};

    if (cycle.mode == Mode::ForceUpload || cycle.mode == Mode::ForceDownload) return force(cycle, std::move(a));

    const auto* state = cycle.stateOf(item.name);

    if (a.local == a.remote) {
        if (!state && !a.local) {
            a.reason = "absent on both sides";
        } else if (state && state->last_local == a.local && state->last_remote == a.remote) {
            a.reason = "in sync";
        } else {
            a.type = ActionType::Adopt;
            a.reason = "both sides already agree";
        }
        return a;
    }

    if (!state) {
        if (!a.local) {
            a.type = ActionType::Download;
            a.reason = "only present remotely";
        } else if (!a.remote) {
            a.type = ActionType::Upload;
            a.reason = "only present locally";
        } else {
            a.reason = "differs on first sync";
            a = resolveBothChanged(cycle, std::move(a));
        }
    } else {
        const bool localChanged = a.local != state->last_local;
        const bool remoteChanged = a.remote != state->last_remote;

        if (localChanged && remoteChanged) {
            a.reason = "changed on both sides";
            a = resolveBothChanged(cycle, std::move(a));
        } else if (localChanged) {
            a.type = ActionType::Upload;
            a.reason = a.local ? "changed locally" : "deleted locally";
        } else if (remoteChanged) {
            a.type = ActionType::Download;
            a.reason = a.remote ? "changed remotely" : "deleted remotely";
        } else {
            a.reason = "unchanged since last sync";
        }
    }

    if (item.structured) {
        if (a.type == ActionType::Upload && !a.local) {
            a.type = a.remote ? ActionType::Download : ActionType::None;
            a.reason = "primary document missing locally";
        } else if (a.type == ActionType::Download && !a.remote) {
            a.type = a.local ? ActionType::Upload : ActionType::None;
            a.reason = "primary document missing remotely";
        }
    }

    return restrictDirection(cycle, std::move(a));
}

Action Planner::resolveBothChanged(const Cycle& cycle, Action a) {
    if (cycle.strategy == ConflictStrategy::Manual) {
        a.type = ActionType::Pending;
        a.reason += ", manual resolution required";
        return a;
    }

    if (a.item.structured && a.local && a.remote) {
        a.type = ActionType::Merge;
        return a;
    }

    // one side deleted while the other modified
    if (!a.local || !a.remote) {
        if (cycle.strategy == ConflictStrategy::Local) a.type = ActionType::Upload;
        else if (cycle.strategy == ConflictStrategy::Cloud) a.type = ActionType::Download;
        else a.type = a.local ? ActionType::Upload : ActionType::Download;

        a.reason += ", " + to_string(cycle.strategy) + " keeps the " + (a.type == ActionType::Upload ? "local" : "remote") + " state";
        return a;
    }

    const auto side = pickSide(cycle.strategy, cycle.mtimeOf(a.item.name), cycle.remote.updated_at).value_or(Side::Local);
    a.type = side == Side::Local ? ActionType::Upload : ActionType::Download;
    a.reason += ", " + to_string(cycle.strategy) + " keeps " + to_string(side);
    return a;
}

Action Planner::force(const Cycle& cycle, Action a) {
    const bool up = cycle.mode == Mode::ForceUpload;

    if (a.local == a.remote) {
        a.type = a.local ? ActionType::Adopt : ActionType::None;
        a.reason = a.local ? "both sides already agree" : "absent on both sides";
        return a;
    }

    const bool sourcePresent = up ? a.local.has_value() : a.remote.has_value();
    if (!sourcePresent && a.item.structured) {
        a.reason = up ? "no local primary document" : "no remote primary document";
        return a;
    }

    a.type = up ? ActionType::Upload : ActionType::Download;
    a.reason = std::string("forced ") + (up ? "upload" : "download");
    return a;
}

Action Planner::restrictDirection(const Cycle& cycle, Action a) {
    // merges run in both directions
    if (cycle.mode == Mode::Pull && a.type == ActionType::Upload) {
        a.type = ActionType::None;
        a.reason += ", left for the next push";
    } else if (cycle.mode == Mode::Push && a.type == ActionType::Download) {
        a.type = ActionType::None;
        a.reason += ", left for the next pull";
    }
    return a;
}
