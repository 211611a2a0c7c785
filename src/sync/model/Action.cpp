#include "sync/model/Action.hpp"
#include "sync/model/Report.hpp"

#include <stdexcept>

std::string ts::sync::model::to_string(const ActionType t) {
    switch (t) {
    case ActionType::None: return "none";
    case ActionType::Adopt: return "adopt";
    case ActionType::Upload: return "upload";
    case ActionType::Download: return "download";
    case ActionType::Merge: return "merge";
    case ActionType::Pending: return "pending";
    }
    throw std::invalid_argument("Unknown action type");
}

std::string ts::sync::model::to_string(const Outcome o) {
    switch (o) {
    case Outcome::NoChanges: return "no changes";
    case Outcome::Synced: return "synced";
    case Outcome::OfflineSaved: return "offline-saved";
    case Outcome::Pending: return "pending";
    case Outcome::Failed: return "failed";
    }
    throw std::invalid_argument("Unknown outcome");
}
