#pragma once

#include "sync/model/Metadata.hpp"
#include "sync/model/SyncItem.hpp"

#include <optional>
#include <string>

namespace ts::sync::model {

enum class ActionType {
    None,       // nothing changed on either side
    Adopt,      // both sides already agree, record it without writing
    Upload,     // local -> remote, an absent local deletes the remote copy
    Download,   // remote -> local, an absent remote deletes the local copy
    Merge,      // structured merge of the primary document
    Pending,    // both changed and the strategy wants a human decision
};

struct Action {
    ActionType type{ActionType::None};
    SyncItem item;
    std::optional<Fingerprint> local{};
    std::optional<Fingerprint> remote{};
    std::string reason;
};

std::string to_string(ActionType t);

}
