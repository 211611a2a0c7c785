#pragma once

#include "sync/model/Action.hpp"

#include <vector>

namespace ts::sync {

struct Cycle;

struct Planner {
    // One action per item, in item order.
    static std::vector<model::Action> build(const Cycle& cycle);

private:
    static model::Action classify(const Cycle& cycle, const model::SyncItem& item);
    static model::Action resolveBothChanged(const Cycle& cycle, model::Action a);
    static model::Action force(const Cycle& cycle, model::Action a);
    static model::Action restrictDirection(const Cycle& cycle, model::Action a);
};

}
