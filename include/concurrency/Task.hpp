#pragma once

#include <functional>
#include <future>

namespace ts::concurrency {

struct Task {
    virtual ~Task() = default;
    virtual void operator()() = 0;
};

// Wraps a callable; its result or exception is delivered through the future.
template <typename R>
struct PromisedTask final : Task {
    explicit PromisedTask(std::function<R()> fn) : task_(std::move(fn)) {}

    std::future<R> getFuture() { return task_.get_future(); }

    void operator()() override { task_(); }

private:
    std::packaged_task<R()> task_;
};

}
