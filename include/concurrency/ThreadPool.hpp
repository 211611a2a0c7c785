#pragma once

#include "Task.hpp"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>
#include <vector>

namespace ts::concurrency {

class ThreadPool {
public:
    explicit ThreadPool(unsigned int nThreads = 0);

    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Queued tasks are dropped, their futures report broken_promise.
    void stop();

    void submit(std::shared_ptr<Task> task);

    template <typename Fn, typename R = std::invoke_result_t<Fn>>
    std::future<R> submit(Fn&& fn) {
        auto task = std::make_shared<PromisedTask<R>>(std::function<R()>(std::forward<Fn>(fn)));
        auto future = task->getFuture();
        submit(std::static_pointer_cast<Task>(task));
        return future;
    }

    [[nodiscard]] size_t queueDepth() const;
    [[nodiscard]] unsigned int workerCount() const;

private:
    void spawnWorker();

    std::vector<std::thread> threads_;

    std::condition_variable cv;
    mutable std::mutex mutex;
    std::queue<std::shared_ptr<Task>> queue;

    std::atomic<bool> stopFlag{false};
};

}
