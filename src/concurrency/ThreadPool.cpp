#include "concurrency/ThreadPool.hpp"

#include <algorithm>
#include <stdexcept>

using namespace ts::concurrency;

ThreadPool::ThreadPool(unsigned int nThreads) {
    if (nThreads == 0) nThreads = std::max(1u, std::thread::hardware_concurrency());
    for (unsigned int i = 0; i < nThreads; ++i) spawnWorker();
}

ThreadPool::~ThreadPool() {
    stop();
}

void ThreadPool::stop() {
    {
        std::scoped_lock lock(mutex);
        if (stopFlag.exchange(true)) return;
        std::queue<std::shared_ptr<Task>> empty;
        std::swap(queue, empty);
    }
    cv.notify_all();

    for (auto& t : threads_)
        if (t.joinable()) t.join();

    threads_.clear();
}

void ThreadPool::submit(std::shared_ptr<Task> task) {
    {
        std::scoped_lock lock(mutex);
        if (stopFlag.load()) throw std::runtime_error("ThreadPool is stopped");
        queue.push(std::move(task));
    }
    cv.notify_one();
}

size_t ThreadPool::queueDepth() const {
    std::scoped_lock lock(mutex);
    return queue.size();
}

unsigned int ThreadPool::workerCount() const {
    return static_cast<unsigned int>(threads_.size());
}

void ThreadPool::spawnWorker() {
    threads_.emplace_back([this] {
        while (true) {
            std::shared_ptr<Task> task;
            {
                std::unique_lock lock(mutex);
                cv.wait(lock, [this] {
                    return stopFlag.load() || !queue.empty();
                });

                if (stopFlag.load() && queue.empty()) break;

                task = std::move(queue.front());
                queue.pop();
            }

            // PromisedTask captures its own exceptions into the future
            if (task) (*task)();
        }
    });
}
