#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

namespace ts::services {

class AsyncService {
public:
    explicit AsyncService(const std::string& serviceName);

    virtual ~AsyncService();

    virtual void start();

    virtual void stop();

    virtual void restart();

    [[nodiscard]] bool isRunning() const { return running_.load(); }

    // Blocks the caller until the loop exits on its own or stop() is called from another thread.
    void wait();

protected:
    std::string serviceName_;
    std::atomic<bool> running_{false};
    std::atomic<bool> interruptFlag_{false};
    std::thread worker_;

    virtual void runLoop() = 0;

    // Sleeps up to `d`. Returns false when woken by stop().
    bool sleepFor(std::chrono::milliseconds d);

private:
    std::mutex sleepMutex_;
    std::condition_variable sleepCv_;
};

}
