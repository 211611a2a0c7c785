#include "services/AsyncService.hpp"
#include "log/Registry.hpp"

using namespace ts::services;
using namespace ts::log;

AsyncService::AsyncService(const std::string& serviceName) : serviceName_(serviceName) {}

AsyncService::~AsyncService() {
    stop(); // ensure cleanup
    if (worker_.joinable() && std::this_thread::get_id() != worker_.get_id()) worker_.join();
}

void AsyncService::start() {
    if (isRunning()) return;
    if (worker_.joinable()) worker_.join(); // previous loop already returned

    interruptFlag_.store(false);
    running_.store(true);

    worker_ = std::thread([this] {
        try {
            runLoop();
        } catch (const std::exception& e) {
            Registry::termsync()->error("[{}] Service encountered an error: {}", serviceName_, e.what());
        }
        {
            std::scoped_lock lock(sleepMutex_);
            running_.store(false);
        }
        sleepCv_.notify_all();
    });

    Registry::termsync()->info("[{}] Service started.", serviceName_);
}

void AsyncService::stop() {
    if (!isRunning() && !worker_.joinable()) return;

    Registry::termsync()->info("[{}] Stopping service...", serviceName_);
    {
        std::scoped_lock lock(sleepMutex_);
        interruptFlag_.store(true);
    }
    sleepCv_.notify_all();

    // Only join if we're not calling stop() from the same thread
    if (worker_.joinable() && std::this_thread::get_id() != worker_.get_id()) {
        worker_.join();
    }

    running_.store(false);

    Registry::termsync()->info("[{}] Service stopped.", serviceName_);
}

void AsyncService::restart() {
    Registry::termsync()->info("[{}] Restarting service...", serviceName_);
    stop();
    start();
}

void AsyncService::wait() {
    std::unique_lock lock(sleepMutex_);
    sleepCv_.wait(lock, [this] { return !running_.load() || interruptFlag_.load(); });
}

bool AsyncService::sleepFor(const std::chrono::milliseconds d) {
    std::unique_lock lock(sleepMutex_);
    return !sleepCv_.wait_for(lock, d, [this] { return interruptFlag_.load(); });
}
