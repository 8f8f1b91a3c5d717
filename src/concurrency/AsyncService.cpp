#include "concurrency/AsyncService.hpp"
#include "log/Registry.hpp"

using namespace tf::concurrency;

AsyncService::AsyncService(std::string serviceName)
    : serviceName_(std::move(serviceName)) {}

AsyncService::~AsyncService() {
    stop();
}

void AsyncService::start() {
    if (isRunning()) return;
    if (worker_.joinable()) worker_.join();

    interruptFlag_.store(false, std::memory_order_release);
    running_.store(true, std::memory_order_release);

    worker_ = std::thread([this] {
        try {
            runLoop();
        } catch (const std::exception& e) {
            log::Registry::thumbforge()->error("[{}] Service error: {}", serviceName_, e.what());
        } catch (...) {
            log::Registry::thumbforge()->error("[{}] Service error: unknown exception.", serviceName_);
        }

        running_.store(false, std::memory_order_release);
    });

    log::Registry::thumbforge()->debug("[{}] Service started.", serviceName_);
}

void AsyncService::stop() {
    if (!worker_.joinable()) return;

    log::Registry::thumbforge()->debug("[{}] Stopping service...", serviceName_);
    {
        std::scoped_lock lock(sleepMutex_);
        interruptFlag_.store(true, std::memory_order_release);
    }
    sleepCv_.notify_all();
    handleInterrupt();

    if (std::this_thread::get_id() != worker_.get_id()) worker_.join();
    else worker_.detach();

    running_.store(false, std::memory_order_release);
    // Leave interruptFlag_ true until next start() resets it
    log::Registry::thumbforge()->debug("[{}] Service stopped.", serviceName_);
}

void AsyncService::restart() {
    log::Registry::thumbforge()->info("[{}] Restarting service...", serviceName_);
    stop();
    start();
}

bool AsyncService::sleepFor(const std::chrono::milliseconds d) {
    std::unique_lock lock(sleepMutex_);
    return !sleepCv_.wait_for(lock, d, [this] { return interruptFlag_.load(std::memory_order_acquire); });
}
