#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

namespace tf::concurrency {

// Single background thread running runLoop() until stop(). Derived classes
// must call stop() from their own destructor so runLoop() never outlives them.
class AsyncService {
public:
    explicit AsyncService(std::string serviceName);

    virtual ~AsyncService();

    virtual void start();

    virtual void stop();

    virtual void restart();

    [[nodiscard]] bool isRunning() const { return running_.load(); }

    [[nodiscard]] const std::string& name() const { return serviceName_; }

protected:
    std::string serviceName_;
    std::atomic<bool> running_{false};
    std::atomic<bool> interruptFlag_{false};
    std::thread worker_;

    virtual void runLoop() = 0;

    // Called on the stopping thread after interruptFlag_ is raised
    virtual void handleInterrupt() {}

    // Sleeps up to d; returns false if the service was interrupted meanwhile
    bool sleepFor(std::chrono::milliseconds d);

private:
    std::mutex sleepMutex_;
    std::condition_variable sleepCv_;
};

}
