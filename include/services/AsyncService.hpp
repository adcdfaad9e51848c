#pragma once

#include <memory>
#include <atomic>
#include <thread>
#include <string>
#include <spdlog/logger.h>

namespace cw::services {

class AsyncService {
public:
    AsyncService(const std::string& serviceName, std::shared_ptr<spdlog::logger> log);

    virtual ~AsyncService();

    virtual void start();

    virtual void stop();

    [[nodiscard]] bool isRunning() const { return running_.load(); }

protected:
    std::string serviceName_;
    std::shared_ptr<spdlog::logger> log_;
    std::atomic<bool> running_{false};
    std::atomic<bool> interruptFlag_{false};
    std::thread worker_;

    virtual void runLoop() = 0;
};

}
