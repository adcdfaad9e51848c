#include "services/AsyncService.hpp"

using namespace cw::services;

AsyncService::AsyncService(const std::string& serviceName, std::shared_ptr<spdlog::logger> log)
    : serviceName_(serviceName), log_(std::move(log)) {}

AsyncService::~AsyncService() {
    stop(); // ensure cleanup
}

void AsyncService::start() {
    if (isRunning()) return;
    if (worker_.joinable()) worker_.join();  // previous loop already returned

    interruptFlag_.store(false);
    running_.store(true);

    worker_ = std::thread([this] {
        try {
            runLoop();
        } catch (const std::exception& e) {
            log_->error("[{}] Service encountered an error: {}", serviceName_, e.what());
        }
        running_.store(false);
    });

    log_->info("[{}] Service started.", serviceName_);
}

void AsyncService::stop() {
    if (!worker_.joinable()) return;

    log_->info("[{}] Stopping service...", serviceName_);
    interruptFlag_.store(true);

    // Only join if we're not calling stop() from the same thread
    if (std::this_thread::get_id() != worker_.get_id()) worker_.join();
    else worker_.detach();

    running_.store(false);
    interruptFlag_.store(false);

    log_->info("[{}] Service stopped.", serviceName_);
}

