#include "services/Monitor.hpp"
#include "feed/Reader.hpp"
#include "report/ChangeReporter.hpp"
#include "runtime/Context.hpp"

#include <thread>

using namespace cw::services;
using namespace cw::feed;

Monitor::Monitor(const std::shared_ptr<runtime::Context>& ctx,
                 std::shared_ptr<Reader> reader,
                 std::shared_ptr<sync::Reconciler> reconciler,
                 std::shared_ptr<report::ChangeReporter> reporter)
    : AsyncService("Monitor", ctx->logs->cuewatch()),
      reader_(std::move(reader)),
      reconciler_(std::move(reconciler)),
      reporter_(std::move(reporter)),
      loopDelay_(ctx->config.loop_delay_ms) {
    if (!reader_ || !reconciler_) throw std::invalid_argument("Monitor requires a reader and a reconciler");

    for (const auto& m : ctx->config.monitors) {
        watchers_.push_back(std::make_unique<Watcher>(m, ctx));
        log_->info("[Monitor] Watching '{}' as {} every {}s", m.path, m.name, m.interval_seconds);
    }
}

Monitor::~Monitor() {
    stop();
}

std::set<std::string> Monitor::activeReferences() const {
    std::set<std::string> all;
    for (const auto& w : watchers_)
        all.insert(w->activeReferences().begin(), w->activeReferences().end());
    return all;
}

RoundResult Monitor::runOnce(const Watcher::Clock::time_point now) {
    RoundResult result;

    try {
        result.connected = reader_->ensureConnected();
    } catch (const std::exception& e) {
        log_->error("[Monitor] Connection check failed: {}", e.what());
    }

    if (!result.connected) {
        log_->warn("[Monitor] Remote unavailable, skipping round");
        return result;
    }

    for (const auto& w : watchers_) {
        if (!w->isDue(now)) continue;

        bool positioned = false;
        try {
            positioned = reader_->navigateTo(w->path());
        } catch (const std::exception& e) {
            log_->error("[Monitor] [{}] Navigation to '{}' failed: {}", w->name(), w->path(), e.what());
        }

        if (!positioned) {
            log_->warn("[Monitor] [{}] Cannot open '{}', not polled", w->name(), w->path());
            continue;
        }

        auto changes = w->poll(*reader_, now);
        ++result.polled;
        if (w->lastOutcome() == Watcher::Status::Failed) ++result.failed;
        result.changes += changes.size();

        if (reporter_ && !changes.empty()) reporter_->report(changes);
    }

    if (result.polled == 0) return result;

    const auto summary = reconciler_->reconcile(activeReferences());
    if (summary.fetched || summary.removed || summary.skipped)
        log_->info("[Monitor] Reconciled: {} fetched, {} removed, {} skipped, {} indexed",
                   summary.fetched, summary.removed, summary.skipped, summary.indexed);
    result.reconciled = summary;

    return result;
}

void Monitor::runLoop() {
    while (!interruptFlag_.load()) {
        try {
            runOnce();
        } catch (const std::exception& e) {
            log_->error("[Monitor] Round failed: {}", e.what());
        }

        const auto deadline = std::chrono::steady_clock::now() + loopDelay_;
        while (!interruptFlag_.load() && std::chrono::steady_clock::now() < deadline)
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }

    reader_->disconnect();
}
