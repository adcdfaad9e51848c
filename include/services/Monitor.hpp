#pragma once

#include "services/AsyncService.hpp"
#include "feed/Watcher.hpp"
#include "sync/Reconciler.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace cw::runtime { struct Context; }
namespace cw::feed { class Reader; }
namespace cw::report { class ChangeReporter; }

namespace cw::services {

// Outcome of one pass over the watchers.
struct RoundResult {
    bool connected = false;
    size_t polled = 0;
    size_t failed = 0;
    size_t changes = 0;
    std::optional<sync::Summary> reconciled;  // set when at least one watcher polled
};

// Drives the watchers in configuration order and reconciles the asset store
// against the union of their references after every round that polled.
class Monitor final : public AsyncService {
public:
    Monitor(const std::shared_ptr<runtime::Context>& ctx,
            std::shared_ptr<feed::Reader> reader,
            std::shared_ptr<sync::Reconciler> reconciler,
            std::shared_ptr<report::ChangeReporter> reporter);

    ~Monitor() override;

    RoundResult runOnce(feed::Watcher::Clock::time_point now = feed::Watcher::Clock::now());

    [[nodiscard]] const std::vector<std::unique_ptr<feed::Watcher>>& watchers() const { return watchers_; }

    // Union of every watcher's last completed reference set.
    [[nodiscard]] std::set<std::string> activeReferences() const;

protected:
    void runLoop() override;

private:
    std::shared_ptr<feed::Reader> reader_;
    std::shared_ptr<sync::Reconciler> reconciler_;
    std::shared_ptr<report::ChangeReporter> reporter_;
    std::vector<std::unique_ptr<feed::Watcher>> watchers_;
    std::chrono::milliseconds loopDelay_;
};

}
