#pragma once

#include "feed/ChangeRecord.hpp"
#include "label/Parser.hpp"
#include "config/Config.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <spdlog/logger.h>

namespace cw::runtime { struct Context; }

namespace cw::feed {

class Reader;

// Polls one rundown folder: reads matching entries, tracks content
// fingerprints and keeps the set of references seen on the last good poll.
class Watcher {
public:
    enum class Status { Idle, Polling, Completed, Failed };

    using Clock = std::chrono::steady_clock;

    Watcher(const config::MonitorConfig& cfg, const std::shared_ptr<runtime::Context>& ctx);

    [[nodiscard]] bool isDue(Clock::time_point now) const;

    // Lists path() through the reader and reads every matching entry. Failures are
    // logged; a failed listing leaves references and fingerprints untouched, and a
    // cycle that lost its session or read nothing leaves the references untouched.
    std::vector<ChangeRecord> poll(Reader& reader, Clock::time_point now = Clock::now());

    [[nodiscard]] const std::string& name() const { return cfg_.name; }
    [[nodiscard]] const std::string& path() const { return cfg_.path; }
    [[nodiscard]] Status status() const { return status_; }
    [[nodiscard]] Status lastOutcome() const { return lastOutcome_; }
    [[nodiscard]] const std::vector<std::string>& activeReferences() const { return activeRefs_; }
    [[nodiscard]] const std::unordered_map<std::string, std::string>& fingerprints() const { return fingerprints_; }
    [[nodiscard]] std::optional<Clock::time_point> lastPoll() const { return lastPoll_; }

private:
    config::MonitorConfig cfg_;
    label::Markers markers_;
    std::shared_ptr<spdlog::logger> log_, labelLog_;

    Status status_ = Status::Idle;
    Status lastOutcome_ = Status::Idle;
    std::optional<Clock::time_point> lastPoll_;
    std::vector<std::string> activeRefs_;
    std::unordered_map<std::string, std::string> fingerprints_;

    void finish(Status outcome);
};

std::string to_string(Watcher::Status status);

}
