#include "feed/Watcher.hpp"
#include "feed/Reader.hpp"
#include "crypto/Hash.hpp"
#include "runtime/Context.hpp"
#include "util/timestamp.hpp"

#include <boost/algorithm/string/join.hpp>

#include <algorithm>

using namespace cw::feed;
using namespace cw::label;

Watcher::Watcher(const config::MonitorConfig& cfg, const std::shared_ptr<runtime::Context>& ctx)
    : cfg_(cfg),
      markers_{ctx->config.labels.open_marker, ctx->config.labels.close_marker},
      log_(ctx->logs->feed()),
      labelLog_(ctx->logs->label()) {
    if (cfg_.allowed_kinds.empty()) cfg_.allowed_kinds = ctx->config.labels.allowed_kinds;
}

bool Watcher::isDue(const Clock::time_point now) const {
    if (!lastPoll_) return true;
    return now - *lastPoll_ >= std::chrono::seconds(cfg_.interval_seconds);
}

void Watcher::finish(const Status outcome) {
    lastOutcome_ = outcome;
    status_ = Status::Idle;
}

std::vector<ChangeRecord> Watcher::poll(Reader& reader, const Clock::time_point now) {
    status_ = Status::Polling;
    lastPoll_ = now;

    std::vector<ChangeRecord> changes;

    std::vector<Entry> entries;
    try {
        entries = reader.listEntries(cfg_.path);
    } catch (const std::exception& e) {
        log_->error("[{}] Listing '{}' failed: {}", cfg_.name, cfg_.path, e.what());
        finish(Status::Failed);
        return changes;
    }

    if (entries.empty()) {
        log_->warn("[{}] No entries in '{}'", cfg_.name, cfg_.path);
        finish(Status::Failed);
        return changes;
    }

    std::erase_if(fingerprints_, [&](const auto& kv) {
        return std::none_of(entries.begin(), entries.end(), [&](const Entry& e) { return e.name == kv.first; });
    });

    std::vector<std::string> cycleRefs;
    size_t stories = 0, readable = 0, matched = 0;
    const auto lossesBefore = reader.sessionLosses();

    for (const auto& entry : entries) {
        if (entry.is_dir || entry.name.empty()) continue;
        ++stories;

        try {
            const auto content = reader.readEntry(entry.name);
            if (content) ++readable;
            if (!content || content->empty()) {
                log_->debug("[{}] Skipping unreadable or empty entry '{}'", cfg_.name, entry.name);
                continue;
            }

            if (!hasMatch(*content, cfg_.filter, cfg_.allowed_kinds, markers_)) continue;
            ++matched;

            auto info = extractStoryInfo(*content, cfg_.allowed_kinds, markers_);
            if (!info.tags.empty() && info.labels.size() < info.tags.size())
                labelLog_->debug("[{}] {} of {} tags in '{}' did not parse", cfg_.name,
                                 info.tags.size() - info.labels.size(), info.tags.size(), entry.name);

            cycleRefs.insert(cycleRefs.end(), info.references.begin(), info.references.end());

            auto fingerprint = crypto::Hash::blake2b(*content);
            const auto it = fingerprints_.find(entry.name);
            if (it != fingerprints_.end() && it->second == fingerprint) continue;

            log_->info("[{}] Change in '{}' ({}) refs: {}", cfg_.name, entry.name, info.title,
                       boost::algorithm::join(info.references, ", "));

            fingerprints_[entry.name] = fingerprint;
            changes.push_back({
                .entry_name = entry.name,
                .info = std::move(info),
                .fingerprint = std::move(fingerprint),
                .timestamp = util::localIsoTimestamp(),
                .watcher_name = cfg_.name
            });
        } catch (const std::exception& e) {
            log_->error("[{}] Error processing entry '{}': {}", cfg_.name, entry.name, e.what());
        }
    }

    // a partial read of the folder must not shrink the reference set
    if (reader.sessionLosses() != lossesBefore || (stories > 0 && readable == 0)) {
        log_->warn("[{}] Poll of '{}' incomplete ({} of {} entries read), keeping {} active refs",
                   cfg_.name, cfg_.path, readable, stories, activeRefs_.size());
        finish(Status::Failed);
        return changes;
    }

    activeRefs_ = std::move(cycleRefs);
    log_->debug("[{}] Poll complete: {} entries, {} matched, {} changed, {} active refs",
                cfg_.name, entries.size(), matched, changes.size(), activeRefs_.size());

    finish(Status::Completed);
    return changes;
}

std::string cw::feed::to_string(const Watcher::Status status) {
    switch (status) {
    case Watcher::Status::Idle: return "idle";
    case Watcher::Status::Polling: return "polling";
    case Watcher::Status::Completed: return "completed";
    case Watcher::Status::Failed: return "failed";
    }
    return "unknown";
}
