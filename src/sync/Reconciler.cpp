#include "sync/Reconciler.hpp"
#include "sync/AssetFetcher.hpp"
#include "runtime/Context.hpp"

#include <algorithm>
#include <iterator>
#include <system_error>

using namespace cw::sync;

namespace fs = std::filesystem;

Reconciler::Reconciler(const std::shared_ptr<runtime::Context>& ctx, std::shared_ptr<AssetFetcher> fetcher)
    : base_(ctx->config.content.download_base_path),
      fetcher_(std::move(fetcher)),
      log_(ctx->logs->sync()),
      state_(ctx->config.stateFile(), ctx->logs->sync()),
      index_(ctx->config.indexFile()) {
    if (!fetcher_) throw std::invalid_argument("Reconciler requires an asset fetcher");
}

void Reconciler::load() {
    std::error_code ec;
    fs::create_directories(base_, ec);
    if (ec) log_->error("[Reconciler] Failed to create {}: {}", base_.string(), ec.message());

    state_.load();
}

Plan Reconciler::plan(const std::set<std::string>& active) const {
    std::set<std::string> known;
    for (const auto& [ref, _] : state_.entries()) known.insert(ref);

    Plan p;
    std::set_difference(active.begin(), active.end(), known.begin(), known.end(), std::back_inserter(p.fetch));
    std::set_difference(known.begin(), known.end(), active.begin(), active.end(), std::back_inserter(p.remove));
    return p;
}

Summary Reconciler::reconcile(const std::set<std::string>& active) {
    const auto p = plan(active);
    Summary summary;

    if (!p.empty())
        log_->info("[Reconciler] {} new, {} obsolete of {} active references",
                   p.fetch.size(), p.remove.size(), active.size());

    for (const auto& ref : p.fetch) {
        if (fetchOne(ref)) ++summary.fetched;
        else ++summary.skipped;
    }

    for (const auto& ref : p.remove) {
        removeOne(ref);
        ++summary.removed;
    }

    summary.indexed = rebuildIndex();
    return summary;
}

bool Reconciler::fetchOne(const std::string& reference) {
    const auto id = fetcher_->deriveId(reference);
    if (!id || id->empty()) {
        log_->warn("[Reconciler] Cannot derive an identifier for '{}', skipping", reference);
        return false;
    }

    const auto target = base_ / *id;
    log_->info("[Reconciler] Fetching '{}' into {}", reference, target.string());

    try {
        fetcher_->fetch(reference, target);
    } catch (const std::exception& e) {
        log_->error("[Reconciler] Fetch of '{}' failed: {}", reference, e.what());
    }

    // recorded either way; a failed fetch stays out of the index until its artifact appears
    state_.put(reference, *id);
    return true;
}

void Reconciler::removeOne(const std::string& reference) {
    const auto id = state_.idFor(reference);
    state_.erase(reference);

    if (!id || id->empty()) return;

    const auto target = base_ / *id;
    if (sharesId(*id)) {
        log_->info("[Reconciler] Keeping {} for '{}', still in use by another reference",
                   target.string(), reference);
        return;
    }

    std::error_code ec;
    if (!fs::exists(target, ec)) return;

    fs::remove_all(target, ec);
    if (ec) log_->error("[Reconciler] Failed to delete {}: {}", target.string(), ec.message());
    else log_->info("[Reconciler] Removed {} for '{}'", target.string(), reference);
}

bool Reconciler::sharesId(const std::string& id) const {
    return std::any_of(state_.entries().begin(), state_.entries().end(),
                       [&](const auto& kv) { return kv.second == id; });
}

size_t Reconciler::rebuildIndex() {
    std::vector<IndexRecord> records;

    for (const auto& [ref, id] : state_.entries()) {
        const auto dir = fs::absolute(base_ / id);
        std::error_code ec;
        if (!fs::exists(fetcher_->artifactPath(dir), ec)) continue;
        records.push_back({ref, dir});
    }

    try {
        index_.write(records);
    } catch (const std::exception& e) {
        log_->error("[Reconciler] Failed to write index {}: {}", index_.file().string(), e.what());
    }

    return records.size();
}
