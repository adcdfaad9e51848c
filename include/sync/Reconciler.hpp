#pragma once

#include "sync/Index.hpp"
#include "sync/State.hpp"

#include <filesystem>
#include <memory>
#include <set>
#include <string>
#include <vector>
#include <spdlog/logger.h>

namespace cw::runtime { struct Context; }

namespace cw::sync {

class AssetFetcher;

// References to fetch and to drop, both in sorted order.
struct Plan {
    std::vector<std::string> fetch;
    std::vector<std::string> remove;

    [[nodiscard]] bool empty() const { return fetch.empty() && remove.empty(); }
};

struct Summary {
    size_t fetched = 0;
    size_t removed = 0;
    size_t skipped = 0;
    size_t indexed = 0;
};

// Brings the local asset store in line with the references that are active
// across all feeds, then rebuilds the index.
class Reconciler {
public:
    Reconciler(const std::shared_ptr<runtime::Context>& ctx, std::shared_ptr<AssetFetcher> fetcher);

    // Loads the state file. Call once before the first reconcile().
    void load();

    [[nodiscard]] Plan plan(const std::set<std::string>& active) const;

    Summary reconcile(const std::set<std::string>& active);

    [[nodiscard]] const State& state() const { return state_; }

private:
    std::filesystem::path base_;
    std::shared_ptr<AssetFetcher> fetcher_;
    std::shared_ptr<spdlog::logger> log_;
    State state_;
    Index index_;

    bool fetchOne(const std::string& reference);
    void removeOne(const std::string& reference);
    [[nodiscard]] bool sharesId(const std::string& id) const;
    size_t rebuildIndex();
};

}
