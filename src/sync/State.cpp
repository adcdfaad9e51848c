#include "sync/State.hpp"
#include "util/files.hpp"

#include <nlohmann/json.hpp>

using namespace cw::sync;
using json = nlohmann::json;

State::State(std::filesystem::path file, std::shared_ptr<spdlog::logger> log)
    : file_(std::move(file)), log_(std::move(log)) {}

void State::load() {
    entries_.clear();

    if (!std::filesystem::exists(file_)) {
        log_->info("[State] No state file at {}, starting empty", file_.string());
        return;
    }

    try {
        const auto j = json::parse(util::readFileToString(file_));
        if (!j.is_object()) throw std::runtime_error("root is not an object");

        for (auto it = j.begin(); it != j.end(); ++it) {
            if (!it.value().is_string()) {
                log_->warn("[State] Ignoring non-string identifier for '{}'", it.key());
                continue;
            }
            entries_[it.key()] = it.value().get<std::string>();
        }
    } catch (const std::exception& e) {
        log_->error("[State] Failed to load {}: {}. Starting empty.", file_.string(), e.what());
        entries_.clear();
        return;
    }

    log_->info("[State] Loaded {} references from {}", entries_.size(), file_.string());
}

void State::persist() const {
    const json j = entries_;
    util::atomicWrite(file_, j.dump(2, ' ', false, json::error_handler_t::replace) + "\n");
}

void State::persistOrLog() const {
    try {
        persist();
    } catch (const std::exception& e) {
        log_->error("[State] Failed to persist {}: {}", file_.string(), e.what());
    }
}

void State::put(const std::string& reference, const std::string& id) {
    entries_[reference] = id;
    persistOrLog();
}

void State::erase(const std::string& reference) {
    if (entries_.erase(reference) == 0) return;
    persistOrLog();
}

std::optional<std::string> State::idFor(const std::string& reference) const {
    const auto it = entries_.find(reference);
    if (it == entries_.end()) return std::nullopt;
    return it->second;
}
