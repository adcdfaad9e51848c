#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <spdlog/logger.h>

namespace cw::sync {

// Durable reference -> identifier map backed by a JSON file. Every mutation
// rewrites the whole file (temp file + rename).
class State {
public:
    State(std::filesystem::path file, std::shared_ptr<spdlog::logger> log);

    // Missing file starts empty; a corrupt file is logged and also starts empty.
    void load();

    // Throws std::runtime_error when the file cannot be written.
    void persist() const;

    void put(const std::string& reference, const std::string& id);
    void erase(const std::string& reference);

    [[nodiscard]] bool contains(const std::string& reference) const { return entries_.contains(reference); }
    [[nodiscard]] std::optional<std::string> idFor(const std::string& reference) const;
    [[nodiscard]] const std::map<std::string, std::string>& entries() const { return entries_; }
    [[nodiscard]] size_t size() const { return entries_.size(); }

private:
    std::filesystem::path file_;
    std::shared_ptr<spdlog::logger> log_;
    std::map<std::string, std::string> entries_;

    void persistOrLog() const;
};

}
