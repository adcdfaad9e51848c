#pragma once

#include "config/Config.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/sink.h>

namespace cw::logging {

// Owns the shared sinks and one named logger per subsystem. Instances are
// handed to components through runtime::Context; nothing is registered with
// spdlog's global registry.
class LogRegistry {
public:
    explicit LogRegistry(const config::LoggingConfig& cnf);

    // Every logger writes to a null sink. Used by the test suite.
    static std::shared_ptr<LogRegistry> silent();

    // Generic access by name
    [[nodiscard]] std::shared_ptr<spdlog::logger> get(const std::string& name) const;

    // Subsystem shorthands
    [[nodiscard]] std::shared_ptr<spdlog::logger> cuewatch() const { return get("cuewatch"); }
    [[nodiscard]] std::shared_ptr<spdlog::logger> feed() const     { return get("feed"); }
    [[nodiscard]] std::shared_ptr<spdlog::logger> label() const    { return get("label"); }
    [[nodiscard]] std::shared_ptr<spdlog::logger> sync() const     { return get("sync"); }
    [[nodiscard]] std::shared_ptr<spdlog::logger> fetch() const    { return get("fetch"); }
    [[nodiscard]] std::shared_ptr<spdlog::logger> changes() const  { return get("changes"); }

    void flush() const;

private:
    static constexpr const auto* LOG_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";

    static constexpr size_t MAIN_MAX_BYTES = 10 * 1024 * 1024; // 10 MiB
    static constexpr size_t MAIN_MAX_FILES = 5;

    LogRegistry() = default;

    std::vector<spdlog::sink_ptr> sinks_;
    std::unordered_map<std::string, std::shared_ptr<spdlog::logger>> loggers_;

    void makeLogger(const std::string& name, spdlog::level::level_enum lvl);
};

}
