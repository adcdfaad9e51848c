#include "logging/LogRegistry.hpp"

#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <filesystem>
#include <stdexcept>

using namespace cw::logging;

LogRegistry::LogRegistry(const config::LoggingConfig& cnf) {
    namespace fs = std::filesystem;

    // console
    const auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console->set_level(cnf.levels.console_log_level);
    console->set_color_mode(spdlog::color_mode::automatic);
    console->set_pattern(LOG_FORMAT);
    sinks_.push_back(console);

    // main file sink (rotating), only when a log directory is configured
    if (!cnf.log_dir.empty()) {
        if (!fs::exists(cnf.log_dir)) fs::create_directories(cnf.log_dir);
        const auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            (cnf.log_dir / "cuewatch.log").string(), MAIN_MAX_BYTES, MAIN_MAX_FILES);
        file->set_level(cnf.levels.file_log_level);
        file->set_pattern(LOG_FORMAT);
        sinks_.push_back(file);
    }

    const auto& sub_levels = cnf.levels.subsystem_levels;
    makeLogger("cuewatch", sub_levels.cuewatch);
    makeLogger("feed",     sub_levels.feed);
    makeLogger("label",    sub_levels.label);
    makeLogger("sync",     sub_levels.sync);
    makeLogger("fetch",    sub_levels.fetch);
    makeLogger("changes",  sub_levels.changes);
}

std::shared_ptr<LogRegistry> LogRegistry::silent() {
    std::shared_ptr<LogRegistry> registry(new LogRegistry());
    registry->sinks_.push_back(std::make_shared<spdlog::sinks::null_sink_mt>());
    for (const auto* name : {"cuewatch", "feed", "label", "sync", "fetch", "changes"})
        registry->makeLogger(name, spdlog::level::off);
    return registry;
}

void LogRegistry::makeLogger(const std::string& name, const spdlog::level::level_enum lvl) {
    const auto logger = std::make_shared<spdlog::logger>(name, sinks_.begin(), sinks_.end());
    logger->set_level(lvl);
    logger->flush_on(spdlog::level::warn);
    loggers_[name] = logger;
}

std::shared_ptr<spdlog::logger> LogRegistry::get(const std::string& name) const {
    const auto it = loggers_.find(name);
    if (it == loggers_.end()) throw std::runtime_error("[LogRegistry] Logger not found: " + name);
    return it->second;
}

void LogRegistry::flush() const {
    for (const auto& [_, logger] : loggers_) logger->flush();
}
