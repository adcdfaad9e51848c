#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <cstdlib>
#include <fmt/format.h>
#include <yaml-cpp/yaml.h>

namespace cw::config {

namespace {

Config decodeRoot(const YAML::Node& root) {
    if (!root.IsMap()) throw ConfigError("Top-level document must be a mapping");

    Config cfg;
    if (const auto node = root["remote"]; node && !YAML::convert<RemoteConfig>::decode(node, cfg.remote))
        throw ConfigError("'remote' must be a mapping");
    if (const auto node = root["content"]; node && !YAML::convert<ContentConfig>::decode(node, cfg.content))
        throw ConfigError("'content' must be a mapping");
    if (const auto node = root["labels"]; node && !YAML::convert<LabelsConfig>::decode(node, cfg.labels))
        throw ConfigError("'labels' must be a mapping");
    if (const auto node = root["logging"]; node && !YAML::convert<LoggingConfig>::decode(node, cfg.logging))
        throw ConfigError("'logging' must be a mapping");

    if (const auto node = root["monitors"]) {
        if (!node.IsSequence()) throw ConfigError("'monitors' must be a list");
        for (const auto& item : node) {
            MonitorConfig m;
            if (!YAML::convert<MonitorConfig>::decode(item, m)) throw ConfigError("Each monitor must be a mapping");
            cfg.monitors.push_back(std::move(m));
        }
    }

    if (const auto node = root["monitor"]; node && node.IsMap()) {
        cfg.legacy_monitor.present = true;
        cfg.legacy_monitor.interval_seconds = node["interval_seconds"].as<unsigned int>(30);
        cfg.legacy_monitor.filter = node["filter"].as<std::string>("");
    }

    if (const auto node = root["report"]; node && node.IsMap())
        cfg.report.changes_file = node["changes_file"].as<std::string>("");

    if (const auto node = root["loop_delay_ms"]) cfg.loop_delay_ms = node.as<unsigned int>();
    return cfg;
}

}

std::string RemoteConfig::resolvePassword() const {
    if (!password_env.empty())
        if (const char* env = std::getenv(password_env.c_str())) return env;
    return password;
}

std::filesystem::path Config::stateFile() const {
    return content.state_file.empty() ? content.download_base_path / "content_state.json" : content.state_file;
}

std::filesystem::path Config::indexFile() const {
    return content.index_file.empty() ? content.download_base_path / "index.csv" : content.index_file;
}

void finalize(Config& cfg) {
    if (cfg.remote.host.empty()) throw ConfigError("Missing required field 'remote.host'");
    if (cfg.content.download_base_path.empty())
        throw ConfigError("Missing required field 'content.download_base_path'");
    if (cfg.labels.open_marker.empty() || cfg.labels.close_marker.empty())
        throw ConfigError("Label markers must not be empty");

    // Legacy layout: remote.rundown_path + monitor block, always watched first
    if (cfg.legacy_monitor.present && !cfg.remote.rundown_path.empty()) {
        MonitorConfig legacy;
        legacy.name = "DEFAULT";
        legacy.path = cfg.remote.rundown_path;
        legacy.interval_seconds = cfg.legacy_monitor.interval_seconds;
        legacy.filter = cfg.legacy_monitor.filter;
        cfg.monitors.insert(cfg.monitors.begin(), std::move(legacy));
    }

    if (cfg.monitors.empty()) throw ConfigError("No monitors configured");

    const std::string inheritedFilter = !cfg.labels.filter.empty() ? cfg.labels.filter : cfg.legacy_monitor.filter;

    for (size_t i = 0; i < cfg.monitors.size(); ++i) {
        auto& m = cfg.monitors[i];
        if (m.name.empty()) m.name = fmt::format("MONITOR_{}", i + 1);
        if (m.path.empty()) throw ConfigError(fmt::format("Monitor '{}' has no path", m.name));
        if (m.interval_seconds == 0)
            throw ConfigError(fmt::format("Monitor '{}' must have a positive interval_seconds", m.name));
        if (m.filter.empty()) m.filter = inheritedFilter;
        if (m.allowed_kinds.empty()) m.allowed_kinds = cfg.labels.allowed_kinds;
    }
}

Config parseConfig(const std::string& yaml) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml);
    } catch (const YAML::Exception& e) {
        throw ConfigError(fmt::format("Invalid YAML: {}", e.what()));
    }

    Config cfg;
    try {
        cfg = decodeRoot(root);
    } catch (const YAML::Exception& e) {
        throw ConfigError(fmt::format("Invalid value: {}", e.what()));
    }

    finalize(cfg);
    return cfg;
}

Config loadConfig(const std::filesystem::path& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::BadFile&) {
        throw ConfigError(fmt::format("Unable to open config file '{}'", path.string()));
    } catch (const YAML::Exception& e) {
        throw ConfigError(fmt::format("Invalid YAML in '{}': {}", path.string(), e.what()));
    }

    Config cfg;
    try {
        cfg = decodeRoot(root);
    } catch (const YAML::Exception& e) {
        throw ConfigError(fmt::format("Invalid value in '{}': {}", path.string(), e.what()));
    }

    finalize(cfg);
    return cfg;
}

}
