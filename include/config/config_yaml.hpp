#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace cw::config;

template<>
struct convert<RemoteConfig> {
    static Node encode(const RemoteConfig& rhs) {
        Node node;
        node["host"] = rhs.host;
        node["port"] = rhs.port;
        node["user"] = rhs.user;
        node["password_env"] = rhs.password_env;
        node["timeout_seconds"] = rhs.timeout_seconds;
        node["charset"] = rhs.charset;
        if (!rhs.rundown_path.empty()) node["rundown_path"] = rhs.rundown_path;
        return node;
    }

    static bool decode(const Node& node, RemoteConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.host = node["host"].as<std::string>("");
        rhs.port = node["port"].as<uint16_t>(21);
        rhs.user = node["user"].as<std::string>("anonymous");
        rhs.password = node["password"].as<std::string>("");
        rhs.password_env = node["password_env"].as<std::string>("");
        rhs.timeout_seconds = node["timeout_seconds"].as<unsigned int>(30);
        rhs.charset = node["charset"].as<std::string>("UTF-8");
        rhs.rundown_path = node["rundown_path"].as<std::string>("");
        return true;
    }
};

template<>
struct convert<FetcherConfig> {
    static Node encode(const FetcherConfig& rhs) {
        Node node;
        node["id_pattern"] = rhs.id_pattern;
        node["metadata_url"] = rhs.metadata_url;
        node["bearer_token_env"] = rhs.bearer_token_env;
        node["timeout_seconds"] = rhs.timeout_seconds;
        return node;
    }

    static bool decode(const Node& node, FetcherConfig& rhs) {
        if (!node.IsMap()) return false;
        const FetcherConfig defaults;
        rhs.id_pattern = node["id_pattern"].as<std::string>(defaults.id_pattern);
        rhs.metadata_url = node["metadata_url"].as<std::string>(defaults.metadata_url);
        rhs.bearer_token_env = node["bearer_token_env"].as<std::string>(defaults.bearer_token_env);
        rhs.timeout_seconds = node["timeout_seconds"].as<unsigned int>(defaults.timeout_seconds);
        return true;
    }
};

template<>
struct convert<ContentConfig> {
    static Node encode(const ContentConfig& rhs) {
        Node node;
        node["download_base_path"] = rhs.download_base_path.string();
        node["state_file"] = rhs.state_file.string();
        node["index_file"] = rhs.index_file.string();
        node["description_file"] = rhs.description_file;
        node["fetcher"] = rhs.fetcher;
        return node;
    }

    static bool decode(const Node& node, ContentConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.download_base_path = node["download_base_path"].as<std::string>("");
        rhs.state_file = node["state_file"].as<std::string>("");
        rhs.index_file = node["index_file"].as<std::string>("");
        rhs.description_file = node["description_file"].as<std::string>("asset.json");
        if (const auto fetcher = node["fetcher"]; fetcher && !convert<FetcherConfig>::decode(fetcher, rhs.fetcher))
            return false;
        return true;
    }
};

template<>
struct convert<LabelsConfig> {
    static Node encode(const LabelsConfig& rhs) {
        Node node;
        node["open_marker"] = rhs.open_marker;
        node["close_marker"] = rhs.close_marker;
        node["allowed_kinds"] = rhs.allowed_kinds;
        node["filter"] = rhs.filter;
        return node;
    }

    static bool decode(const Node& node, LabelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.open_marker = node["open_marker"].as<std::string>("<ap>");
        rhs.close_marker = node["close_marker"].as<std::string>("</ap>");
        if (const auto kinds = node["allowed_kinds"]) rhs.allowed_kinds = kinds.as<std::vector<std::string>>();
        rhs.filter = node["filter"].as<std::string>("");
        return true;
    }
};

template<>
struct convert<MonitorConfig> {
    static Node encode(const MonitorConfig& rhs) {
        Node node;
        node["name"] = rhs.name;
        node["path"] = rhs.path;
        node["interval_seconds"] = rhs.interval_seconds;
        node["filter"] = rhs.filter;
        if (!rhs.allowed_kinds.empty()) node["allowed_kinds"] = rhs.allowed_kinds;
        return node;
    }

    static bool decode(const Node& node, MonitorConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.name = node["name"].as<std::string>("");
        // "rundown_path" is accepted for configs written against the legacy layout
        rhs.path = node["path"].as<std::string>(node["rundown_path"].as<std::string>(""));
        rhs.interval_seconds = node["interval_seconds"].as<unsigned int>(30);
        rhs.filter = node["filter"].as<std::string>("");
        if (const auto kinds = node["allowed_kinds"]) rhs.allowed_kinds = kinds.as<std::vector<std::string>>();
        return true;
    }
};

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["cuewatch"] = to_std_string(spdlog::level::to_string_view(rhs.cuewatch));
        node["feed"]     = to_std_string(spdlog::level::to_string_view(rhs.feed));
        node["label"]    = to_std_string(spdlog::level::to_string_view(rhs.label));
        node["sync"]     = to_std_string(spdlog::level::to_string_view(rhs.sync));
        node["fetch"]    = to_std_string(spdlog::level::to_string_view(rhs.fetch));
        node["changes"]  = to_std_string(spdlog::level::to_string_view(rhs.changes));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.cuewatch = spdlog::level::from_str(node["cuewatch"].as<std::string>("info"));
        rhs.feed = spdlog::level::from_str(node["feed"].as<std::string>("info"));
        rhs.label = spdlog::level::from_str(node["label"].as<std::string>("warning"));
        rhs.sync = spdlog::level::from_str(node["sync"].as<std::string>("info"));
        rhs.fetch = spdlog::level::from_str(node["fetch"].as<std::string>("info"));
        rhs.changes = spdlog::level::from_str(node["changes"].as<std::string>("info"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("debug"));
        if (const auto sub = node["subsystem_levels"]; sub && !convert<SubsystemLogLevelsConfig>::decode(sub, rhs.subsystem_levels))
            return false;
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["log_levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("");
        const auto levels = node["log_levels"] ? node["log_levels"] : node["levels"];
        if (levels && !convert<LogLevelsConfig>::decode(levels, rhs.levels)) return false;
        return true;
    }
};

}
