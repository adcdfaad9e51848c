#pragma once

#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

namespace cw::config {

// Raised for missing or invalid configuration. Only ever fatal at startup.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error("[Config] " + what) {}
};

struct RemoteConfig {
    std::string host;
    uint16_t port = 21;
    std::string user = "anonymous";
    std::string password;
    std::string password_env;  // takes precedence over password when set and present
    unsigned int timeout_seconds = 30;
    std::string charset = "UTF-8";
    std::string rundown_path;  // legacy single-feed layout

    [[nodiscard]] std::string resolvePassword() const;
};

struct FetcherConfig {
    std::string id_pattern = R"(/status/(\d+))";
    std::string metadata_url =
        "https://api.twitter.com/2/tweets/{id}"
        "?expansions=author_id,attachments.media_keys"
        "&tweet.fields=created_at,text"
        "&user.fields=name,username,profile_image_url"
        "&media.fields=url,type";
    std::string bearer_token_env = "CUEWATCH_BEARER_TOKEN";
    unsigned int timeout_seconds = 30;
};

struct ContentConfig {
    std::filesystem::path download_base_path;
    std::filesystem::path state_file;   // defaults to <download_base_path>/content_state.json
    std::filesystem::path index_file;   // defaults to <download_base_path>/index.csv
    std::string description_file = "asset.json";
    FetcherConfig fetcher;
};

struct LabelsConfig {
    std::string open_marker = "<ap>";
    std::string close_marker = "</ap>";
    std::vector<std::string> allowed_kinds = {"X_Total", "X_Faldon"};
    std::string filter;
};

struct MonitorConfig {
    std::string name;
    std::string path;
    unsigned int interval_seconds = 30;
    std::string filter;
    std::vector<std::string> allowed_kinds;  // empty means labels.allowed_kinds
};

struct LegacyMonitorConfig {
    bool present = false;
    unsigned int interval_seconds = 30;
    std::string filter;
};

struct ReportConfig {
    std::filesystem::path changes_file;
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum cuewatch = spdlog::level::info;
    spdlog::level::level_enum feed     = spdlog::level::info;
    spdlog::level::level_enum label    = spdlog::level::warn;
    spdlog::level::level_enum sync     = spdlog::level::info;
    spdlog::level::level_enum fetch    = spdlog::level::info;
    spdlog::level::level_enum changes  = spdlog::level::info;
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::debug;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir;  // empty disables the file sink
    LogLevelsConfig levels;
};

struct Config {
    RemoteConfig remote;
    ContentConfig content;
    LabelsConfig labels;
    std::vector<MonitorConfig> monitors;
    LegacyMonitorConfig legacy_monitor;
    ReportConfig report;
    unsigned int loop_delay_ms = 1000;
    LoggingConfig logging;

    [[nodiscard]] std::filesystem::path stateFile() const;
    [[nodiscard]] std::filesystem::path indexFile() const;
};

// Parses the YAML file, applies defaults and inheritance, and validates.
Config loadConfig(const std::filesystem::path& path);

// Same as loadConfig, from an in-memory YAML document.
Config parseConfig(const std::string& yaml);

// Fills derived values (monitor names, inherited filters, legacy monitor) and
// throws ConfigError when a required field is missing or invalid.
void finalize(Config& cfg);

}
