#include <gtest/gtest.h>
#include "config/Config.hpp"
#include "fakes.hpp"

#include <cstdlib>
#include <fstream>

using namespace cw::config;

namespace {

const std::string MINIMAL = R"(
remote:
  host: inews.local
content:
  download_base_path: /var/lib/cuewatch
monitors:
  - path: SHOW.RUNDOWN
)";

}

TEST(ConfigTest, MinimalDefaults) {
    const auto cfg = parseConfig(MINIMAL);
    EXPECT_EQ(cfg.remote.host, "inews.local");
    EXPECT_EQ(cfg.remote.port, 21);
    EXPECT_EQ(cfg.remote.user, "anonymous");
    EXPECT_EQ(cfg.loop_delay_ms, 1000u);
    EXPECT_EQ(cfg.labels.open_marker, "<ap>");
    EXPECT_EQ(cfg.labels.close_marker, "</ap>");
    EXPECT_EQ(cfg.content.description_file, "asset.json");
    EXPECT_EQ(cfg.stateFile(), std::filesystem::path("/var/lib/cuewatch/content_state.json"));
    EXPECT_EQ(cfg.indexFile(), std::filesystem::path("/var/lib/cuewatch/index.csv"));

    ASSERT_EQ(cfg.monitors.size(), 1u);
    EXPECT_EQ(cfg.monitors[0].name, "MONITOR_1");
    EXPECT_EQ(cfg.monitors[0].interval_seconds, 30u);
    EXPECT_EQ(cfg.monitors[0].allowed_kinds, (std::vector<std::string>{"X_Total", "X_Faldon"}));
}

TEST(ConfigTest, MonitorsInheritLabelsFilterAndKinds) {
    const auto cfg = parseConfig(R"(
remote: { host: inews.local }
content: { download_base_path: /tmp/cw }
labels:
  allowed_kinds: [X_Total]
  filter: LABELS
monitors:
  - { name: MORNING, path: AM.RUNDOWN, interval_seconds: 10 }
  - { path: PM.RUNDOWN, filter: "Deportes", allowed_kinds: [Faldon] }
)");

    ASSERT_EQ(cfg.monitors.size(), 2u);
    EXPECT_EQ(cfg.monitors[0].name, "MORNING");
    EXPECT_EQ(cfg.monitors[0].filter, "LABELS");
    EXPECT_EQ(cfg.monitors[0].allowed_kinds, (std::vector<std::string>{"X_Total"}));
    EXPECT_EQ(cfg.monitors[1].name, "MONITOR_2");
    EXPECT_EQ(cfg.monitors[1].filter, "Deportes");
    EXPECT_EQ(cfg.monitors[1].allowed_kinds, (std::vector<std::string>{"Faldon"}));
}

TEST(ConfigTest, LegacyLayoutAddsDefaultMonitorFirst) {
    const auto cfg = parseConfig(R"(
remote:
  host: inews.local
  rundown_path: SHOW.NEWS.RUNDOWN
monitor:
  interval_seconds: 15
  filter: Titular
content: { download_base_path: /tmp/cw }
monitors:
  - { name: EXTRA, path: OTHER.RUNDOWN }
)");

    ASSERT_EQ(cfg.monitors.size(), 2u);
    EXPECT_EQ(cfg.monitors[0].name, "DEFAULT");
    EXPECT_EQ(cfg.monitors[0].path, "SHOW.NEWS.RUNDOWN");
    EXPECT_EQ(cfg.monitors[0].interval_seconds, 15u);
    EXPECT_EQ(cfg.monitors[0].filter, "Titular");
    EXPECT_EQ(cfg.monitors[1].name, "EXTRA");
    EXPECT_EQ(cfg.monitors[1].filter, "Titular");
}

TEST(ConfigTest, ValidationErrors) {
    EXPECT_THROW(parseConfig("content: { download_base_path: /tmp }\nmonitors: [{path: A}]"), ConfigError);
    EXPECT_THROW(parseConfig("remote: { host: h }\nmonitors: [{path: A}]"), ConfigError);
    EXPECT_THROW(parseConfig("remote: { host: h }\ncontent: { download_base_path: /tmp }"), ConfigError);
    EXPECT_THROW(parseConfig("remote: { host: h }\ncontent: { download_base_path: /tmp }\nmonitors: [{name: X}]"), ConfigError);
    EXPECT_THROW(parseConfig("remote: { host: h }\ncontent: { download_base_path: /tmp }\nmonitors: [{path: A, interval_seconds: 0}]"), ConfigError);
    EXPECT_THROW(parseConfig(MINIMAL + "labels: { open_marker: \"\" }\n"), ConfigError);
    EXPECT_THROW(parseConfig(MINIMAL + "loop_delay_ms: soon\n"), ConfigError);
    EXPECT_THROW(parseConfig("remote: [not, a, map]"), ConfigError);
    EXPECT_THROW(parseConfig("- just\n- a list\n"), ConfigError);
    EXPECT_THROW(parseConfig("remote: { host: h\n"), ConfigError);
}

TEST(ConfigTest, ErrorMessagesArePrefixed) {
    try {
        parseConfig("remote: { host: h }\nmonitors: [{path: A}]");
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_NE(std::string(e.what()).find("[Config]"), std::string::npos);
        EXPECT_NE(std::string(e.what()).find("download_base_path"), std::string::npos);
    }
}

TEST(ConfigTest, PasswordFromEnvironment) {
    RemoteConfig remote;
    remote.password = "inline";
    EXPECT_EQ(remote.resolvePassword(), "inline");

    remote.password_env = "CUEWATCH_TEST_PASSWORD";
    ::unsetenv("CUEWATCH_TEST_PASSWORD");
    EXPECT_EQ(remote.resolvePassword(), "inline");

    ::setenv("CUEWATCH_TEST_PASSWORD", "secret", 1);
    EXPECT_EQ(remote.resolvePassword(), "secret");
    ::unsetenv("CUEWATCH_TEST_PASSWORD");
}

TEST(ConfigTest, LoggingLevels) {
    const auto cfg = parseConfig(MINIMAL + R"(
logging:
  log_dir: /tmp/cw-logs
  log_levels:
    console_log_level: warning
    subsystem_levels: { feed: debug }
)");
    EXPECT_EQ(cfg.logging.log_dir, std::filesystem::path("/tmp/cw-logs"));
    EXPECT_EQ(cfg.logging.levels.console_log_level, spdlog::level::warn);
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.feed, spdlog::level::debug);
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.sync, spdlog::level::info);
}

TEST(ConfigTest, LoadFromFile) {
    cw::test::TempDir dir;
    const auto file = dir.path / "config.yaml";
    {
        std::ofstream out(file);
        out << MINIMAL << "report: { changes_file: /tmp/cw/changes.jsonl }\nloop_delay_ms: 250\n";
    }

    const auto cfg = loadConfig(file);
    EXPECT_EQ(cfg.loop_delay_ms, 250u);
    EXPECT_EQ(cfg.report.changes_file, std::filesystem::path("/tmp/cw/changes.jsonl"));
    EXPECT_THROW(loadConfig(dir.path / "missing.yaml"), ConfigError);
}
