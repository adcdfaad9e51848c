#include <gtest/gtest.h>
#include "runtime/Options.hpp"

#include <stdexcept>

using namespace cw::runtime;

TEST(OptionsTest, Defaults) {
    const auto opts = parseArgs({});
    EXPECT_EQ(opts.config_path, std::filesystem::path("config.yaml"));
    EXPECT_FALSE(opts.once);
    EXPECT_FALSE(opts.help);
}

TEST(OptionsTest, ShortAndLongFlags) {
    auto opts = parseArgs({"-c", "/etc/cuewatch/config.yaml", "-o"});
    EXPECT_EQ(opts.config_path, std::filesystem::path("/etc/cuewatch/config.yaml"));
    EXPECT_TRUE(opts.once);

    opts = parseArgs({"--once", "--config=alt.yaml"});
    EXPECT_EQ(opts.config_path, std::filesystem::path("alt.yaml"));
    EXPECT_TRUE(opts.once);

    EXPECT_TRUE(parseArgs({"--help"}).help);
}

TEST(OptionsTest, UsageErrors) {
    EXPECT_THROW(parseArgs({"--config"}), std::invalid_argument);
    EXPECT_THROW(parseArgs({"--verbose"}), std::invalid_argument);
    EXPECT_THROW(parseArgs({"--config="}), std::invalid_argument);
}

TEST(OptionsTest, UsageMentionsFlags) {
    const auto text = usage("cuewatch");
    EXPECT_NE(text.find("--config"), std::string::npos);
    EXPECT_NE(text.find("--once"), std::string::npos);
}
