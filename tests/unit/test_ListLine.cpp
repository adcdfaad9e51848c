#include <gtest/gtest.h>
#include "feed/Entry.hpp"
#include "feed/FtpReader.hpp"

using namespace cw::feed;

TEST(ListLineTest, UnixLineKeepsSpacesInName) {
    const auto e = parseListLine("-rw-r--r--   1 inews  news     1234 May 01 12:00 STORY 0001");
    ASSERT_TRUE(e.has_value());
    EXPECT_EQ(e->name, "STORY 0001");
    EXPECT_EQ(e->size, "1234");
    EXPECT_FALSE(e->is_dir);
}

TEST(ListLineTest, UnixDirectory) {
    const auto e = parseListLine("drwxr-xr-x 2 inews news 0 Jan 1 2024 ARCHIVE");
    ASSERT_TRUE(e.has_value());
    EXPECT_EQ(e->name, "ARCHIVE");
    EXPECT_TRUE(e->is_dir);
}

TEST(ListLineTest, ShortLineUsesLastToken) {
    const auto e = parseListLine("d other SUBFOLDER");
    ASSERT_TRUE(e.has_value());
    EXPECT_EQ(e->name, "SUBFOLDER");
    EXPECT_TRUE(e->is_dir);
    EXPECT_EQ(e->size, "0");

    const auto f = parseListLine("0A1B2C3D");
    ASSERT_TRUE(f.has_value());
    EXPECT_EQ(f->name, "0A1B2C3D");
    EXPECT_FALSE(f->is_dir);
}

TEST(ListLineTest, BlankLineIsSkipped) {
    EXPECT_FALSE(parseListLine("").has_value());
    EXPECT_FALSE(parseListLine("   \t").has_value());
}

TEST(FtpReaderTest, NormalizePath) {
    EXPECT_EQ(FtpReader::normalizePath("/SHOW\\NEWS//RUNDOWN/"), "SHOW/NEWS/RUNDOWN");
    EXPECT_EQ(FtpReader::normalizePath("SHOW.RUNDOWN"), "SHOW.RUNDOWN");
    EXPECT_EQ(FtpReader::normalizePath("/"), "");
}
