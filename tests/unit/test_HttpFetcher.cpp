#include <gtest/gtest.h>
#include "fetch/HttpFetcher.hpp"
#include "fakes.hpp"

#include <nlohmann/json.hpp>

using namespace cw;
using namespace cw::fetch;
using json = nlohmann::json;

class HttpFetcherTest : public ::testing::Test {
protected:
    test::TempDir dir;
    std::shared_ptr<runtime::Context> ctx = test::makeContext(test::baseConfig(dir.path));
};

TEST_F(HttpFetcherTest, DeriveIdFromStatusUrl) {
    HttpFetcher f(ctx);
    EXPECT_EQ(f.deriveId("https://x.com/someone/status/1790000000000000001?s=20"), "1790000000000000001");
    EXPECT_FALSE(f.deriveId("https://x.com/someone").has_value());
    EXPECT_FALSE(f.deriveId("texto libre").has_value());
}

TEST_F(HttpFetcherTest, ArtifactIsDescriptionFile) {
    HttpFetcher f(ctx);
    EXPECT_EQ(f.artifactPath(dir.path / "42"), dir.path / "42" / "asset.json");
}

TEST_F(HttpFetcherTest, InvalidIdPatternIsConfigError) {
    auto cfg = ctx->config;
    cfg.content.fetcher.id_pattern = "(unclosed";
    EXPECT_THROW(std::make_shared<HttpFetcher>(test::makeContext(cfg)), config::ConfigError);
}

TEST(HttpFetcherStaticTest, FullSizeProfileUrl) {
    EXPECT_EQ(HttpFetcher::fullSizeProfileUrl("https://pbs.twimg.com/profile_images/1/abc_normal.jpg"),
              "https://pbs.twimg.com/profile_images/1/abc_400x400.jpg");
    EXPECT_EQ(HttpFetcher::fullSizeProfileUrl("https://example.com/a.png"), "https://example.com/a.png");
}

TEST(HttpFetcherStaticTest, DescribePicksAuthorAndFirstPhoto) {
    const auto meta = json::parse(R"({
        "data": {"id": "42", "text": "Hola", "author_id": "7", "created_at": "2024-05-01T10:00:00.000Z"},
        "includes": {
            "users": [
                {"id": "3", "name": "Other", "username": "other"},
                {"id": "7", "name": "Ana", "username": "ana", "profile_image_url": "https://img/ana_normal.jpg"}
            ],
            "media": [
                {"media_key": "v", "type": "video"},
                {"media_key": "p", "type": "photo", "url": "https://img/photo.png"}
            ]
        }
    })");

    const auto doc = HttpFetcher::describe("https://x.com/ana/status/42", "42", meta);
    EXPECT_EQ(doc.at("reference"), "https://x.com/ana/status/42");
    EXPECT_EQ(doc.at("id"), "42");
    EXPECT_EQ(doc.at("text"), "Hola");
    EXPECT_EQ(doc.at("name"), "Ana");
    EXPECT_EQ(doc.at("username"), "ana");
    EXPECT_EQ(doc.at("profile_image_url"), "https://img/ana_400x400.jpg");
    EXPECT_EQ(doc.at("photo_url"), "https://img/photo.png");
    EXPECT_FALSE(doc.at("fetched_at").get<std::string>().empty());
}

TEST(HttpFetcherStaticTest, DescribeToleratesSparseMetadata) {
    const auto doc = HttpFetcher::describe("ref", "1", json::parse(R"({"data": {"text": "solo texto"}})"));
    EXPECT_EQ(doc.at("text"), "solo texto");
    EXPECT_EQ(doc.at("name"), "");
    EXPECT_EQ(doc.at("photo_url"), "");
}
