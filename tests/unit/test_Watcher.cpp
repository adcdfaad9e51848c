#include <gtest/gtest.h>
#include "feed/Watcher.hpp"
#include "fakes.hpp"

#include <algorithm>

using namespace cw;
using namespace cw::feed;
using namespace std::chrono_literals;

class WatcherTest : public ::testing::Test {
protected:
    test::TempDir dir;
    std::shared_ptr<runtime::Context> ctx = test::makeContext(test::baseConfig(dir.path));
    test::FakeReader reader;
    const std::string folder = "SHOW.RUNDOWN";
    const Watcher::Clock::time_point t0 = Watcher::Clock::now();

    Watcher makeWatcher() const { return Watcher(ctx->config.monitors.front(), ctx); }

    void SetUp() override {
        reader.put(folder, "0001", test::story("Portada", {"X_Total | https://x.com/a/status/1 |"}));
        reader.put(folder, "0002", test::story("Deportes", {"[CG1] X_Faldon |https://x.com/b/status/2|"}));
        reader.put(folder, "0003", test::story("Sin rotulos", {"[CG1] Faldon |texto libre|"}));
        reader.putDir(folder, "ARCHIVE");
        reader.connect();
        reader.navigateTo(folder);
    }
};

TEST_F(WatcherTest, NeverPolledIsDue) {
    auto w = makeWatcher();
    EXPECT_TRUE(w.isDue(t0));
    EXPECT_EQ(w.status(), Watcher::Status::Idle);
    EXPECT_FALSE(w.lastPoll().has_value());
}

TEST_F(WatcherTest, DueAfterInterval) {
    auto w = makeWatcher();
    w.poll(reader, t0);
    EXPECT_FALSE(w.isDue(t0 + 10s));
    EXPECT_TRUE(w.isDue(t0 + 30s));
}

TEST_F(WatcherTest, FirstPollReportsMatchingEntries) {
    auto w = makeWatcher();
    const auto changes = w.poll(reader, t0);

    ASSERT_EQ(changes.size(), 2u);
    EXPECT_EQ(changes[0].entry_name, "0001");
    EXPECT_EQ(changes[0].info.title, "Portada");
    EXPECT_EQ(changes[0].watcher_name, "NEWS");
    EXPECT_FALSE(changes[0].timestamp.empty());
    EXPECT_EQ(changes[1].entry_name, "0002");

    EXPECT_EQ(w.activeReferences(), (std::vector<std::string>{"https://x.com/a/status/1", "https://x.com/b/status/2"}));
    EXPECT_EQ(w.fingerprints().size(), 2u);
    EXPECT_EQ(w.lastOutcome(), Watcher::Status::Completed);
    EXPECT_EQ(w.status(), Watcher::Status::Idle);
}

TEST_F(WatcherTest, DirectoriesAreNotRead) {
    auto w = makeWatcher();
    w.poll(reader, t0);
    EXPECT_EQ(std::count(reader.reads.begin(), reader.reads.end(), "ARCHIVE"), 0);
}

TEST_F(WatcherTest, UnchangedContentIsNotReportedAgain) {
    auto w = makeWatcher();
    w.poll(reader, t0);

    EXPECT_TRUE(w.poll(reader, t0 + 30s).empty());
    EXPECT_EQ(w.activeReferences().size(), 2u);

    reader.put(folder, "0002", test::story("Deportes", {"[CG1] X_Faldon |https://x.com/b/status/3|"}));
    const auto changes = w.poll(reader, t0 + 60s);
    ASSERT_EQ(changes.size(), 1u);
    EXPECT_EQ(changes[0].entry_name, "0002");
    EXPECT_EQ(w.activeReferences(), (std::vector<std::string>{"https://x.com/a/status/1", "https://x.com/b/status/3"}));
}

TEST_F(WatcherTest, ListingFailureKeepsState) {
    auto w = makeWatcher();
    w.poll(reader, t0);
    const auto refs = w.activeReferences();
    const auto prints = w.fingerprints();

    reader.failListing.insert(folder);
    const auto changes = w.poll(reader, t0 + 30s);

    EXPECT_TRUE(changes.empty());
    EXPECT_EQ(w.lastOutcome(), Watcher::Status::Failed);
    EXPECT_EQ(w.activeReferences(), refs);
    EXPECT_EQ(w.fingerprints(), prints);
}

TEST_F(WatcherTest, EmptyListingKeepsState) {
    auto w = makeWatcher();
    w.poll(reader, t0);
    const auto refs = w.activeReferences();

    reader.folders[folder].entries.clear();
    const auto readsBefore = reader.reads.size();
    w.poll(reader, t0 + 30s);

    EXPECT_EQ(w.lastOutcome(), Watcher::Status::Failed);
    EXPECT_EQ(w.activeReferences(), refs);
    EXPECT_EQ(reader.reads.size(), readsBefore);
}

TEST_F(WatcherTest, OneBadEntryDoesNotAbortCycle) {
    reader.throwOnRead.insert("0001");
    auto w = makeWatcher();
    const auto changes = w.poll(reader, t0);

    ASSERT_EQ(changes.size(), 1u);
    EXPECT_EQ(changes[0].entry_name, "0002");
    EXPECT_EQ(w.lastOutcome(), Watcher::Status::Completed);
    EXPECT_EQ(w.activeReferences(), (std::vector<std::string>{"https://x.com/b/status/2"}));
}

TEST_F(WatcherTest, NoReadableEntryKeepsReferences) {
    auto w = makeWatcher();
    w.poll(reader, t0);
    const auto refs = w.activeReferences();
    ASSERT_EQ(refs.size(), 2u);

    reader.throwOnRead = {"0001", "0002", "0003"};
    const auto changes = w.poll(reader, t0 + 30s);

    EXPECT_TRUE(changes.empty());
    EXPECT_EQ(w.lastOutcome(), Watcher::Status::Failed);
    EXPECT_EQ(w.activeReferences(), refs);
}

TEST_F(WatcherTest, SessionDropMidCycleKeepsReferences) {
    auto w = makeWatcher();
    w.poll(reader, t0);
    const auto refs = w.activeReferences();

    reader.put(folder, "0002", test::story("Deportes", {"[CG1] X_Faldon |https://x.com/b/status/3|"}));
    reader.dropOnRead.insert("0001");
    const auto changes = w.poll(reader, t0 + 30s);

    EXPECT_EQ(reader.connectCalls, 2);
    EXPECT_EQ(w.lastOutcome(), Watcher::Status::Failed);
    EXPECT_EQ(w.activeReferences(), refs);

    // entries after the drop are still read from the rundown folder
    ASSERT_EQ(changes.size(), 1u);
    EXPECT_EQ(changes[0].entry_name, "0002");
    EXPECT_EQ(reader.cwd, folder);

    // the next clean cycle picks the new reference up
    w.poll(reader, t0 + 60s);
    EXPECT_EQ(w.lastOutcome(), Watcher::Status::Completed);
    EXPECT_EQ(w.activeReferences(), (std::vector<std::string>{"https://x.com/a/status/1", "https://x.com/b/status/3"}));
}

TEST_F(WatcherTest, DepartedEntriesLoseTheirFingerprints) {
    auto w = makeWatcher();
    w.poll(reader, t0);
    ASSERT_TRUE(w.fingerprints().contains("0001"));

    reader.remove(folder, "0001");
    w.poll(reader, t0 + 30s);
    EXPECT_FALSE(w.fingerprints().contains("0001"));
    EXPECT_TRUE(w.fingerprints().contains("0002"));
}

TEST_F(WatcherTest, RemovedEntryDropsItsReferences) {
    auto w = makeWatcher();
    w.poll(reader, t0);

    reader.remove(folder, "0001");
    w.poll(reader, t0 + 30s);
    EXPECT_EQ(w.activeReferences(), (std::vector<std::string>{"https://x.com/b/status/2"}));
}

TEST_F(WatcherTest, LiteralFilterSelectsEntries) {
    auto cfg = ctx->config.monitors.front();
    cfg.filter = "texto libre";
    cfg.allowed_kinds = {"Faldon"};
    Watcher w(cfg, ctx);

    const auto changes = w.poll(reader, t0);
    ASSERT_EQ(changes.size(), 1u);
    EXPECT_EQ(changes[0].entry_name, "0003");
    EXPECT_EQ(w.activeReferences(), (std::vector<std::string>{"texto libre"}));
}

TEST(WatcherStatusTest, ToString) {
    EXPECT_EQ(to_string(Watcher::Status::Completed), "completed");
    EXPECT_EQ(to_string(Watcher::Status::Failed), "failed");
}
