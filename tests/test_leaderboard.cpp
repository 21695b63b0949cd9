#include <gtest/gtest.h>
#include "gameplay/Leaderboard.hpp"
#include "engine/Log.hpp"

#include <filesystem>
#include <fstream>
#include <string>

using namespace spectral;

namespace fs = std::filesystem;

class LeaderboardTest : public ::testing::Test {
protected:
    void SetUp() override {
        Log::init("", "off");
        cleanup();
    }

    void TearDown() override {
        cleanup();
    }

    void cleanup() {
        std::error_code ec;
        fs::remove(path, ec);
        fs::remove(path + ".bak", ec);
    }

    void fill(Leaderboard& board, std::initializer_list<int> scores) {
        int wave = 1;
        for (int score : scores) {
            board.saveHighScore(score, wave++, 60.0f, "2024-01-01T00:00:00Z");
        }
    }

    std::string path = "/tmp/spectral_test_scores.json";
};

// =============================================================================
// High score rules
// =============================================================================

TEST_F(LeaderboardTest, EmptyTable) {
    PersistentStore store;
    Leaderboard board(store);
    EXPECT_TRUE(board.getHighScores().empty());
    EXPECT_EQ(board.capacity(), 5u);
    EXPECT_TRUE(board.isNewHighScore(1));
    EXPECT_FALSE(board.isNewHighScore(0));
}

TEST_F(LeaderboardTest, ZeroScoreIsNeverRecorded) {
    PersistentStore store;
    Leaderboard board(store);
    EXPECT_FALSE(board.saveHighScore(0, 1, 10.0f));
    EXPECT_FALSE(store.has(Leaderboard::STORAGE_KEY));
}

TEST_F(LeaderboardTest, FullTableNeedsToBeatLowest) {
    PersistentStore store;
    Leaderboard board(store);
    fill(board, {500, 400, 300, 200, 100});

    EXPECT_FALSE(board.isNewHighScore(100));
    EXPECT_FALSE(board.isNewHighScore(50));
    EXPECT_TRUE(board.isNewHighScore(101));
    EXPECT_FALSE(board.saveHighScore(100, 9, 1.0f));
}

TEST_F(LeaderboardTest, SortedAndTruncated) {
    PersistentStore store;
    Leaderboard board(store);
    fill(board, {300, 100, 500, 200, 400});
    EXPECT_TRUE(board.saveHighScore(350, 7, 90.0f, "2024-02-02T00:00:00Z"));

    auto scores = board.getHighScores();
    ASSERT_EQ(scores.size(), 5u);
    EXPECT_EQ(scores[0].score, 500);
    EXPECT_EQ(scores[1].score, 400);
    EXPECT_EQ(scores[2].score, 350);
    EXPECT_EQ(scores[2].wave, 7);
    EXPECT_EQ(scores[2].isoDate, "2024-02-02T00:00:00Z");
    EXPECT_EQ(scores[4].score, 200);
}

TEST_F(LeaderboardTest, StoredEntryFieldNames) {
    PersistentStore store;
    Leaderboard board(store);
    ASSERT_TRUE(board.saveHighScore(250, 4, 75.5f, "2024-03-03T12:00:00Z"));

    nlohmann::json stored = store.get(Leaderboard::STORAGE_KEY, nlohmann::json());
    ASSERT_TRUE(stored.is_array());
    ASSERT_EQ(stored.size(), 1u);
    const auto& entry = stored[0];
    EXPECT_EQ(entry.value("score", 0), 250);
    EXPECT_EQ(entry.value("wave", 0), 4);
    EXPECT_FLOAT_EQ(entry.value("survivalTimeSeconds", 0.0f), 75.5f);
    EXPECT_EQ(entry.value("isoDate", std::string()), "2024-03-03T12:00:00Z");
    EXPECT_FALSE(entry.contains("date"));
}

TEST_F(LeaderboardTest, CustomCapacity) {
    PersistentStore store;
    Leaderboard board(store, 2);
    fill(board, {10, 20, 30});
    auto scores = board.getHighScores();
    ASSERT_EQ(scores.size(), 2u);
    EXPECT_EQ(scores[0].score, 30);
    EXPECT_EQ(scores[1].score, 20);
}

TEST_F(LeaderboardTest, MalformedEntriesAreSkipped) {
    PersistentStore store;
    store.set(Leaderboard::STORAGE_KEY, nlohmann::json::array({
        {{"score", 300}, {"wave", 3}},
        "garbage",
        42,
        {{"score", "lots"}},
        {{"score", 100}, {"wave", 1}},
    }));
    Leaderboard board(store);

    auto scores = board.getHighScores();
    ASSERT_EQ(scores.size(), 2u);
    EXPECT_EQ(scores[0].score, 300);
    EXPECT_EQ(scores[1].score, 100);
}

TEST_F(LeaderboardTest, NonArrayValueIsIgnored) {
    PersistentStore store;
    store.set(Leaderboard::STORAGE_KEY, "not a table");
    Leaderboard board(store);
    EXPECT_TRUE(board.getHighScores().empty());
}

TEST_F(LeaderboardTest, IsoDateFormat) {
    std::string date = Leaderboard::currentIsoDate();
    ASSERT_EQ(date.size(), 20u);
    EXPECT_EQ(date[4], '-');
    EXPECT_EQ(date[10], 'T');
    EXPECT_EQ(date.back(), 'Z');
}

// =============================================================================
// Persistence
// =============================================================================

TEST_F(LeaderboardTest, SurvivesReload) {
    {
        PersistentStore store(path);
        Leaderboard board(store);
        fill(board, {700, 900});
    }

    PersistentStore store(path);
    ASSERT_TRUE(store.load());
    Leaderboard board(store);
    auto scores = board.getHighScores();
    ASSERT_EQ(scores.size(), 2u);
    EXPECT_EQ(scores[0].score, 900);
    EXPECT_EQ(scores[0].wave, 2);
    EXPECT_FLOAT_EQ(scores[0].survivalTimeSeconds, 60.0f);
}

TEST_F(LeaderboardTest, MissingFileLoadsEmpty) {
    PersistentStore store(path);
    EXPECT_TRUE(store.load());
    EXPECT_FALSE(store.has(Leaderboard::STORAGE_KEY));
}

TEST_F(LeaderboardTest, CorruptFileFallsBackToBackup) {
    {
        PersistentStore store(path);
        Leaderboard board(store);
        fill(board, {100});
        fill(board, {200});   // second save backs up the first
    }
    {
        std::ofstream file(path);
        file << "{ not json";
    }

    PersistentStore store(path);
    ASSERT_TRUE(store.load());
    Leaderboard board(store);
    auto scores = board.getHighScores();
    ASSERT_EQ(scores.size(), 1u);
    EXPECT_EQ(scores[0].score, 100);
}

TEST_F(LeaderboardTest, CorruptFileWithoutBackupFails) {
    {
        std::ofstream file(path);
        file << "[1, 2";
    }
    PersistentStore store(path);
    EXPECT_FALSE(store.load());
}

TEST_F(LeaderboardTest, NonObjectFileFallsBack) {
    {
        std::ofstream file(path);
        file << "[1, 2, 3]";
    }
    PersistentStore store(path);
    EXPECT_FALSE(store.load());
}

TEST_F(LeaderboardTest, InMemoryStoreNeverTouchesDisk) {
    PersistentStore store;
    Leaderboard board(store);
    fill(board, {100});
    EXPECT_FALSE(store.isDirty());
    EXPECT_TRUE(store.path().empty());
}

TEST_F(LeaderboardTest, StoreRejectsOversizedValues) {
    PersistentStore store;
    std::string huge(MAX_STORE_FILE_SIZE + 1, 'x');
    EXPECT_FALSE(store.set("blob", huge));
    EXPECT_FALSE(store.has("blob"));

    store.set("keep", 1);
    EXPECT_FALSE(store.set("keep", huge));
    EXPECT_EQ(store.get("keep").get<int>(), 1);
}

TEST_F(LeaderboardTest, StoreRemoveAndClear) {
    PersistentStore store;
    store.set("a", 1);
    EXPECT_TRUE(store.remove("a"));
    EXPECT_FALSE(store.remove("a"));
    store.set("b", 2);
    store.clear();
    EXPECT_FALSE(store.has("b"));
    EXPECT_EQ(store.get("b", 7).get<int>(), 7);
}
