#include "bgend/compare.h"
#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <memory>
#include <string>

using namespace bgend;

class CompareTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() {
        ours_ = std::make_unique<DistributionStore>(
            std::make_shared<const GameConfiguration>(2, 4));
        ComputeConfig cc;
        cc.progress_interval = 0;
        ours_->compute(cc);
    }
    static void TearDownTestSuite() {
        ours_.reset();
    }

    static CompareConfig quiet() {
        CompareConfig cc;
        cc.progress_interval = 0;
        return cc;
    }

    // Copy of ours where finishing is made to look slow, so a store that
    // trusts it avoids finishing when it has a choice.
    static DistributionStore slow_finish() {
        DistributionStore theirs = *ours_;
        theirs.insert(theirs.config().min_board_id(),
                      MoveCountDistribution({0, 0, 0, 0, 0, 0, 0, 0, 0, 1}));
        return theirs;
    }

    static std::unique_ptr<DistributionStore> ours_;
};

std::unique_ptr<DistributionStore> CompareTest::ours_;

TEST_F(CompareTest, IdenticalStores) {
    CompareResult result = find_disagreements(*ours_, *ours_, quiet());
    EXPECT_EQ(static_cast<int>(ours_->size()), result.boards_examined);
    EXPECT_TRUE(result.disagreements.empty());
}

TEST_F(CompareTest, FindsDisagreement) {
    DistributionStore theirs = slow_finish();
    CompareResult result = find_disagreements(*ours_, theirs, quiet());
    ASSERT_FALSE(result.disagreements.empty());

    const GameConfiguration& config = ours_->config();
    BoardId id = Board(config, {0, 0, 1, 0, 1}).get_id();
    const MoveDisagreement* found = nullptr;
    for (const auto& d : result.disagreements) {
        if (d.board_id == id && d.die1 == 3 && d.die2 == 4) found = &d;
    }
    ASSERT_NE(nullptr, found);

    EXPECT_EQ((MoveList{{4, 4}, {2, 3}}), found->our_moves);
    EXPECT_DOUBLE_EQ(0.0, found->our_moves_our_ev);
    EXPECT_DOUBLE_EQ(9.0, found->our_moves_their_ev);
    EXPECT_EQ((MoveList{{4, 3}, {2, 4}}), found->their_moves);
    EXPECT_DOUBLE_EQ(1.0, found->their_moves_our_ev);
    EXPECT_DOUBLE_EQ(1.0, found->their_moves_their_ev);
}

TEST_F(CompareTest, OnlyCommonBoards) {
    DistributionStore partial(ours_->shared_config());
    ComputeConfig cc;
    cc.progress_interval = 0;
    cc.limit = 5;
    partial.compute(cc);

    CompareResult result = find_disagreements(*ours_, partial, quiet());
    EXPECT_EQ(5, result.boards_examined);
    EXPECT_TRUE(result.disagreements.empty());
}

TEST_F(CompareTest, Sampling) {
    CompareConfig cc = quiet();
    cc.sample_every = 3;
    CompareResult a = find_disagreements(*ours_, *ours_, cc);
    CompareResult b = find_disagreements(*ours_, *ours_, cc);
    EXPECT_LE(a.boards_examined, static_cast<int>(ours_->size()));
    EXPECT_EQ(a.boards_examined, b.boards_examined);
}

TEST_F(CompareTest, ConfigurationMismatch) {
    DistributionStore other(std::make_shared<const GameConfiguration>(3, 2));
    EXPECT_THROW(find_disagreements(*ours_, other, quiet()), std::invalid_argument);
}

TEST_F(CompareTest, WriteCsv) {
    DistributionStore theirs = slow_finish();
    CompareResult result = find_disagreements(*ours_, theirs, quiet());

    std::string path = ::testing::TempDir() + "bgend_disagreements.csv";
    ASSERT_TRUE(write_disagreements_csv(result.disagreements, path));

    std::ifstream f(path);
    std::string line;
    ASSERT_TRUE(std::getline(f, line));
    EXPECT_EQ("board_idx,roll0,roll1,"
              "our_moves,our_moves_our_ev,our_moves_their_ev,"
              "their_moves,their_moves_our_ev,their_moves_their_ev", line);

    size_t n_rows = 0;
    bool saw_row = false;
    std::string want = std::to_string(Board(ours_->config(), {0, 0, 1, 0, 1}).get_id()) +
                       ",3,4,\"[[4, 4], [2, 3]]\",0,9,\"[[4, 3], [2, 4]]\",";
    while (std::getline(f, line)) {
        ++n_rows;
        if (line.compare(0, want.size(), want) == 0) saw_row = true;
    }
    EXPECT_EQ(result.disagreements.size(), n_rows);
    EXPECT_TRUE(saw_row);
    std::remove(path.c_str());
}

TEST_F(CompareTest, WriteCsvBadPath) {
    EXPECT_FALSE(write_disagreements_csv({}, "/nonexistent_bgend_dir/out.csv"));
}
