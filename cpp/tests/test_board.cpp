#include "bgend/board.h"
#include "bgend/game_config.h"
#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

using namespace bgend;

using Counts = std::vector<int>;

TEST(BoardTest, FromId) {
    GameConfiguration config(6, 2);
    // 1 off, 2 on spot 1, 3 on spot 2: 11101101
    Board b = Board::from_id(config, 0xED);
    EXPECT_EQ(b.spot_counts(), (Counts{1, 2, 3}));
    EXPECT_EQ(b.get_id(), 0xEDu);
}

TEST(BoardTest, FromInvalidId) {
    GameConfiguration config(6, 2);
    EXPECT_THROW(Board::from_id(config, 0xEC), InvalidId);   // 5 markers
    EXPECT_THROW(Board::from_id(config, 0x3F00), InvalidId); // past max
    EXPECT_THROW(Board::from_id(config, 0), InvalidId);
}

TEST(BoardTest, SpotCounts) {
    GameConfiguration config(6, 2);
    Board b(config, {1, 2, 3});
    EXPECT_EQ(b.spot_counts(), (Counts{1, 2, 3}));
    EXPECT_EQ(b[2], 3);
}

TEST(BoardTest, SpotCountsErrors) {
    GameConfiguration config(6, 2);
    EXPECT_THROW(Board(config, {5, 1}), InvalidSpotCounts);
    EXPECT_THROW(Board(config, {3, 1, 1, 1}), InvalidSpotCounts);
    EXPECT_THROW(Board(config, {1, 1, 1}), InvalidSpotCounts);
    EXPECT_THROW(Board(config, {8, -1, -1}), InvalidSpotCounts);
}

TEST(BoardTest, IsFinished) {
    GameConfiguration config(6, 2);
    EXPECT_TRUE(Board(config, {6, 0, 0}).is_finished());
    EXPECT_FALSE(Board(config, {5, 0, 1}).is_finished());
    EXPECT_TRUE(Board::from_id(config, config.min_board_id()).is_finished());
}

TEST(BoardTest, TotalPips) {
    GameConfiguration config(6, 3);
    EXPECT_EQ(0, Board(config, {6, 0, 0, 0}).total_pips());
    EXPECT_EQ(5, Board(config, {1, 5, 0, 0}).total_pips());
    EXPECT_EQ(14, Board(config, {0, 1, 2, 3}).total_pips());
}

TEST(BoardTest, Print) {
    GameConfiguration config(6, 2);
    std::ostringstream ss;
    ss << Board(config, {1, 2, 3});
    EXPECT_EQ(ss.str(), "Board([1, 2, 3])");
}

TEST(BoardTest, PrettyPrint) {
    GameConfiguration config(6, 2);
    Board b = Board::from_id(config, 0xED);
    EXPECT_EQ(b.pretty_string(),
              "0 1 o   \n"
              "1 2 oo  \n"
              "2 3 ooo \n");
}

TEST(BoardTest, PrettyPrintWithMoves) {
    GameConfiguration config(6, 4);
    Board b(config, {2, 1, 1, 1, 1});

    MoveList moves = {{3, 2}, {3, 3}, {3, 6}, {4, 1}};
    EXPECT_EQ(b.pretty_string(moves),
              "0 2 oo   x +   \n"
              "1 1 o  x | |   \n"
              "2 1 o  | | |   \n"
              "3 1 o  2 3 6 x \n"
              "4 1 o        1 \n");
}

TEST(BoardTest, ApplyMove) {
    GameConfiguration config(6, 2);
    Board b(config, {1, 2, 3});

    EXPECT_EQ(b.apply_move({2, 6}), Board(config, {2, 2, 2}));
    EXPECT_EQ(b.apply_move({2, 1}), Board(config, {1, 3, 2}));
    EXPECT_EQ(b.apply_move({1, 1}), Board(config, {2, 1, 3}));
    EXPECT_EQ(b.apply_move({2, 2}), Board(config, {2, 2, 2}));
    // Receiver is unchanged
    EXPECT_EQ(b, Board(config, {1, 2, 3}));
}

TEST(BoardTest, ApplyMoveLowersId) {
    GameConfiguration config(6, 2);
    Board b(config, {1, 2, 3});
    for (const Move& m : MoveList{{2, 6}, {2, 1}, {1, 1}, {2, 2}}) {
        EXPECT_LT(b.apply_move(m).get_id(), b.get_id());
    }
}

static void expect_invalid_move(const Board& b, const Move& m, const std::string& message) {
    try {
        b.apply_move(m);
        FAIL() << "expected InvalidMove for spot " << m.spot << " count " << m.count;
    } catch (const InvalidMove& e) {
        EXPECT_NE(std::string(e.what()).find(message), std::string::npos) << e.what();
    }
}

TEST(BoardTest, ApplyMoveErrors) {
    GameConfiguration config(6, 2);

    Board b(config, {1, 2, 3});
    expect_invalid_move(b, {0, 6}, "Invalid spot");
    expect_invalid_move(b, {3, 1}, "Invalid spot");
    expect_invalid_move(b, {2, 0}, "Invalid count");
    expect_invalid_move(Board(config, {3, 0, 3}), {1, 1}, "No marker");
    expect_invalid_move(b, {1, 6}, "Overflow count");
}

TEST(BoardTest, ApplyMoves) {
    GameConfiguration config(6, 2);
    Board b(config, {1, 2, 3});
    EXPECT_EQ(b.apply_moves({{2, 1}, {1, 1}}), Board(config, {2, 2, 2}));
    EXPECT_EQ(b.apply_moves({{2, 1}, {2, 1}, {2, 2}}), Board(config, {2, 4, 0}));
    EXPECT_EQ(b.apply_moves({}), b);
    // Spot 1 is empty by the third move
    EXPECT_THROW(b.apply_moves({{1, 1}, {1, 1}, {1, 1}}), InvalidMove);
    EXPECT_EQ(b, Board(config, {1, 2, 3}));
}

class BoardSizes : public ::testing::TestWithParam<std::pair<int, int>> {};

TEST_P(BoardSizes, IdRoundTrip) {
    GameConfiguration config(GetParam().first, GetParam().second);
    for (BoardId id = config.min_board_id(); id < config.max_board_id(); ++id) {
        if (!config.is_valid_id(id)) continue;
        Board b = Board::from_id(config, id);
        EXPECT_EQ(b.get_id(), id);
    }
}

TEST_P(BoardSizes, NextValidBoard) {
    GameConfiguration config(GetParam().first, GetParam().second);
    Board b = Board::from_id(config, config.min_board_id());

    ValidIdRange ids = config.generate_valid_ids();
    auto it = ids.begin();
    ++it;
    for (;;) {
        std::optional<Board> next = b.next_valid_board();
        if (!next) {
            EXPECT_TRUE(it == ids.end()) << "id sequence not finished after " << b;
            break;
        }
        ASSERT_TRUE(it != ids.end()) << "id sequence ran out before " << *next;
        EXPECT_EQ(next->get_id(), *it) << "old b: " << b << "; next b: " << *next;
        b = *next;
        ++it;
    }
}

INSTANTIATE_TEST_SUITE_P(Sizes, BoardSizes,
                         ::testing::Values(std::make_pair(5, 3), std::make_pair(10, 5)));
