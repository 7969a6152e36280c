#include "bgend/moves.h"
#include "bgend/board.h"
#include "bgend/game_config.h"
#include <gtest/gtest.h>
#include <algorithm>
#include <stdexcept>
#include <vector>

using namespace bgend;

static bool contains(const std::vector<MoveList>& lists, const MoveList& want) {
    return std::find(lists.begin(), lists.end(), want) != lists.end();
}

TEST(GenerateMovesTest, OneValid) {
    GameConfiguration config(6, 2);
    Board b(config, {1, 2, 3});
    auto got = b.generate_moves(make_roll(5, 4));
    EXPECT_EQ(2u, got.size());
    EXPECT_TRUE(contains(got, {{2, 5}, {2, 4}}));
    EXPECT_TRUE(contains(got, {{2, 4}, {2, 5}}));
}

TEST(GenerateMovesTest, SecondDependent) {
    GameConfiguration config(2, 4);
    Board b(config, {0, 0, 1, 0, 1});
    // The second 4 may only overflow spot 2 once spot 4 is empty.
    auto got = b.generate_moves(make_roll(4, 4));
    ASSERT_EQ(1u, got.size());
    EXPECT_EQ(got[0], (MoveList{{4, 4}, {2, 4}}));
}

TEST(GenerateMovesTest, ValidWithHoles) {
    GameConfiguration config(3, 4);
    Board b(config, {0, 1, 0, 2, 0});
    // Spot 1 can't overflow a 4 while spot 3 is occupied.
    auto got = b.generate_moves(make_roll(4, 4));
    ASSERT_EQ(1u, got.size());
    EXPECT_EQ(got[0], (MoveList{{3, 4}, {3, 4}, {1, 4}}));
}

TEST(GenerateMovesTest, ValidWithHolesTwoDice) {
    GameConfiguration config(3, 4);
    Board b(config, {0, 1, 0, 2, 0});
    Roll two_fours = {{4, 4, 0, 0}, 2, 1, 1.0 / 36};
    ASSERT_FALSE(two_fours.is_double());
    std::vector<MoveList> got;
    generate_moves(b, two_fours, got);
    ASSERT_EQ(1u, got.size());
    EXPECT_EQ(got[0], (MoveList{{3, 4}, {3, 4}}));
}

TEST(GenerateMovesTest, OppositeOrder) {
    // 3-then-4 reaches a board that 4-then-3 can't.
    GameConfiguration config(2, 4);
    Board b(config, {0, 0, 1, 0, 1});
    auto got = b.generate_moves(make_roll(4, 3));
    EXPECT_EQ(2u, got.size());
    EXPECT_TRUE(contains(got, {{4, 3}, {2, 4}}));
    EXPECT_TRUE(contains(got, {{4, 4}, {2, 3}}));
}

TEST(GenerateMovesTest, Unfinished) {
    // Finishes before both dice are used
    GameConfiguration config(2, 2);
    Board b(config, {1, 0, 1});
    auto got = b.generate_moves(make_roll(5, 4));
    EXPECT_EQ(2u, got.size());
    EXPECT_TRUE(contains(got, {{2, 4}}));
    EXPECT_TRUE(contains(got, {{2, 5}}));
}

TEST(GenerateMovesTest, FinishedBoard) {
    GameConfiguration config(3, 2);
    Board b(config, {3, 0, 0});
    auto got = b.generate_moves(make_roll(6, 1));
    // Each order yields the empty list
    ASSERT_EQ(2u, got.size());
    EXPECT_TRUE(got[0].empty());
    EXPECT_TRUE(got[1].empty());
    EXPECT_EQ(b.apply_moves(got[0]), b);
}

TEST(GenerateMovesTest, FourDice) {
    GameConfiguration config(9, 4);
    Board b(config, {0, 0, 3, 3, 3});
    auto got = b.generate_moves(make_roll(2, 2));
    EXPECT_EQ(78u, got.size());
    EXPECT_TRUE(contains(got, {{3, 2}, {2, 2}, {2, 2}, {2, 2}}));
    EXPECT_TRUE(contains(got, {{3, 2}, {3, 2}, {3, 2}, {2, 2}}));
}

TEST(GenerateMovesTest, AppendsToOutput) {
    GameConfiguration config(2, 2);
    Board b(config, {1, 0, 1});
    std::vector<MoveList> out;
    generate_moves(b, make_roll(5, 4), out);
    generate_moves(b, make_roll(5, 4), out);
    EXPECT_EQ(4u, out.size());
}

TEST(GenerateMovesTest, AllRollsGiveValidMoves) {
    GameConfiguration config(6, 4);
    Board b(config, {0, 2, 3, 0, 1});
    for (const Roll& roll : ROLLS) {
        auto got = b.generate_moves(roll);
        EXPECT_FALSE(got.empty());
        for (const MoveList& moves : got) {
            EXPECT_NO_THROW(b.apply_moves(moves))
                << "dice " << roll.dice[0] << "," << roll.dice[1]
                << " moves " << encode_moves_string(moves);
            EXPECT_LE(static_cast<int>(moves.size()), roll.n_dice);
        }
    }
}

TEST(GenerateMovesTest, EveryMoveLowersId) {
    GameConfiguration config(4, 3);
    for (BoardId id : config.generate_valid_ids()) {
        Board b = Board::from_id(config, id);
        if (b.is_finished()) continue;
        for (const Roll& roll : ROLLS) {
            for (const MoveList& moves : b.generate_moves(roll)) {
                ASSERT_FALSE(moves.empty()) << b;
                EXPECT_LT(b.apply_moves(moves).get_id(), id) << b;
            }
        }
    }
}

TEST(MoveStringTest, TwoMoves) {
    MoveList moves = {{6, 2}, {5, 3}};
    std::string encoded = encode_moves_string(moves);
    EXPECT_EQ("[[6, 2], [5, 3]]", encoded);
    EXPECT_EQ(moves, decode_moves_string(encoded));
}

TEST(MoveStringTest, FourMoves) {
    MoveList moves = {{6, 1}, {5, 1}, {4, 1}, {3, 1}};
    std::string encoded = encode_moves_string(moves);
    EXPECT_EQ("[[6, 1], [5, 1], [4, 1], [3, 1]]", encoded);
    EXPECT_EQ(moves, decode_moves_string(encoded));
}

TEST(MoveStringTest, Empty) {
    EXPECT_EQ("[]", encode_moves_string({}));
    EXPECT_TRUE(decode_moves_string("[]").empty());
    EXPECT_TRUE(decode_moves_string(" [ ] ").empty());
}

TEST(MoveStringTest, IgnoresWhitespace) {
    EXPECT_EQ((MoveList{{4, 3}, {2, 4}}), decode_moves_string("[[4,3],[2,4]]"));
    EXPECT_EQ((MoveList{{4, 3}}), decode_moves_string("[ [ 4 , 3 ] ]\n"));
}

TEST(MoveStringTest, Malformed) {
    EXPECT_THROW(decode_moves_string(""), std::invalid_argument);
    EXPECT_THROW(decode_moves_string("[[1, 2]"), std::invalid_argument);
    EXPECT_THROW(decode_moves_string("[[1]]"), std::invalid_argument);
    EXPECT_THROW(decode_moves_string("[[1, 2, 3]]"), std::invalid_argument);
    EXPECT_THROW(decode_moves_string("[[a, 2]]"), std::invalid_argument);
    EXPECT_THROW(decode_moves_string("[[1, 2]] x"), std::invalid_argument);
    EXPECT_THROW(decode_moves_string("[[1, 2],]"), std::invalid_argument);
}
