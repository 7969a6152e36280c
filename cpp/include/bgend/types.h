#pragma once

#include <array>
#include <vector>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace bgend {

// Board ids are stars-and-bars bit strings of num_markers + num_spots bits.
// Set bits are markers, clear bits separate one spot from the next.
using BoardId = uint64_t;

// Largest supported num_markers + num_spots (ids must fit in a BoardId
// with one spare bit for the exclusive max).
constexpr int MAX_ID_BITS = 63;

inline int popcount(BoardId b) {
#if defined(__GNUC__)
    return __builtin_popcountll(b);
#else
    int n = 0;
    for (; b; b &= b - 1) ++n;
    return n;
#endif
}

// Index of the lowest set bit. b must be non-zero.
inline int lsb(BoardId b) {
#if defined(__GNUC__)
    return __builtin_ctzll(b);
#else
    int i = 0;
    while (!(b & 1)) { b >>= 1; ++i; }
    return i;
#endif
}

// Take one marker from `spot` (1..num_spots) and move it `count` pips
// towards home. Moves past home land on spot 0.
struct Move {
    int spot;
    int count;

    bool operator==(const Move& o) const { return spot == o.spot && count == o.count; }
    bool operator!=(const Move& o) const { return !(*this == o); }
};

// One move per die played, in play order.
using MoveList = std::vector<Move>;

// A distinct dice outcome. Doubles are played as four dice.
// weight is the number of the 36 ordered outcomes this roll covers.
struct Roll {
    std::array<int, 4> dice;
    int n_dice;
    int weight;
    double prob;

    bool is_double() const { return n_dice == 4; }
};

constexpr int NUM_ROLLS = 21;

// The 21 distinct rolls of two six-sided dice, (d1 <= d2) ascending.
inline constexpr std::array<Roll, NUM_ROLLS> ROLLS = {{
    {{1, 1, 1, 1}, 4, 1, 1.0 / 36}, {{1, 2, 0, 0}, 2, 2, 1.0 / 18},
    {{1, 3, 0, 0}, 2, 2, 1.0 / 18}, {{1, 4, 0, 0}, 2, 2, 1.0 / 18},
    {{1, 5, 0, 0}, 2, 2, 1.0 / 18}, {{1, 6, 0, 0}, 2, 2, 1.0 / 18},
    {{2, 2, 2, 2}, 4, 1, 1.0 / 36}, {{2, 3, 0, 0}, 2, 2, 1.0 / 18},
    {{2, 4, 0, 0}, 2, 2, 1.0 / 18}, {{2, 5, 0, 0}, 2, 2, 1.0 / 18},
    {{2, 6, 0, 0}, 2, 2, 1.0 / 18}, {{3, 3, 3, 3}, 4, 1, 1.0 / 36},
    {{3, 4, 0, 0}, 2, 2, 1.0 / 18}, {{3, 5, 0, 0}, 2, 2, 1.0 / 18},
    {{3, 6, 0, 0}, 2, 2, 1.0 / 18}, {{4, 4, 4, 4}, 4, 1, 1.0 / 36},
    {{4, 5, 0, 0}, 2, 2, 1.0 / 18}, {{4, 6, 0, 0}, 2, 2, 1.0 / 18},
    {{5, 5, 5, 5}, 4, 1, 1.0 / 36}, {{5, 6, 0, 0}, 2, 2, 1.0 / 18},
    {{6, 6, 6, 6}, 4, 1, 1.0 / 36},
}};

// Build a roll from two dice (in the order given). Used by tools and tests
// that need a specific die order; the probability is the canonical one.
inline Roll make_roll(int die1, int die2) {
    if (die1 == die2) {
        return {{die1, die1, die1, die1}, 4, 1, 1.0 / 36};
    }
    return {{die1, die2, 0, 0}, 2, 2, 1.0 / 18};
}

// ---- Errors ----

// Id outside [min_board_id, max_board_id) or with the wrong popcount.
class InvalidId : public std::invalid_argument {
public:
    explicit InvalidId(const std::string& what) : std::invalid_argument(what) {}
};

// Spot count sequence of the wrong length, with a negative entry, or whose
// sum is not num_markers.
class InvalidSpotCounts : public std::invalid_argument {
public:
    explicit InvalidSpotCounts(const std::string& what) : std::invalid_argument(what) {}
};

// No marker on the source spot, spot out of range, or a blocked overflow.
class InvalidMove : public std::invalid_argument {
public:
    explicit InvalidMove(const std::string& what) : std::invalid_argument(what) {}
};

// A computed distribution did not sum to 1. This is a defect in move
// generation or configuration; the sweep is aborted.
class UnnormalizedDistribution : public std::logic_error {
public:
    explicit UnnormalizedDistribution(const std::string& what) : std::logic_error(what) {}
};

} // namespace bgend
