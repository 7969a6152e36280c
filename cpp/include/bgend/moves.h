#pragma once

#include "types.h"
#include <string>
#include <vector>

namespace bgend {

class Board;

// Generate every legal way of playing `roll` from `board`, appending one
// MoveList per way to `out`. Caller must clear `out` first if desired.
//
// Dice are played in order. For each die the spots are scanned from the
// farthest to the nearest; every occupied spot is a source. Once an occupied
// spot has been seen, spots nearer than the die value are not legal sources
// (only the farthest marker may overflow past home). If the board finishes
// before all dice are used the list is shorter than the roll.
//
// For two different dice the dice are also played in the reverse order,
// since 4-then-3 can reach a board that 3-then-4 can't. Doubles, and a
// two-die roll with equal dice, are played in one order only.
//
// Different lists may end on the same board; no deduplication is done.
void generate_moves(const Board& board, const Roll& roll, std::vector<MoveList>& out);

// "[[6, 2], [5, 3]]"
std::string encode_moves_string(const MoveList& moves);

// Inverse of encode_moves_string. Whitespace is ignored.
// Throws std::invalid_argument for malformed input.
MoveList decode_moves_string(const std::string& s);

} // namespace bgend
