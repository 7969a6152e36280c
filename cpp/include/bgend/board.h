#pragma once

#include "types.h"
#include "game_config.h"
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace bgend {

// A bearoff position for one player.
//
// spot_counts()[0] is the number of markers already off, spot_counts()[i]
// for i in 1..num_spots the number of markers i pips from home.
// Boards are values: every operation that changes the position returns a new
// Board. The configuration is referenced, not owned, and must outlive the
// board.
class Board {
public:
    // Throws InvalidSpotCounts unless spot_counts has num_spots + 1
    // non-negative entries summing to num_markers.
    Board(const GameConfiguration& config, std::vector<int> spot_counts);

    // Throws InvalidId if !config.is_valid_id(id).
    static Board from_id(const GameConfiguration& config, BoardId id);

    BoardId get_id() const;

    bool is_finished() const { return spot_counts_[0] == config_->num_markers(); }

    int total_pips() const;

    // Board with the next larger id, or nullopt if every marker is already
    // on the last spot (the largest id).
    std::optional<Board> next_valid_board() const;

    // Throws InvalidMove for an empty or out-of-range source spot, a
    // non-positive die, or an overflow while a farther spot is occupied.
    Board apply_move(const Move& move) const;

    // Applies moves left to right. Throws on the first invalid move.
    Board apply_moves(const MoveList& moves) const;

    // Every legal way to play the roll (see moves.h). Different lists may
    // lead to the same board.
    std::vector<MoveList> generate_moves(const Roll& roll) const;

    // One line per spot with its markers drawn as 'o', followed by a column
    // per move showing where it starts ("<die>"), what it crosses ("|") and
    // where it lands ("x", or "+" for an overflow off the board).
    std::string pretty_string(const MoveList& moves = {}) const;

    const GameConfiguration& config() const { return *config_; }
    const std::vector<int>& spot_counts() const { return spot_counts_; }
    int operator[](int spot) const { return spot_counts_[spot]; }

    bool operator==(const Board& o) const { return spot_counts_ == o.spot_counts_; }
    bool operator!=(const Board& o) const { return !(*this == o); }

private:
    struct Unchecked {};
    Board(const GameConfiguration& config, std::vector<int> spot_counts, Unchecked)
        : config_(&config), spot_counts_(std::move(spot_counts)) {}

    const GameConfiguration* config_;
    std::vector<int> spot_counts_;
};

// "Board([1, 2, 3])"
std::ostream& operator<<(std::ostream& os, const Board& b);

} // namespace bgend
