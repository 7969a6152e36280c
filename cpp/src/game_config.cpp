#include "bgend/game_config.h"
#include <algorithm>
#include <string>
#include <vector>

namespace bgend {

// C(n, k) from a row of Pascal's triangle. Every entry of row 63 fits in
// 64 bits, so no intermediate overflows.
static uint64_t binomial(int n, int k) {
    std::vector<uint64_t> row(k + 1, 0);
    row[0] = 1;
    for (int i = 1; i <= n; ++i) {
        for (int j = std::min(i, k); j >= 1; --j) {
            row[j] += row[j - 1];
        }
    }
    return row[k];
}

GameConfiguration::GameConfiguration(int num_markers, int num_spots)
    : num_markers_(num_markers), num_spots_(num_spots)
{
    if (num_markers < 1 || num_spots < 1) {
        throw std::invalid_argument(
            "Need at least one marker and one spot, got " +
            std::to_string(num_markers) + " markers, " +
            std::to_string(num_spots) + " spots");
    }
    if (num_markers + num_spots > MAX_ID_BITS) {
        throw std::invalid_argument(
            "num_markers + num_spots must be at most " +
            std::to_string(MAX_ID_BITS) + ", got " +
            std::to_string(num_markers + num_spots));
    }

    num_valid_boards_ = binomial(num_markers + num_spots, num_spots);

    const int n_bits = num_markers + num_spots;
    min_board_id_ = 0;
    max_board_id_ = 1;  // max is exclusive
    for (int i = 0; i < num_markers; ++i) {
        min_board_id_ |= BoardId(1) << i;
        max_board_id_ |= BoardId(1) << (n_bits - 1 - i);
    }
}

bool GameConfiguration::is_valid_id(BoardId id) const {
    return id >= min_board_id_ &&
           id < max_board_id_ &&
           popcount(id) == num_markers_;
}

// Same step as Board::next_valid_board, done with bit operations.
// The lowest block of 1s is spot 0 (or the first occupied spot). Its top 1
// swaps with the 0 above it, moving one marker up a spot, and the rest of the
// block drops to bit 0.
std::optional<BoardId> GameConfiguration::next_valid_id(BoardId id) const {
    if (!is_valid_id(id)) {
        throw InvalidId(std::to_string(id) + " is not a valid board id");
    }
    if (id >= max_board_id_ - 1) {
        return std::nullopt;
    }

    const int first_one = lsb(id);
    const int run_length = lsb(~(id >> first_one));
    const int block_end = first_one + run_length - 1;

    const BoardId upper_mask = ~BoardId(0) << block_end;
    const BoardId lower_mask = ~upper_mask;

    const BoardId upper = (id & upper_mask) ^ (BoardId(3) << block_end);
    const BoardId lower = (id & lower_mask) >> first_one;

    return upper | lower;
}

ValidIdRange::iterator& ValidIdRange::iterator::operator++() {
    id_ = config_->next_valid_id(*id_);
    return *this;
}

ValidIdRange::iterator ValidIdRange::begin() const {
    return iterator(config_, config_->min_board_id());
}

} // namespace bgend
