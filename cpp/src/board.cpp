#include "bgend/board.h"
#include "bgend/moves.h"
#include <algorithm>
#include <numeric>
#include <sstream>

namespace bgend {

static std::string counts_to_string(const std::vector<int>& counts) {
    std::ostringstream ss;
    ss << "[";
    for (size_t i = 0; i < counts.size(); ++i) {
        if (i) ss << ", ";
        ss << counts[i];
    }
    ss << "]";
    return ss.str();
}

static std::string move_to_string(const Move& m) {
    return "Move(spot=" + std::to_string(m.spot) + ", count=" + std::to_string(m.count) + ")";
}

std::ostream& operator<<(std::ostream& os, const Board& b) {
    return os << "Board(" << counts_to_string(b.spot_counts()) << ")";
}

Board::Board(const GameConfiguration& config, std::vector<int> spot_counts)
    : config_(&config), spot_counts_(std::move(spot_counts))
{
    if (static_cast<int>(spot_counts_.size()) != config.num_spots() + 1) {
        throw InvalidSpotCounts("Bad size for " + counts_to_string(spot_counts_) +
                                ", expected " + std::to_string(config.num_spots() + 1));
    }
    for (int c : spot_counts_) {
        if (c < 0) {
            throw InvalidSpotCounts("Negative count in " + counts_to_string(spot_counts_));
        }
    }
    int total = std::accumulate(spot_counts_.begin(), spot_counts_.end(), 0);
    if (total != config.num_markers()) {
        throw InvalidSpotCounts("Total markers " + std::to_string(total) + " in " +
                                counts_to_string(spot_counts_) + " not expected number " +
                                std::to_string(config.num_markers()));
    }
}

Board Board::from_id(const GameConfiguration& config, BoardId id) {
    if (!config.is_valid_id(id)) {
        throw InvalidId(std::to_string(id) + " is not a valid board id");
    }

    std::vector<int> counts(config.num_spots() + 1, 0);
    int spot = 0;
    int n_bits = config.num_markers() + config.num_spots();
    for (int i = 0; i < n_bits; ++i) {
        if (id & (BoardId(1) << i)) {
            counts[spot]++;    // marker
        } else {
            spot++;            // separator
        }
    }
    return Board(config, std::move(counts), Unchecked{});
}

BoardId Board::get_id() const {
    BoardId id = 0;
    int bit = 0;
    for (int c : spot_counts_) {
        if (c > 0) {
            id |= ((BoardId(1) << c) - 1) << bit;
        }
        bit += c + 1;
    }
    return id;
}

int Board::total_pips() const {
    int pips = 0;
    for (int i = 1; i <= config_->num_spots(); ++i) {
        pips += i * spot_counts_[i];
    }
    return pips;
}

// Find the first non-empty spot, move one marker from it to the next higher
// spot and the rest to spot 0. The last spot is not considered: if only it
// has markers this is the largest id.
std::optional<Board> Board::next_valid_board() const {
    for (int i = 0; i < config_->num_spots(); ++i) {
        if (spot_counts_[i] == 0) continue;
        std::vector<int> counts = spot_counts_;
        int n = counts[i];
        counts[i] = 0;
        counts[i + 1] += 1;
        counts[0] = n - 1;
        return Board(*config_, std::move(counts), Unchecked{});
    }
    return std::nullopt;
}

Board Board::apply_move(const Move& move) const {
    if (move.spot < 1 || move.spot > config_->num_spots()) {
        throw InvalidMove("Invalid spot for " + move_to_string(move) + " on " +
                          counts_to_string(spot_counts_));
    }
    if (move.count < 1) {
        throw InvalidMove("Invalid count for " + move_to_string(move) + " on " +
                          counts_to_string(spot_counts_));
    }
    if (spot_counts_[move.spot] < 1) {
        throw InvalidMove("No marker for " + move_to_string(move) + " on " +
                          counts_to_string(spot_counts_));
    }

    std::vector<int> counts = spot_counts_;
    counts[move.spot] -= 1;
    if (move.count > move.spot) {
        for (int i = move.spot + 1; i <= config_->num_spots(); ++i) {
            if (counts[i] != 0) {
                throw InvalidMove("Overflow count " + move_to_string(move) +
                                  " invalid when spot " + std::to_string(i) +
                                  " still has markers on " + counts_to_string(spot_counts_) +
                                  " (blocked overflow)");
            }
        }
        counts[0] += 1;
    } else {
        counts[move.spot - move.count] += 1;
    }
    return Board(*config_, std::move(counts), Unchecked{});
}

Board Board::apply_moves(const MoveList& moves) const {
    Board b = *this;
    for (const auto& m : moves) {
        b = b.apply_move(m);
    }
    return b;
}

std::vector<MoveList> Board::generate_moves(const Roll& roll) const {
    std::vector<MoveList> out;
    bgend::generate_moves(*this, roll, out);
    return out;
}

std::string Board::pretty_string(const MoveList& moves) const {
    const int n_spots = config_->num_spots();
    const int width = *std::max_element(spot_counts_.begin(), spot_counts_.end()) + 1;

    std::vector<std::string> lines;
    lines.reserve(n_spots + 1);
    for (int spot = 0; spot <= n_spots; ++spot) {
        std::string markers(spot_counts_[spot], 'o');
        markers.resize(width, ' ');
        lines.push_back(std::to_string(spot) + " " + std::to_string(spot_counts_[spot]) +
                        " " + markers);
    }

    for (const auto& m : moves) {
        const int move_end = std::max(m.spot - m.count, 0);
        for (int spot = n_spots; spot >= 0; --spot) {
            if (spot > m.spot) {
                lines[spot] += "  ";
            } else if (spot == m.spot) {
                lines[spot] += std::to_string(m.count) + " ";
            } else if (spot > move_end) {
                lines[spot] += "| ";
            } else if (spot == m.spot - m.count) {
                lines[spot] += "x ";
            } else if (spot == move_end) {
                lines[spot] += "+ ";
            } else {
                lines[spot] += "  ";
            }
        }
    }

    std::string out;
    for (const auto& line : lines) {
        out += line;
        out += '\n';
    }
    return out;
}

} // namespace bgend
