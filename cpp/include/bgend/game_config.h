#pragma once

#include "types.h"
#include <cstddef>
#include <iterator>
#include <optional>

namespace bgend {

class GameConfiguration;

// Ascending sequence of every valid board id of a configuration.
// Iteration is lazy (one next_valid_id step per increment) and the range can
// be iterated any number of times.
class ValidIdRange {
public:
    class iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = BoardId;
        using difference_type = std::ptrdiff_t;
        using pointer = const BoardId*;
        using reference = const BoardId&;

        iterator() = default;
        iterator(const GameConfiguration* config, std::optional<BoardId> id)
            : config_(config), id_(id) {}

        reference operator*() const { return *id_; }
        pointer operator->() const { return &*id_; }
        iterator& operator++();
        iterator operator++(int) { iterator tmp = *this; ++*this; return tmp; }

        bool operator==(const iterator& o) const { return id_ == o.id_; }
        bool operator!=(const iterator& o) const { return !(*this == o); }

    private:
        const GameConfiguration* config_ = nullptr;
        std::optional<BoardId> id_;   // empty = exhausted
    };

    explicit ValidIdRange(const GameConfiguration& config) : config_(&config) {}

    iterator begin() const;
    iterator end() const { return iterator(config_, std::nullopt); }

private:
    const GameConfiguration* config_;
};

// Overall parameters of the game and the id space they define.
//
// With N markers and M spots (not counting the "off" pile) the number of
// board states is the stars-and-bars count C(N+M, M). A state is encoded as
// an (N+M)-bit string: 1 for each marker, 0 for each separator, spot 0 in the
// low bits. Every legal move moves separators towards bit 0, so a move always
// produces a smaller id. Iterating ids from min to max therefore visits every
// successor of a board before the board itself.
//
// For a full backgammon bearoff (N=15, M=6) there are C(21, 6) = 54264
// states among 2^21 bit strings, about 3%.
class GameConfiguration {
public:
    GameConfiguration(int num_markers, int num_spots);

    int num_markers() const { return num_markers_; }
    int num_spots() const { return num_spots_; }
    uint64_t num_valid_boards() const { return num_valid_boards_; }
    // All markers off: the low num_markers bits set. Inclusive.
    BoardId min_board_id() const { return min_board_id_; }
    // All markers on the last spot, plus one. Exclusive.
    BoardId max_board_id() const { return max_board_id_; }

    bool is_valid_id(BoardId id) const;

    // Next larger valid id, or nullopt if `id` is the largest valid id.
    // Throws InvalidId if `id` is not valid.
    std::optional<BoardId> next_valid_id(BoardId id) const;

    ValidIdRange generate_valid_ids() const { return ValidIdRange(*this); }

    bool operator==(const GameConfiguration& o) const {
        return num_markers_ == o.num_markers_ && num_spots_ == o.num_spots_;
    }
    bool operator!=(const GameConfiguration& o) const { return !(*this == o); }

private:
    int num_markers_;
    int num_spots_;
    uint64_t num_valid_boards_;
    BoardId min_board_id_;
    BoardId max_board_id_;
};

} // namespace bgend
