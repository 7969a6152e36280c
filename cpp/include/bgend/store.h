#pragma once

#include "types.h"
#include "game_config.h"
#include "board.h"
#include "distribution.h"
#include <iosfwd>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace bgend {

// Configuration for DistributionStore::compute()
struct ComputeConfig {
    int progress_interval = 500;   // log every N boards (0 = quiet)
    long long limit       = -1;    // stop after N boards if > 0 (diagnostic only)
};

// MoveCountDistribution for every board of a configuration, under play that
// minimizes the expected number of turns.
//
// compute() fills the store by retrograde analysis: ids are visited in
// ascending order, and every move lowers the id, so all successors of a
// board are final by the time the board is reached. A store stopped early
// by ComputeConfig::limit covers a prefix of the id space only and reports
// is_complete() == false.
//
// After compute() or load() the store is read-only and safe to query from
// several threads.
class DistributionStore {
public:
    using DistributionMap = std::unordered_map<BoardId, MoveCountDistribution>;

    // `rolls` is the dice table the sweep weights over; its probabilities
    // must sum to 1 for any distribution to come out normalized.
    explicit DistributionStore(
        std::shared_ptr<const GameConfiguration> config,
        std::vector<Roll> rolls = std::vector<Roll>(ROLLS.begin(), ROLLS.end()));

    const GameConfiguration& config() const { return *config_; }
    const std::shared_ptr<const GameConfiguration>& shared_config() const { return config_; }
    const std::vector<Roll>& rolls() const { return rolls_; }

    // Clears the store and computes every board. Throws
    // UnnormalizedDistribution if a computed distribution doesn't sum to 1;
    // the store must then be discarded.
    void compute(const ComputeConfig& cc = {});

    // Best way to play `roll` from `board`: the move list whose resulting
    // board has the lowest expected number of turns. Move lists reaching the
    // same board are considered once (the first one generated); ties keep the
    // first board in generation order. Every resulting board must already be
    // in the store (std::out_of_range otherwise).
    MoveList compute_best_moves_for_roll(const Board& board, const Roll& roll) const;

    // Distribution for `board` from the stored distributions of its
    // successors, one turn later, weighted over rolls().
    MoveCountDistribution compute_move_distribution_for_board(const Board& board) const;

    bool contains(BoardId id) const { return map_.count(id) != 0; }
    // Throws std::out_of_range if `id` is not stored.
    const MoveCountDistribution& at(BoardId id) const;
    // Throws InvalidId if `id` is not valid for this configuration.
    void insert(BoardId id, MoveCountDistribution dist);

    size_t size() const { return map_.size(); }
    bool is_complete() const { return map_.size() == config_->num_valid_boards(); }
    const DistributionMap& distribution_map() const { return map_; }

    // Each stored board (ascending id): its id, distribution and drawing.
    // limit > 0 caps the number of boards printed.
    std::string pretty_string(long long limit = -1) const;

    // Binary store file:
    //   "BGEND" + version byte, int32 num_markers, int32 num_spots,
    //   uint64 n_entries, then per entry (ascending id)
    //   uint64 id, uint32 length, length x double.
    // save() returns false on I/O failure. load() throws std::runtime_error
    // on unreadable, corrupt or truncated data.
    bool save(const std::string& filepath) const;
    bool save(std::ostream& out) const;
    static DistributionStore load(const std::string& filepath);
    static DistributionStore load(std::istream& in);

private:
    std::shared_ptr<const GameConfiguration> config_;
    std::vector<Roll> rolls_;
    DistributionMap map_;
};

} // namespace bgend
