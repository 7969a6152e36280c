#include "bgend/compare.h"
#include "bgend/moves.h"
#include <algorithm>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <random>

namespace bgend {

CompareResult find_disagreements(const DistributionStore& ours,
                                 const DistributionStore& theirs,
                                 const CompareConfig& cc) {
    if (ours.config() != theirs.config()) {
        throw std::invalid_argument(
            "Stores have different configurations: (" +
            std::to_string(ours.config().num_markers()) + ", " +
            std::to_string(ours.config().num_spots()) + ") vs (" +
            std::to_string(theirs.config().num_markers()) + ", " +
            std::to_string(theirs.config().num_spots()) + ")");
    }
    const GameConfiguration& config = ours.config();

    std::vector<BoardId> ids;
    ids.reserve(ours.size());
    for (const auto& kv : ours.distribution_map()) {
        if (theirs.contains(kv.first)) ids.push_back(kv.first);
    }
    std::sort(ids.begin(), ids.end());

    std::mt19937 rng(cc.seed);
    std::uniform_int_distribution<int> sample(0, std::max(cc.sample_every, 1) - 1);

    CompareResult result;
    int boards_seen = 0;
    for (BoardId id : ids) {
        boards_seen++;
        if (cc.progress_interval > 0 && boards_seen % cc.progress_interval == 0) {
            std::cout << "Compared " << boards_seen << "/" << ids.size() << " boards, "
                      << result.disagreements.size() << " disagreements" << std::endl;
        }
        if (cc.sample_every > 1 && sample(rng) != 0) continue;

        result.boards_examined++;
        Board b = Board::from_id(config, id);

        for (const Roll& roll : ROLLS) {
            MoveList our_moves = ours.compute_best_moves_for_roll(b, roll);
            MoveList their_moves = theirs.compute_best_moves_for_roll(b, roll);
            BoardId our_next = b.apply_moves(our_moves).get_id();
            BoardId their_next = b.apply_moves(their_moves).get_id();
            if (our_next == their_next) continue;

            MoveDisagreement d;
            d.board_id = id;
            d.die1 = roll.dice[0];
            d.die2 = roll.dice[1];
            d.our_moves = std::move(our_moves);
            d.our_moves_our_ev = ours.at(our_next).expected_value();
            d.our_moves_their_ev = theirs.at(our_next).expected_value();
            d.their_moves = std::move(their_moves);
            d.their_moves_our_ev = ours.at(their_next).expected_value();
            d.their_moves_their_ev = theirs.at(their_next).expected_value();
            result.disagreements.push_back(std::move(d));
        }
    }

    if (cc.progress_interval > 0) {
        std::cout << "Examined " << result.boards_examined << " boards, found "
                  << result.disagreements.size() << " disagreements" << std::endl;
    }
    return result;
}

// Move strings contain commas, so they are quoted.
bool write_disagreements_csv(const std::vector<MoveDisagreement>& rows,
                             const std::string& filepath) {
    std::ofstream f(filepath);
    if (!f) return false;

    f << "board_idx,roll0,roll1,"
         "our_moves,our_moves_our_ev,our_moves_their_ev,"
         "their_moves,their_moves_our_ev,their_moves_their_ev\n";
    f << std::setprecision(17);
    for (const auto& d : rows) {
        f << d.board_id << "," << d.die1 << "," << d.die2 << ","
          << "\"" << encode_moves_string(d.our_moves) << "\","
          << d.our_moves_our_ev << "," << d.our_moves_their_ev << ","
          << "\"" << encode_moves_string(d.their_moves) << "\","
          << d.their_moves_our_ev << "," << d.their_moves_their_ev << "\n";
    }
    return f.good();
}

} // namespace bgend
