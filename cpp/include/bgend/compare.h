#pragma once

#include "types.h"
#include "store.h"
#include <cstdint>
#include <string>
#include <vector>

namespace bgend {

// A board and roll on which two stores pick moves that end on different
// boards, with each choice's expected turns under each store.
struct MoveDisagreement {
    BoardId board_id;
    int die1;
    int die2;
    MoveList our_moves;
    double our_moves_our_ev;
    double our_moves_their_ev;
    MoveList their_moves;
    double their_moves_our_ev;
    double their_moves_their_ev;
};

// Configuration for find_disagreements()
struct CompareConfig {
    int sample_every      = 1;     // examine ~1 in N boards at random (<= 1 = all)
    uint32_t seed         = 42;
    int progress_interval = 500;   // log every N boards (0 = quiet)
};

struct CompareResult {
    int boards_examined = 0;
    std::vector<MoveDisagreement> disagreements;
};

// Walk the boards of `ours` that `theirs` also stores (ascending id) and, for
// every roll, compare the best moves each store picks. Both stores must be
// for the same configuration (std::invalid_argument otherwise).
CompareResult find_disagreements(const DistributionStore& ours,
                                 const DistributionStore& theirs,
                                 const CompareConfig& cc = {});

// One header line plus one row per disagreement. Returns false if the file
// can't be written.
bool write_disagreements_csv(const std::vector<MoveDisagreement>& rows,
                             const std::string& filepath);

} // namespace bgend
