#pragma once

#include "types.h"
#include "game_config.h"
#include "board.h"
#include "store.h"
#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

namespace bgend {

// Interface to GNU Backgammon's one-sided bearoff database, used to check
// that we produce the same distributions.

// Convert a base64 gnubg position ID to a Board.
//
// gnubg's encoding is ours without the bits for markers already off (see
// "A technical description of the Position ID" in the gnubg manual). The
// missing markers are counted from the popcount, and that many 1s plus the
// separator closing spot 0 are put back below the gnubg bits.
//
// Throws InvalidId for malformed base64, more set bits than num_markers, a
// value wider than 64 bits, or a result outside the id space.
Board position_id_to_board(const GameConfiguration& config, const std::string& pos_id_str);

// One position from a gnubg bearoff text dump.
struct GnubgDumpEntry {
    std::string position_id;
    std::vector<double> dist;   // dist[i] = P(off in exactly i rolls)
};

// Parse a gnubg one-sided bearoff dump. A line containing "Position ID" and a
// ':' starts an entry (the id is the first token after the ':'). Following
// lines that start with an integer roll count and a number are rows of that
// entry's distribution. Entries given in percent (any value > 1) are scaled
// to probabilities. Other lines are ignored.
std::vector<GnubgDumpEntry> parse_gnubg_dump(std::istream& in);

// Store holding the distribution of every dump entry.
DistributionStore create_distribution_store_from_gnubg(
    std::shared_ptr<const GameConfiguration> config,
    const std::vector<GnubgDumpEntry>& entries);

} // namespace bgend
