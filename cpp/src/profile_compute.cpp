// Profile compute_move_distribution_for_board on a sample of boards from a
// saved store.
// Usage: bgend_profile <store_file> [sample_fraction] [seed]
//   Default sample_fraction 0.005, seed 42.
//
// Measures:
//   1. Full per-board distribution (21 rolls: generate + choose + combine)
//   2. Move generation only (generate_moves for all 21 rolls)
//   3. Id round trip only (from_id + get_id)
// and checks that every recomputed distribution matches the stored one.

#include "bgend/board.h"
#include "bgend/moves.h"
#include "bgend/store.h"
#include "bgend/types.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <random>
#include <vector>

using namespace bgend;
using Clock = std::chrono::high_resolution_clock;

static int profile(const DistributionStore& store, double sample_fraction, uint32_t seed) {
    printf("Read store: %d markers, %d spots, %zu boards\n",
           store.config().num_markers(), store.config().num_spots(), store.size());

    // Pick the sample (ascending id so runs are reproducible)
    std::vector<BoardId> ids;
    for (const auto& kv : store.distribution_map()) ids.push_back(kv.first);
    std::sort(ids.begin(), ids.end());

    std::mt19937 rng(seed);
    std::uniform_real_distribution<double> u(0.0, 1.0);
    std::vector<Board> sample;
    for (BoardId id : ids) {
        if (u(rng) < sample_fraction) sample.push_back(Board::from_id(store.config(), id));
    }
    if (sample.empty()) {
        printf("Sample is empty, increase sample_fraction\n");
        return 1;
    }
    printf("Sampled %zu boards\n", sample.size());
    printf("\n=== Profiling %zu boards ===\n\n", sample.size());

    // --- Benchmark 1: Full per-board distribution ---
    {
        int mismatches = 0;
        auto t0 = Clock::now();
        for (const auto& b : sample) {
            MoveCountDistribution dist = store.compute_move_distribution_for_board(b);
            const MoveCountDistribution& stored = store.at(b.get_id());
            MoveCountDistribution diff = dist - stored;
            for (double v : diff) {
                if (std::fabs(v) > 1e-9) { mismatches++; break; }
            }
        }
        auto t1 = Clock::now();
        double elapsed = std::chrono::duration<double>(t1 - t0).count();
        printf("[Board distribution] Total: %.3f s  |  Per-board: %.2f us  |  Throughput: %.0f boards/s\n",
               elapsed, elapsed / sample.size() * 1e6, sample.size() / elapsed);
        printf("  Mismatches vs stored: %d\n", mismatches);
    }

    // --- Benchmark 2: Move generation only ---
    {
        std::vector<MoveList> moves;
        size_t n_lists = 0;
        auto t0 = Clock::now();
        for (const auto& b : sample) {
            for (const Roll& roll : ROLLS) {
                moves.clear();
                generate_moves(b, roll, moves);
                n_lists += moves.size();
            }
        }
        auto t1 = Clock::now();
        double elapsed = std::chrono::duration<double>(t1 - t0).count();
        printf("[Move generation]    Total: %.3f s  |  Per-board: %.2f us  |  Lists/board: %.1f\n",
               elapsed, elapsed / sample.size() * 1e6,
               static_cast<double>(n_lists) / sample.size());
    }

    // --- Benchmark 3: Id round trip only ---
    {
        BoardId acc = 0;
        auto t0 = Clock::now();
        for (const auto& b : sample) {
            acc ^= Board::from_id(store.config(), b.get_id()).get_id();
        }
        auto t1 = Clock::now();
        double elapsed = std::chrono::duration<double>(t1 - t0).count();
        printf("[Id round trip]      Total: %.3f s  |  Per-board: %.2f us\n",
               elapsed, elapsed / sample.size() * 1e6);
        // Prevent optimization
        volatile BoardId sink = acc;
        (void)sink;
    }

    printf("\nDone.\n");
    return 0;
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        printf("Usage: %s <store_file> [sample_fraction] [seed]\n", argv[0]);
        return 1;
    }
    double sample_fraction = argc > 2 ? std::atof(argv[2]) : 0.005;
    uint32_t seed = argc > 3 ? static_cast<uint32_t>(std::atoi(argv[3])) : 42u;
    if (sample_fraction <= 0.0 || sample_fraction > 1.0) {
        printf("sample_fraction must be in (0, 1]\n");
        return 1;
    }

    try {
        DistributionStore store = DistributionStore::load(argv[1]);
        return profile(store, sample_fraction, seed);
    } catch (const std::exception& e) {
        printf("Error: %s\n", e.what());
        return 2;
    }
}
