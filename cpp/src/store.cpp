#include "bgend/store.h"
#include "bgend/moves.h"
#include <algorithm>
#include <chrono>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <unordered_set>
#include <vector>

namespace bgend {

static constexpr char STORE_MAGIC[5] = {'B', 'G', 'E', 'N', 'D'};
static constexpr uint8_t STORE_VERSION = 1;
// Longer than any distribution a 63-bit configuration can produce.
static constexpr uint32_t MAX_DIST_LENGTH = 1u << 20;

DistributionStore::DistributionStore(std::shared_ptr<const GameConfiguration> config,
                                     std::vector<Roll> rolls)
    : config_(std::move(config)), rolls_(std::move(rolls))
{
    if (!config_) {
        throw std::invalid_argument("DistributionStore needs a configuration");
    }
}

const MoveCountDistribution& DistributionStore::at(BoardId id) const {
    auto it = map_.find(id);
    if (it == map_.end()) {
        throw std::out_of_range("No distribution stored for board id " + std::to_string(id));
    }
    return it->second;
}

void DistributionStore::insert(BoardId id, MoveCountDistribution dist) {
    if (!config_->is_valid_id(id)) {
        throw InvalidId(std::to_string(id) + " is not a valid board id");
    }
    map_[id] = std::move(dist);
}

// ======================== Retrograde sweep ========================

MoveList DistributionStore::compute_best_moves_for_roll(const Board& board,
                                                        const Roll& roll) const {
    std::vector<MoveList> candidates;
    generate_moves(board, roll, candidates);

    std::unordered_set<BoardId> seen;
    seen.reserve(candidates.size());

    int best_idx = -1;
    double best_ev = 0.0;
    for (int i = 0; i < static_cast<int>(candidates.size()); ++i) {
        BoardId next_id = board.apply_moves(candidates[i]).get_id();
        if (!seen.insert(next_id).second) continue;

        double ev = at(next_id).expected_value();
        if (best_idx < 0 || ev < best_ev) {
            best_ev = ev;
            best_idx = i;
        }
    }

    // generate_moves always yields at least one list (empty when finished).
    return candidates[best_idx];
}

MoveCountDistribution DistributionStore::compute_move_distribution_for_board(
    const Board& board) const
{
    MoveCountDistribution out = MoveCountDistribution::zeros();
    for (const Roll& roll : rolls_) {
        MoveList moves = compute_best_moves_for_roll(board, roll);
        BoardId next_id = board.apply_moves(moves).get_id();
        out += at(next_id).increase_counts(1) * roll.prob;
    }

    if (!out.is_normalized()) {
        std::ostringstream ss;
        ss << "Distribution for " << board << " (id " << board.get_id()
           << ") sums to " << std::setprecision(17) << out.sum();
        throw UnnormalizedDistribution(ss.str());
    }
    return out;
}

void DistributionStore::compute(const ComputeConfig& cc) {
    map_.clear();
    map_.reserve(config_->num_valid_boards());

    const uint64_t n_boards = config_->num_valid_boards();
    if (cc.progress_interval > 0) {
        std::cout << "Starting compute on " << n_boards << " boards" << std::endl;
    }

    auto t_start = std::chrono::steady_clock::now();

    // The minimum id is the finished position.
    map_[config_->min_board_id()] = MoveCountDistribution();
    long long boards_processed = 1;
    BoardId last_id = config_->min_board_id();

    ValidIdRange ids = config_->generate_valid_ids();
    auto it = ids.begin();
    ++it;  // skip the finished position
    for (; it != ids.end(); ++it) {
        if (cc.limit > 0 && boards_processed >= cc.limit) {
            if (cc.progress_interval > 0) {
                std::cout << "Stopping at " << boards_processed << " boards, id "
                          << last_id << std::endl;
            }
            break;
        }

        const BoardId board_id = *it;
        Board board = Board::from_id(*config_, board_id);
        map_[board_id] = compute_move_distribution_for_board(board);
        last_id = board_id;

        boards_processed++;
        if (cc.progress_interval > 0 && boards_processed % cc.progress_interval == 0) {
            double frac = static_cast<double>(boards_processed) / n_boards;
            double elapsed = std::chrono::duration<double>(
                std::chrono::steady_clock::now() - t_start).count();
            std::ostringstream line;
            line << boards_processed << "/" << n_boards
                 << " " << std::fixed << std::setprecision(1) << frac * 100 << "%, "
                 << std::setprecision(3) << elapsed << "s elapsed, "
                 << elapsed / frac << "s estimated total";
            std::cout << line.str() << std::endl;
        }
    }
}

std::string DistributionStore::pretty_string(long long limit) const {
    std::vector<BoardId> ids;
    ids.reserve(map_.size());
    for (const auto& kv : map_) ids.push_back(kv.first);
    std::sort(ids.begin(), ids.end());

    std::ostringstream ss;
    long long n_printed = 0;
    for (BoardId id : ids) {
        if (limit > 0 && n_printed >= limit) break;
        ss << "Board " << id << "\n"
           << map_.at(id) << "\n"
           << Board::from_id(*config_, id).pretty_string() << "\n";
        ++n_printed;
    }
    return ss.str();
}

// ======================== Persistence ========================

template <typename T>
static void write_pod(std::ostream& out, const T& v) {
    out.write(reinterpret_cast<const char*>(&v), sizeof(T));
}

template <typename T>
static void read_pod(std::istream& in, T& v, const char* what) {
    in.read(reinterpret_cast<char*>(&v), sizeof(T));
    if (!in) {
        throw std::runtime_error(std::string("Truncated store file reading ") + what);
    }
}

bool DistributionStore::save(std::ostream& out) const {
    std::vector<BoardId> ids;
    ids.reserve(map_.size());
    for (const auto& kv : map_) ids.push_back(kv.first);
    std::sort(ids.begin(), ids.end());

    out.write(STORE_MAGIC, sizeof(STORE_MAGIC));
    write_pod(out, STORE_VERSION);
    write_pod(out, static_cast<int32_t>(config_->num_markers()));
    write_pod(out, static_cast<int32_t>(config_->num_spots()));
    write_pod(out, static_cast<uint64_t>(ids.size()));

    for (BoardId id : ids) {
        const auto& values = map_.at(id).values();
        write_pod(out, static_cast<uint64_t>(id));
        write_pod(out, static_cast<uint32_t>(values.size()));
        out.write(reinterpret_cast<const char*>(values.data()),
                  values.size() * sizeof(double));
    }
    return out.good();
}

bool DistributionStore::save(const std::string& filepath) const {
    std::ofstream f(filepath, std::ios::binary);
    if (!f) return false;
    if (!save(f)) return false;
    f.close();
    return !f.fail();
}

DistributionStore DistributionStore::load(std::istream& in) {
    char magic[sizeof(STORE_MAGIC)];
    in.read(magic, sizeof(magic));
    if (!in || std::memcmp(magic, STORE_MAGIC, sizeof(magic)) != 0) {
        throw std::runtime_error("Not a distribution store file (bad magic)");
    }
    uint8_t version = 0;
    read_pod(in, version, "version");
    if (version != STORE_VERSION) {
        throw std::runtime_error("Unsupported store file version " +
                                 std::to_string(static_cast<int>(version)));
    }

    int32_t num_markers = 0, num_spots = 0;
    uint64_t n_entries = 0;
    read_pod(in, num_markers, "num_markers");
    read_pod(in, num_spots, "num_spots");
    read_pod(in, n_entries, "entry count");

    std::shared_ptr<const GameConfiguration> config;
    try {
        config = std::make_shared<const GameConfiguration>(num_markers, num_spots);
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error(std::string("Bad configuration in store file: ") + e.what());
    }
    if (n_entries > config->num_valid_boards()) {
        throw std::runtime_error("Store file has " + std::to_string(n_entries) +
                                 " entries, more than the " +
                                 std::to_string(config->num_valid_boards()) +
                                 " valid boards");
    }

    DistributionStore store(config);
    store.map_.reserve(n_entries);
    for (uint64_t i = 0; i < n_entries; ++i) {
        uint64_t id = 0;
        uint32_t length = 0;
        read_pod(in, id, "board id");
        read_pod(in, length, "distribution length");
        if (!config->is_valid_id(id)) {
            throw std::runtime_error("Store file has invalid board id " + std::to_string(id));
        }
        if (length > MAX_DIST_LENGTH) {
            throw std::runtime_error("Store file has distribution of length " +
                                     std::to_string(length) + " for board id " +
                                     std::to_string(id));
        }
        std::vector<double> values(length);
        in.read(reinterpret_cast<char*>(values.data()), length * sizeof(double));
        if (!in) {
            throw std::runtime_error("Truncated store file reading distribution for board id " +
                                     std::to_string(id));
        }
        store.map_[id] = MoveCountDistribution(std::move(values));
    }
    return store;
}

DistributionStore DistributionStore::load(const std::string& filepath) {
    std::ifstream f(filepath, std::ios::binary);
    if (!f) {
        throw std::runtime_error("Failed to open distribution store: " + filepath);
    }
    try {
        return load(f);
    } catch (const std::runtime_error& e) {
        throw std::runtime_error("Failed to load distribution store " + filepath + ": " + e.what());
    }
}

} // namespace bgend
