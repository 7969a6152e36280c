#include "bgend/gnubg.h"
#include <cctype>
#include <istream>
#include <sstream>

namespace bgend {

// Standard base64 alphabet. Returns -1 for characters outside it.
static int base64_value(char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}

static std::vector<unsigned char> base64_decode(const std::string& s) {
    std::vector<unsigned char> out;
    uint32_t acc = 0;
    int n_bits = 0;
    for (char c : s) {
        if (c == '=') break;
        int v = base64_value(c);
        if (v < 0) {
            throw InvalidId("Bad character '" + std::string(1, c) +
                            "' in position ID '" + s + "'");
        }
        acc = (acc << 6) | static_cast<uint32_t>(v);
        n_bits += 6;
        if (n_bits >= 8) {
            n_bits -= 8;
            out.push_back(static_cast<unsigned char>((acc >> n_bits) & 0xFF));
        }
    }
    return out;
}

Board position_id_to_board(const GameConfiguration& config, const std::string& pos_id_str) {
    std::vector<unsigned char> key = base64_decode(pos_id_str + "==");

    // Little-endian: key[0] holds the lowest bits.
    BoardId pos_id = 0;
    for (size_t i = 0; i < key.size(); ++i) {
        if (key[i] == 0) continue;
        if (i >= sizeof(BoardId)) {
            throw InvalidId("Position ID '" + pos_id_str + "' is wider than 64 bits");
        }
        pos_id |= static_cast<BoardId>(key[i]) << (8 * i);
    }

    const int missing_markers = config.num_markers() - popcount(pos_id);
    if (missing_markers < 0) {
        throw InvalidId("Position ID '" + pos_id_str + "' has more than " +
                        std::to_string(config.num_markers()) + " markers");
    }

    const int shift = missing_markers + 1;
    if (pos_id != 0 && (shift >= 64 || (pos_id >> (64 - shift)) != 0)) {
        throw InvalidId("Position ID '" + pos_id_str + "' does not fit the configuration");
    }
    const BoardId id = (pos_id << shift) | ((BoardId(1) << missing_markers) - 1);

    return Board::from_id(config, id);
}

std::vector<GnubgDumpEntry> parse_gnubg_dump(std::istream& in) {
    static const std::string POSITION_ID = "Position ID";
    // Bearoff distributions in gnubg dumps stop well before this.
    static constexpr long MAX_ROLLS = 1000;

    std::vector<GnubgDumpEntry> entries;
    bool in_entry = false;

    auto finish_entry = [&]() {
        if (!in_entry) return;
        auto& dist = entries.back().dist;
        bool percent = false;
        for (double v : dist) {
            if (v > 1.0) { percent = true; break; }
        }
        if (percent) {
            for (auto& v : dist) v /= 100.0;
        }
    };

    std::string line;
    while (std::getline(in, line)) {
        size_t pos = line.find(POSITION_ID);
        if (pos != std::string::npos) {
            size_t colon = line.find(':', pos + POSITION_ID.size());
            if (colon == std::string::npos) continue;
            std::istringstream rest(line.substr(colon + 1));
            std::string id;
            if (!(rest >> id)) continue;

            finish_entry();
            entries.push_back({id, {}});
            in_entry = true;
            continue;
        }

        if (!in_entry) continue;

        std::istringstream ls(line);
        long rolls = 0;
        double value = 0.0;
        if (!(ls >> rolls >> value)) continue;
        if (rolls < 0 || rolls > MAX_ROLLS) continue;

        auto& dist = entries.back().dist;
        if (static_cast<long>(dist.size()) <= rolls) {
            dist.resize(rolls + 1, 0.0);
        }
        dist[rolls] = value;
    }
    finish_entry();

    return entries;
}

DistributionStore create_distribution_store_from_gnubg(
    std::shared_ptr<const GameConfiguration> config,
    const std::vector<GnubgDumpEntry>& entries)
{
    DistributionStore store(config);
    for (const auto& e : entries) {
        Board b = position_id_to_board(*config, e.position_id);
        store.insert(b.get_id(), MoveCountDistribution(e.dist));
    }
    return store;
}

} // namespace bgend
