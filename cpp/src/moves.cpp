#include "bgend/moves.h"
#include "bgend/board.h"
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace bgend {

namespace {

// Recursively play roll.dice[die_idx], then die_idx + step, ... .
// `moves` holds the moves played so far and is restored before returning.
void generate_moves_recursive(const Board& b, const Roll& roll,
                              int die_idx, int step,
                              MoveList& moves,
                              std::vector<MoveList>& out) {
    if (die_idx < 0 || die_idx >= roll.n_dice || b.is_finished()) {
        out.push_back(moves);
        return;
    }

    const int die = roll.dice[die_idx];
    bool found_markers = false;
    for (int spot = b.config().num_spots(); spot >= 1; --spot) {
        if (found_markers && spot < die) break;
        if (b[spot] <= 0) continue;

        found_markers = true;
        Move m{spot, die};
        Board nb = b.apply_move(m);
        moves.push_back(m);
        generate_moves_recursive(nb, roll, die_idx + step, step, moves, out);
        moves.pop_back();
    }
}

} // anonymous namespace

void generate_moves(const Board& board, const Roll& roll, std::vector<MoveList>& out) {
    MoveList moves;
    moves.reserve(roll.n_dice);

    generate_moves_recursive(board, roll, 0, 1, moves, out);
    if (!roll.is_double() && roll.n_dice > 1 && roll.dice[0] != roll.dice[1]) {
        generate_moves_recursive(board, roll, roll.n_dice - 1, -1, moves, out);
    }
}

std::string encode_moves_string(const MoveList& moves) {
    std::ostringstream ss;
    ss << "[";
    for (size_t i = 0; i < moves.size(); ++i) {
        if (i) ss << ", ";
        ss << "[" << moves[i].spot << ", " << moves[i].count << "]";
    }
    ss << "]";
    return ss.str();
}

namespace {

// Minimal cursor over the nested-list grammar used by encode_moves_string.
struct MoveStringParser {
    const std::string& s;
    size_t pos = 0;

    void skip_ws() {
        while (pos < s.size() && std::isspace(static_cast<unsigned char>(s[pos]))) ++pos;
    }

    bool peek(char c) {
        skip_ws();
        return pos < s.size() && s[pos] == c;
    }

    void expect(char c) {
        if (!peek(c)) {
            throw std::invalid_argument("Expected '" + std::string(1, c) +
                                        "' at offset " + std::to_string(pos) +
                                        " in '" + s + "'");
        }
        ++pos;
    }

    int parse_int() {
        skip_ws();
        size_t start = pos;
        if (pos < s.size() && (s[pos] == '-' || s[pos] == '+')) ++pos;
        while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) ++pos;
        if (pos == start || !std::isdigit(static_cast<unsigned char>(s[pos - 1]))) {
            throw std::invalid_argument("Expected integer at offset " +
                                        std::to_string(start) + " in '" + s + "'");
        }
        return std::stoi(s.substr(start, pos - start));
    }
};

} // anonymous namespace

MoveList decode_moves_string(const std::string& s) {
    MoveStringParser p{s};
    MoveList out;

    p.expect('[');
    if (!p.peek(']')) {
        for (;;) {
            p.expect('[');
            int spot = p.parse_int();
            p.expect(',');
            int count = p.parse_int();
            if (!p.peek(']')) {
                throw std::invalid_argument("Bad element at offset " +
                                            std::to_string(p.pos) + " in '" + s + "'");
            }
            p.expect(']');
            out.push_back({spot, count});
            if (!p.peek(',')) break;
            p.expect(',');
        }
    }
    p.expect(']');

    p.skip_ws();
    if (p.pos != s.size()) {
        throw std::invalid_argument("Trailing characters in '" + s + "'");
    }
    return out;
}

} // namespace bgend
