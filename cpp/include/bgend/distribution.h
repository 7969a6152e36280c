#pragma once

#include <initializer_list>
#include <ostream>
#include <utility>
#include <vector>

namespace bgend {

// Distribution over the number of turns left until every marker is off.
// dist[i] is the probability of finishing in exactly i more turns.
class MoveCountDistribution {
public:
    // Default is the finished position: probability 1 of 0 more turns.
    MoveCountDistribution() : dist_{1.0} {}
    explicit MoveCountDistribution(std::vector<double> dist) : dist_(std::move(dist)) {}
    MoveCountDistribution(std::initializer_list<double> dist) : dist_(dist) {}

    // All-zero distribution of length n, used as an accumulator.
    static MoveCountDistribution zeros(size_t n = 1) {
        return MoveCountDistribution(std::vector<double>(n, 0.0));
    }

    // Elementwise, the shorter operand padded with trailing zeros.
    MoveCountDistribution operator+(const MoveCountDistribution& o) const;
    MoveCountDistribution operator-(const MoveCountDistribution& o) const;
    MoveCountDistribution& operator+=(const MoveCountDistribution& o);

    MoveCountDistribution operator*(double s) const;
    MoveCountDistribution operator/(double s) const;

    // Shift by `amount` turns: prepend that many zero entries.
    MoveCountDistribution increase_counts(int amount) const;

    MoveCountDistribution append(const std::vector<double>& values) const;

    // Sum within tolerance of 1 (numpy allclose: atol 1e-8, rtol 1e-5).
    bool is_normalized() const;

    double expected_value() const;
    double sum() const;

    size_t size() const { return dist_.size(); }
    double operator[](size_t i) const { return dist_[i]; }
    const std::vector<double>& values() const { return dist_; }
    std::vector<double>::const_iterator begin() const { return dist_.begin(); }
    std::vector<double>::const_iterator end() const { return dist_.end(); }

    bool operator==(const MoveCountDistribution& o) const { return dist_ == o.dist_; }
    bool operator!=(const MoveCountDistribution& o) const { return !(*this == o); }

private:
    std::vector<double> dist_;
};

// "MCD(1.800000, [0, 0.2, 0.8])"
std::ostream& operator<<(std::ostream& os, const MoveCountDistribution& d);

} // namespace bgend
