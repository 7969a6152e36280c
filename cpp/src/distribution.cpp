#include "bgend/distribution.h"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <numeric>

namespace bgend {

static constexpr double NORMALIZED_ATOL = 1e-8;
static constexpr double NORMALIZED_RTOL = 1e-5;

MoveCountDistribution MoveCountDistribution::operator+(const MoveCountDistribution& o) const {
    MoveCountDistribution out = *this;
    out += o;
    return out;
}

MoveCountDistribution& MoveCountDistribution::operator+=(const MoveCountDistribution& o) {
    if (dist_.size() < o.dist_.size()) {
        dist_.resize(o.dist_.size(), 0.0);
    }
    for (size_t i = 0; i < o.dist_.size(); ++i) {
        dist_[i] += o.dist_[i];
    }
    return *this;
}

MoveCountDistribution MoveCountDistribution::operator-(const MoveCountDistribution& o) const {
    std::vector<double> out(std::max(dist_.size(), o.dist_.size()), 0.0);
    for (size_t i = 0; i < dist_.size(); ++i) out[i] += dist_[i];
    for (size_t i = 0; i < o.dist_.size(); ++i) out[i] -= o.dist_[i];
    return MoveCountDistribution(std::move(out));
}

MoveCountDistribution MoveCountDistribution::operator*(double s) const {
    std::vector<double> out = dist_;
    for (auto& v : out) v *= s;
    return MoveCountDistribution(std::move(out));
}

MoveCountDistribution MoveCountDistribution::operator/(double s) const {
    std::vector<double> out = dist_;
    for (auto& v : out) v /= s;
    return MoveCountDistribution(std::move(out));
}

MoveCountDistribution MoveCountDistribution::increase_counts(int amount) const {
    std::vector<double> out(amount + dist_.size(), 0.0);
    std::copy(dist_.begin(), dist_.end(), out.begin() + amount);
    return MoveCountDistribution(std::move(out));
}

MoveCountDistribution MoveCountDistribution::append(const std::vector<double>& values) const {
    std::vector<double> out = dist_;
    out.insert(out.end(), values.begin(), values.end());
    return MoveCountDistribution(std::move(out));
}

double MoveCountDistribution::sum() const {
    return std::accumulate(dist_.begin(), dist_.end(), 0.0);
}

bool MoveCountDistribution::is_normalized() const {
    return std::fabs(sum() - 1.0) <= NORMALIZED_ATOL + NORMALIZED_RTOL;
}

double MoveCountDistribution::expected_value() const {
    double ev = 0.0;
    for (size_t i = 1; i < dist_.size(); ++i) {
        ev += static_cast<double>(i) * dist_[i];
    }
    return ev;
}

std::ostream& operator<<(std::ostream& os, const MoveCountDistribution& d) {
    char ev[32];
    std::snprintf(ev, sizeof(ev), "%f", d.expected_value());
    os << "MCD(" << ev << ", [";
    for (size_t i = 0; i < d.size(); ++i) {
        if (i) os << ", ";
        os << d[i];
    }
    return os << "])";
}

} // namespace bgend
