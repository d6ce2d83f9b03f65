#include "libwcal/data/brackets.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <limits>
#include <set>
#include <stdexcept>

namespace wcal::data {

namespace {

constexpr double INF = std::numeric_limits<double>::infinity();

} // namespace

BracketScheme::BracketScheme(std::string zero_label, std::vector<Bracket> intervals)
    : zero_label_(std::move(zero_label)), intervals_(std::move(intervals)) {
    if (intervals_.empty()) {
        throw std::invalid_argument("BracketScheme: at least one interval is required");
    }
    std::sort(intervals_.begin(), intervals_.end(), [](const Bracket& a, const Bracket& b) {
        return a.low < b.low;
    });
    if (intervals_.front().low != -INF) {
        throw std::invalid_argument("BracketScheme: first interval must start at -inf");
    }
    if (intervals_.back().high != INF) {
        throw std::invalid_argument("BracketScheme: last interval must be open-ended");
    }

    std::set<std::string> seen{zero_label_};
    for (std::size_t i = 0; i < intervals_.size(); ++i) {
        const auto& b = intervals_[i];
        if (!(b.low < b.high)) {
            throw std::invalid_argument("BracketScheme: empty interval '" + b.label + "'");
        }
        if (i > 0 && intervals_[i - 1].high != b.low) {
            throw std::invalid_argument("BracketScheme: interval '" + b.label +
                                        "' does not start where '" + intervals_[i - 1].label + "' ends");
        }
        if (!seen.insert(b.label).second) {
            throw std::invalid_argument("BracketScheme: duplicate label '" + b.label + "'");
        }
    }
}

const std::string& BracketScheme::assign(double value) const {
    if (std::isnan(value) || value == 0.0) {
        return zero_label_;
    }
    // First interval whose low exceeds value, then step back one.
    const auto it = std::upper_bound(intervals_.begin(), intervals_.end(), value,
        [](double v, const Bracket& b) { return v < b.low; });
    return std::prev(it)->label;
}

std::vector<std::string> BracketScheme::assign_all(const std::vector<double>& values) const {
    std::vector<std::string> out;
    out.reserve(values.size());
    for (double v : values) {
        out.push_back(assign(v));
    }
    return out;
}

std::vector<std::string> BracketScheme::labels() const {
    std::vector<std::string> out;
    out.reserve(intervals_.size() + 1);
    out.push_back(zero_label_);
    for (const auto& b : intervals_) {
        out.push_back(b.label);
    }
    return out;
}

bool BracketScheme::contains(const std::string& label) const {
    if (label == zero_label_) {
        return true;
    }
    return std::any_of(intervals_.begin(), intervals_.end(),
                       [&](const Bracket& b) { return b.label == label; });
}

BracketScheme irs_agi_brackets() {
    return BracketScheme("no_agi", {
        {"under_1",      -INF,      1.0},
        {"1_to_5k",      1.0,       5000.0},
        {"5k_to_10k",    5000.0,    10000.0},
        {"10k_to_15k",   10000.0,   15000.0},
        {"15k_to_20k",   15000.0,   20000.0},
        {"20k_to_25k",   20000.0,   25000.0},
        {"25k_to_30k",   25000.0,   30000.0},
        {"30k_to_40k",   30000.0,   40000.0},
        {"40k_to_50k",   40000.0,   50000.0},
        {"50k_to_75k",   50000.0,   75000.0},
        {"75k_to_100k",  75000.0,   100000.0},
        {"100k_to_200k", 100000.0,  200000.0},
        {"200k_to_500k", 200000.0,  500000.0},
        {"500k_to_1m",   500000.0,  1000000.0},
        {"1m_plus",      1000000.0, INF}
    });
}

std::map<std::string, std::size_t> bracket_counts(const BracketScheme& scheme,
                                                  const std::vector<double>& values) {
    std::map<std::string, std::size_t> counts;
    for (const auto& label : scheme.labels()) {
        counts[label] = 0;
    }
    for (double v : values) {
        ++counts[scheme.assign(v)];
    }
    return counts;
}

} // namespace wcal::data
