#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace wcal::data {

// Closed-open interval [low, high).
struct Bracket {
    std::string label;
    double low;
    double high;
};

// Partition of the real line into labelled brackets plus an explicit
// zero-or-undefined bracket tested before any range. Construction rejects
// schemes with gaps, overlaps or bounded ends, so assign() is total.
class BracketScheme {
public:
    BracketScheme(std::string zero_label, std::vector<Bracket> intervals);

    const std::string& assign(double value) const;
    std::vector<std::string> assign_all(const std::vector<double>& values) const;

    const std::string& zero_label() const { return zero_label_; }
    const std::vector<Bracket>& intervals() const { return intervals_; }

    // Zero label first, then intervals in ascending order.
    std::vector<std::string> labels() const;
    bool contains(const std::string& label) const;

private:
    std::string zero_label_;
    std::vector<Bracket> intervals_;
};

// IRS SOI adjusted gross income brackets (Publication 1304, Table 1.1).
BracketScheme irs_agi_brackets();

// Record count per label; every label of the scheme is present.
std::map<std::string, std::size_t> bracket_counts(const BracketScheme& scheme,
                                                  const std::vector<double>& values);

} // namespace wcal::data
