#pragma once

#include "libwcal/core/types.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace wcal::data {

// One row of the target store.
struct Target {
    std::string name;
    std::string stratum;
    std::string variable;
    int period = 0;
    double value = 0.0;
    TargetType type = TargetType::Count;
    std::string source;
    std::string geography = "US";   // "US", two-digit state FIPS, or a local code
    std::string bracket = "all";    // bracket label or "all"
};

class TargetTable {
public:
    TargetTable() = default;
    explicit TargetTable(std::vector<Target> targets);

    void add(Target target);

    std::size_t size() const { return targets_.size(); }
    bool empty() const { return targets_.empty(); }
    const std::vector<Target>& targets() const { return targets_; }
    std::vector<Target>::const_iterator begin() const { return targets_.begin(); }
    std::vector<Target>::const_iterator end() const { return targets_.end(); }

    TargetTable for_period(int period) const;
    TargetTable from_source(const std::string& source) const;

    // Bracket label -> value for the bracketed targets of one variable and geography.
    std::map<std::string, double> bracket_values(const std::string& variable,
                                                 const std::string& geography = "US") const;

private:
    std::vector<Target> targets_;
};

} // namespace wcal::data
