#include "libwcal/data/targets.hpp"

namespace wcal::data {

TargetTable::TargetTable(std::vector<Target> targets) : targets_(std::move(targets)) {}

void TargetTable::add(Target target) {
    targets_.push_back(std::move(target));
}

TargetTable TargetTable::for_period(int period) const {
    TargetTable out;
    for (const auto& t : targets_) {
        if (t.period == period) {
            out.add(t);
        }
    }
    return out;
}

TargetTable TargetTable::from_source(const std::string& source) const {
    TargetTable out;
    for (const auto& t : targets_) {
        if (t.source == source) {
            out.add(t);
        }
    }
    return out;
}

std::map<std::string, double> TargetTable::bracket_values(const std::string& variable,
                                                          const std::string& geography) const {
    std::map<std::string, double> out;
    for (const auto& t : targets_) {
        if (t.variable == variable && t.geography == geography && t.bracket != "all") {
            out[t.bracket] = t.value;
        }
    }
    return out;
}

} // namespace wcal::data
