#pragma once

#include <string>
#include <vector>

namespace wcal {

enum class TargetType {
    Count,
    Amount,
    Rate
};

const char* to_string(TargetType type);

// Accepts "count", "amount" and "rate"; throws std::invalid_argument otherwise.
TargetType parse_target_type(const std::string& text);

// One administrative target expressed as a linear constraint on the weights.
// indicator holds 0/1 membership for counts and the masked per-record
// magnitude for amounts; its length always equals the record count.
struct Constraint {
    std::vector<double> indicator;
    double target_value = 0.0;
    std::string variable;
    TargetType target_type = TargetType::Count;
    double tolerance = 0.05;
    std::string stratum;
    std::string group;
};

} // namespace wcal
