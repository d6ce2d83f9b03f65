#include "libwcal/core/types.hpp"

#include <stdexcept>

namespace wcal {

const char* to_string(TargetType type) {
    switch (type) {
        case TargetType::Count:  return "count";
        case TargetType::Amount: return "amount";
        case TargetType::Rate:   return "rate";
    }
    return "unknown";
}

TargetType parse_target_type(const std::string& text) {
    if (text == "count") {
        return TargetType::Count;
    }
    if (text == "amount") {
        return TargetType::Amount;
    }
    if (text == "rate") {
        return TargetType::Rate;
    }
    throw std::invalid_argument("parse_target_type: unknown target type '" + text + "'");
}

} // namespace wcal
