#pragma once

#include "libwcal/data/brackets.hpp"
#include "libwcal/data/targets.hpp"

#include <string>

namespace wcal::io {

// A versioned reference-table asset: bracket definition plus targets.
struct TargetAsset {
    int version = 1;
    std::string source;
    int period = 0;
    bool has_brackets = false;
    std::string bracket_column = "adjusted_gross_income";
    data::BracketScheme scheme = data::irs_agi_brackets();
    data::TargetTable targets;
};

// origin names the document in error messages. Throws std::runtime_error.
TargetAsset parse_target_asset(const std::string& yaml_text,
                               const std::string& origin = "<string>");

TargetAsset load_target_asset(const std::string& path);

} // namespace wcal::io
