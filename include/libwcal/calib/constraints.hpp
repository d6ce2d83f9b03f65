#pragma once

#include "libwcal/core/types.hpp"
#include "libwcal/data/brackets.hpp"
#include "libwcal/data/microdata.hpp"
#include "libwcal/data/targets.hpp"

#include <map>
#include <string>
#include <vector>

namespace wcal::calib {

// Per-bracket administrative totals for one bracketing covariate.
struct BracketTargets {
    std::string column = "adjusted_gross_income";
    data::BracketScheme scheme = data::irs_agi_brackets();
    std::map<std::string, double> counts;
    std::map<std::string, double> amounts;
    std::string count_variable = "returns";
    std::string amount_variable = "agi";
};

// National bracketed targets of a table as BracketTargets.
BracketTargets bracket_targets_from(const data::TargetTable& targets,
                                    const data::BracketScheme& scheme,
                                    const std::string& column = "adjusted_gross_income",
                                    const std::string& count_variable = "returns",
                                    const std::string& amount_variable = "agi");

struct BuilderConfig {
    int min_obs = 100;
    double tolerance = 0.05;
};

// Count constraint per bracket with a known target and at least min_obs
// members, followed by its amount constraint when an amount target exists.
// Sparse brackets are skipped and logged. Order follows the scheme.
std::vector<Constraint> build_bracket_constraints(const data::MicrodataTable& records,
                                                  const BracketTargets& targets,
                                                  const BuilderConfig& cfg = {});

// How target-table entries map onto microdata columns.
struct TargetMapping {
    std::string bracket_column = "adjusted_gross_income";
    std::string geography_column = "state_fips";
    data::BracketScheme scheme = data::irs_agi_brackets();
    // Amount variable -> numeric column; unmapped variables use their own name.
    std::map<std::string, std::string> amount_columns = {{"agi", "adjusted_gross_income"}};
    double tolerance = 0.05;
};

// "national" for US, "state" for two-character codes, "local" otherwise.
std::string geographic_level(const std::string& geography);

// One constraint per count/amount target, grouped by
// "<geographic level>/<variable>". Rate targets are skipped with a warning.
std::vector<Constraint> build_target_constraints(const data::MicrodataTable& records,
                                                 const data::TargetTable& targets,
                                                 const TargetMapping& mapping = {});

struct GroupIndex {
    std::vector<int> ids;            // per constraint
    std::vector<std::string> names;  // per group, first-seen order
};

GroupIndex group_ids(const std::vector<Constraint>& constraints);

} // namespace wcal::calib
