#include "libwcal/calib/constraints.hpp"

#include "libwcal/core/logging.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <unordered_map>

namespace wcal::calib {

namespace {

double finite_or_zero(double v) {
    return std::isfinite(v) ? v : 0.0;
}

std::string pad_code(std::string code, std::size_t width) {
    if (code.size() < width) {
        code.insert(0, width - code.size(), '0');
    }
    return code;
}

// Geography code per record as text, from a categorical or numeric column.
std::vector<std::string> geography_codes(const data::MicrodataTable& records, const std::string& column) {
    if (records.has_categorical(column)) {
        return records.categorical(column);
    }
    const auto& values = records.numeric(column);
    std::vector<std::string> codes;
    codes.reserve(values.size());
    for (double v : values) {
        codes.push_back(std::isfinite(v) ? std::to_string(std::llround(v)) : std::string());
    }
    return codes;
}

} // namespace

BracketTargets bracket_targets_from(const data::TargetTable& targets,
                                    const data::BracketScheme& scheme,
                                    const std::string& column,
                                    const std::string& count_variable,
                                    const std::string& amount_variable) {
    BracketTargets out{column, scheme, {}, {}, count_variable, amount_variable};
    out.counts = targets.bracket_values(count_variable, "US");
    out.amounts = targets.bracket_values(amount_variable, "US");
    return out;
}

std::vector<Constraint> build_bracket_constraints(const data::MicrodataTable& records,
                                                  const BracketTargets& targets,
                                                  const BuilderConfig& cfg) {
    auto log = wcal::log::logger();
    const auto& values = records.numeric(targets.column);
    const auto labels = targets.scheme.assign_all(values);
    const std::size_t n = records.size();

    for (const auto& [label, value] : targets.counts) {
        if (!targets.scheme.contains(label)) {
            log->warn("Count target for unknown bracket '{}' ignored", label);
        }
    }

    std::vector<Constraint> constraints;
    for (const auto& label : targets.scheme.labels()) {
        const auto count_it = targets.counts.find(label);
        if (count_it == targets.counts.end()) {
            continue;
        }

        std::vector<double> indicator(n, 0.0);
        int n_obs = 0;
        for (std::size_t i = 0; i < n; ++i) {
            if (labels[i] == label) {
                indicator[i] = 1.0;
                ++n_obs;
            }
        }
        if (n_obs < cfg.min_obs) {
            log->info("Skipping bracket {}: {} records, fewer than min_obs {}", label, n_obs, cfg.min_obs);
            continue;
        }

        Constraint count;
        count.target_value = count_it->second;
        count.variable = targets.count_variable + "_" + label;
        count.target_type = TargetType::Count;
        count.tolerance = cfg.tolerance;
        count.stratum = "Filers " + targets.column + " " + label;

        const auto amount_it = targets.amounts.find(label);
        std::vector<double> magnitude;
        bool has_amount = false;
        if (amount_it != targets.amounts.end()) {
            magnitude.assign(n, 0.0);
            for (std::size_t i = 0; i < n; ++i) {
                if (indicator[i] > 0.0) {
                    magnitude[i] = finite_or_zero(values[i]);
                    has_amount = has_amount || magnitude[i] != 0.0;
                }
            }
            if (!has_amount) {
                log->debug("Bracket {} has no nonzero {} values; amount target dropped", label, targets.column);
            }
        }

        count.indicator = std::move(indicator);
        constraints.push_back(std::move(count));

        if (has_amount) {
            Constraint amount;
            amount.indicator = std::move(magnitude);
            amount.target_value = amount_it->second;
            amount.variable = targets.amount_variable + "_" + label;
            amount.target_type = TargetType::Amount;
            amount.tolerance = cfg.tolerance;
            amount.stratum = constraints.back().stratum;
            constraints.push_back(std::move(amount));
        }
    }
    return constraints;
}

std::string geographic_level(const std::string& geography) {
    if (geography == "US") {
        return "national";
    }
    if (geography.size() == 2) {
        return "state";
    }
    return "local";
}

std::vector<Constraint> build_target_constraints(const data::MicrodataTable& records,
                                                 const data::TargetTable& targets,
                                                 const TargetMapping& mapping) {
    auto log = wcal::log::logger();
    const std::size_t n = records.size();

    std::vector<std::string> labels;
    std::vector<std::string> geo_codes;

    std::vector<Constraint> constraints;
    for (const auto& t : targets) {
        if (t.type == TargetType::Rate) {
            log->warn("Rate target '{}' is not a linear constraint; skipped", t.name);
            continue;
        }
        if (t.type == TargetType::Amount && t.value == 0.0) {
            log->debug("Zero amount target '{}' skipped", t.name);
            continue;
        }

        const bool by_bracket = t.bracket != "all";
        if (by_bracket) {
            if (!mapping.scheme.contains(t.bracket)) {
                throw std::invalid_argument("build_target_constraints: target '" + t.name +
                                            "' names unknown bracket '" + t.bracket + "'");
            }
            if (labels.empty() && n > 0) {
                labels = mapping.scheme.assign_all(records.numeric(mapping.bracket_column));
            }
        }
        const bool by_geography = t.geography != "US";
        if (by_geography && geo_codes.empty() && n > 0) {
            geo_codes = geography_codes(records, mapping.geography_column);
        }

        const std::vector<double>* magnitude = nullptr;
        if (t.type == TargetType::Amount) {
            const auto col = mapping.amount_columns.find(t.variable);
            magnitude = &records.numeric(col != mapping.amount_columns.end() ? col->second : t.variable);
        }

        Constraint c;
        c.indicator.assign(n, 0.0);
        for (std::size_t i = 0; i < n; ++i) {
            if (by_bracket && labels[i] != t.bracket) {
                continue;
            }
            if (by_geography && pad_code(geo_codes[i], t.geography.size()) != t.geography) {
                continue;
            }
            c.indicator[i] = magnitude ? finite_or_zero((*magnitude)[i]) : 1.0;
        }
        c.target_value = t.value;
        c.variable = t.name.empty() ? t.geography + "/" + t.variable + "/" + t.bracket : t.name;
        c.target_type = t.type;
        c.tolerance = mapping.tolerance;
        c.stratum = t.stratum.empty() ? t.geography + " " + t.bracket : t.stratum;
        c.group = geographic_level(t.geography) + "/" + t.variable;
        constraints.push_back(std::move(c));
    }
    return constraints;
}

GroupIndex group_ids(const std::vector<Constraint>& constraints) {
    GroupIndex index;
    index.ids.reserve(constraints.size());
    std::unordered_map<std::string, int> seen;
    for (const auto& c : constraints) {
        const auto it = seen.find(c.group);
        if (it != seen.end()) {
            index.ids.push_back(it->second);
            continue;
        }
        const int id = static_cast<int>(index.names.size());
        seen.emplace(c.group, id);
        index.names.push_back(c.group);
        index.ids.push_back(id);
    }
    return index;
}

} // namespace wcal::calib
