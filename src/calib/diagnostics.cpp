#include "libwcal/calib/diagnostics.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace wcal::calib {

namespace {

constexpr double KL_FLOOR = 1e-10;

} // namespace

double relative_error(double achieved, double target) {
    if (target == 0.0) {
        return 0.0;
    }
    return (achieved - target) / target;
}

double smoothed_relative_error(double achieved, double target) {
    return (achieved - target) / (target + 1.0);
}

double tolerance_error(double achieved, double target) {
    if (target == 0.0) {
        return 0.0;
    }
    return std::abs(achieved - target) / std::max(std::abs(target), 1.0);
}

double kl_divergence(const std::vector<double>& weights,
                     const std::vector<double>& original_weights) {
    if (weights.size() != original_weights.size()) {
        throw std::invalid_argument("kl_divergence: weight vectors differ in length");
    }
    double kl = 0.0;
    for (std::size_t i = 0; i < weights.size(); ++i) {
        const double w = std::max(weights[i], KL_FLOOR);
        const double w0 = std::max(original_weights[i], KL_FLOOR);
        kl += w * std::log(w / w0);
    }
    return kl;
}

std::vector<ConstraintReport> build_reports(const std::vector<Constraint>& constraints,
                                            const std::vector<double>& achieved_before,
                                            const std::vector<double>& achieved_after,
                                            bool smoothed_error) {
    if (achieved_before.size() != constraints.size() || achieved_after.size() != constraints.size()) {
        throw std::invalid_argument("build_reports: achieved vectors do not match the constraints");
    }
    double (*error)(double, double) = smoothed_error ? &smoothed_relative_error : &relative_error;

    std::vector<ConstraintReport> reports;
    reports.reserve(constraints.size());
    for (std::size_t j = 0; j < constraints.size(); ++j) {
        const auto& c = constraints[j];
        ConstraintReport r;
        r.name = c.variable;
        r.stratum = c.stratum;
        r.group = c.group;
        r.target_type = c.target_type;
        r.target = c.target_value;
        r.achieved_before = achieved_before[j];
        r.achieved_after = achieved_after[j];
        r.error_before = error(r.achieved_before, r.target);
        r.error_after = error(r.achieved_after, r.target);
        r.tolerance = c.tolerance;
        r.within_tolerance = std::abs(r.error_after) < c.tolerance;
        reports.push_back(std::move(r));
    }
    return reports;
}

} // namespace wcal::calib
