#pragma once

#include "libwcal/calib/result.hpp"
#include "libwcal/core/types.hpp"

#include <vector>

namespace wcal::calib {

// (achieved - target) / target, exactly 0 when target is 0.
double relative_error(double achieved, double target);

// (achieved - target) / (target + 1); the +1 keeps small and zero targets
// from dominating the gradient-descent loss.
double smoothed_relative_error(double achieved, double target);

// |achieved - target| / max(|target|, 1), exactly 0 when target is 0.
// Run success is judged on this for every engine.
double tolerance_error(double achieved, double target);

// sum w log(w / w0) with both floored at 1e-10.
double kl_divergence(const std::vector<double>& weights,
                     const std::vector<double>& original_weights);

// One report per constraint. achieved_* come from A w0 and A w.
std::vector<ConstraintReport> build_reports(const std::vector<Constraint>& constraints,
                                            const std::vector<double>& achieved_before,
                                            const std::vector<double>& achieved_after,
                                            bool smoothed_error);

} // namespace wcal::calib
