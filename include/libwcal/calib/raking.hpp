#pragma once

#include "libwcal/calib/config.hpp"
#include "libwcal/calib/result.hpp"
#include "libwcal/core/types.hpp"
#include "libwcal/math/constraint_matrix.hpp"

#include <vector>

namespace wcal::calib {

// Iterative proportional fitting. Each sweep rescales, constraint by
// constraint, the records a constraint covers (indicator == 1 for counts,
// != 0 otherwise) by a damped ratio clipped to [min_ratio, max_ratio], then
// clips the weights to [w0 / max_adjustment, w0 * max_adjustment]. Stops
// once every |relative error| is below tolerance.
SolverOutcome solve_raking(const std::vector<double>& original_weights,
                           const math::ConstraintMatrix& A,
                           const std::vector<double>& targets,
                           const std::vector<TargetType>& types,
                           double tolerance,
                           const RakingConfig& cfg = {});

} // namespace wcal::calib
