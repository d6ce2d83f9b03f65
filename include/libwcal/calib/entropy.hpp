#pragma once

#include "libwcal/calib/config.hpp"
#include "libwcal/calib/result.hpp"
#include "libwcal/math/constraint_matrix.hpp"

#include <vector>

namespace wcal::calib {

// Minimum-KL calibration solved through its dual: L-BFGS over one multiplier
// per constraint, weights w = w0 * exp(A^T lambda). Rows are rescaled so the
// dual gradient is the relative constraint violation; the clip on A^T lambda
// keeps exp() finite and the final ratio inside cfg.bounds.
SolverOutcome solve_entropy(const std::vector<double>& original_weights,
                            const math::ConstraintMatrix& A,
                            const std::vector<double>& targets,
                            const EntropyConfig& cfg = {});

} // namespace wcal::calib
