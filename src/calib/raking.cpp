#include "libwcal/calib/raking.hpp"

#include "libwcal/calib/diagnostics.hpp"
#include "libwcal/core/logging.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace wcal::calib {

namespace {

double max_abs_error(const math::ConstraintMatrix& A,
                     const std::vector<double>& w,
                     const std::vector<double>& targets,
                     std::vector<double>& achieved) {
    A.multiply(w, achieved);
    double worst = 0.0;
    for (std::size_t j = 0; j < targets.size(); ++j) {
        worst = std::max(worst, std::abs(relative_error(achieved[j], targets[j])));
    }
    return worst;
}

} // namespace

SolverOutcome solve_raking(const std::vector<double>& original_weights,
                           const math::ConstraintMatrix& A,
                           const std::vector<double>& targets,
                           const std::vector<TargetType>& types,
                           double tolerance,
                           const RakingConfig& cfg) {
    const std::size_t n = original_weights.size();
    const std::size_t m = targets.size();
    if (A.rows() != m || A.cols() != n || types.size() != m) {
        throw std::invalid_argument("solve_raking: constraint matrix shape does not match inputs");
    }
    if (!(cfg.damping > 0.0 && cfg.damping <= 1.0)) {
        throw std::invalid_argument("solve_raking: damping must be in (0, 1]");
    }
    if (!(cfg.min_ratio > 0.0 && cfg.min_ratio <= 1.0 && cfg.max_ratio >= 1.0)) {
        throw std::invalid_argument("solve_raking: per-step ratio band must contain 1");
    }
    if (!(cfg.max_adjustment >= 1.0)) {
        throw std::invalid_argument("solve_raking: max_adjustment must be at least 1");
    }

    auto log = wcal::log::logger();
    log->info("Raking calibration: {} weights, {} constraints", n, m);

    std::vector<double> lower(n), upper(n);
    for (std::size_t i = 0; i < n; ++i) {
        lower[i] = original_weights[i] / cfg.max_adjustment;
        upper[i] = original_weights[i] * cfg.max_adjustment;
    }

    SolverOutcome out;
    out.weights = original_weights;
    std::vector<double>& w = out.weights;
    std::vector<double> achieved(m, 0.0);

    double worst = max_abs_error(A, w, targets, achieved);
    int iter = 0;
    while (worst >= tolerance && iter < cfg.max_iter) {
        ++iter;
        for (std::size_t j = 0; j < m; ++j) {
            const double* a = A.row(j);
            double current = 0.0;
            for (std::size_t i = 0; i < n; ++i) {
                current += a[i] * w[i];
            }
            if (current == 0.0) {
                continue;
            }
            const double raw = targets[j] / current;
            const double ratio = std::min(cfg.max_ratio,
                                          std::max(cfg.min_ratio, 1.0 + cfg.damping * (raw - 1.0)));

            const bool is_count = types[j] == TargetType::Count;
            for (std::size_t i = 0; i < n; ++i) {
                if (is_count ? a[i] == 1.0 : a[i] != 0.0) {
                    w[i] *= ratio;
                }
            }
        }
        for (std::size_t i = 0; i < n; ++i) {
            w[i] = std::min(upper[i], std::max(lower[i], w[i]));
        }
        worst = max_abs_error(A, w, targets, achieved);
        log->debug("Raking sweep {}: max |error| = {:.6f}", iter, worst);
    }

    out.converged = worst < tolerance;
    out.iterations = iter;
    out.objective = worst;

    std::ostringstream oss;
    if (out.converged) {
        oss << "Converged after " << iter << " sweeps";
    } else {
        oss << "Did not converge: max |error| " << worst << " after " << iter << " sweeps";
        log->warn("Raking did not converge: max |error| {:.4f} after {} sweeps", worst, iter);
    }
    out.message = oss.str();
    return out;
}

} // namespace wcal::calib
