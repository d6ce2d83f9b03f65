#include "libwcal/calib/entropy.hpp"

#include "libwcal/core/logging.hpp"
#include "libwcal/math/lbfgs.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <sstream>
#include <stdexcept>

namespace wcal::calib {

SolverOutcome solve_entropy(const std::vector<double>& original_weights,
                            const math::ConstraintMatrix& A,
                            const std::vector<double>& targets,
                            const EntropyConfig& cfg) {
    const std::size_t n = original_weights.size();
    const std::size_t m = targets.size();
    if (A.rows() != m || A.cols() != n) {
        throw std::invalid_argument("solve_entropy: constraint matrix shape does not match inputs");
    }
    if (!(cfg.bounds.min_ratio > 0.0) || cfg.bounds.min_ratio > cfg.bounds.max_ratio) {
        throw std::invalid_argument("solve_entropy: invalid ratio bounds");
    }

    auto log = wcal::log::logger();
    log->info("Entropy calibration: {} weights, {} constraints", n, m);

    // Row j is scaled by W / max(|y_j|, 1) and the dual by 1 / W, so the
    // gradient reads (achieved_j - y_j) / max(|y_j|, 1).
    const double total = std::accumulate(original_weights.begin(), original_weights.end(), 0.0);
    math::ConstraintMatrix As = A;
    std::vector<double> ys(m, 0.0);
    for (std::size_t j = 0; j < m; ++j) {
        const double scale = total / std::max(std::abs(targets[j]), 1.0);
        As.scale_row(j, scale);
        ys[j] = targets[j] * scale;
    }

    const double clip = cfg.log_clip;
    std::vector<double> log_adj(n, 0.0);
    std::vector<double> w(n, 0.0);
    std::vector<double> achieved(m, 0.0);

    auto dual = [&](const std::vector<double>& lambda, double& f, std::vector<double>& g) {
        As.multiply_transpose(lambda, log_adj);
        double sum_w = 0.0;
        for (std::size_t i = 0; i < n; ++i) {
            w[i] = original_weights[i] * std::exp(std::min(clip, std::max(-clip, log_adj[i])));
            sum_w += w[i];
        }
        As.multiply(w, achieved);
        double ly = 0.0;
        g.assign(m, 0.0);
        for (std::size_t j = 0; j < m; ++j) {
            ly += lambda[j] * ys[j];
            g[j] = (achieved[j] - ys[j]) / total;
        }
        f = (sum_w - ly) / total;
    };

    math::LbfgsConfig lcfg;
    lcfg.max_iter = cfg.max_iter;
    lcfg.ftol = cfg.ftol;
    lcfg.gtol = cfg.gtol;

    const auto res = math::minimize_lbfgs(std::vector<double>(m, 0.0), {}, {}, dual, lcfg);
    log->info("Optimization: {} ({} iterations, {} evaluations)",
              math::describe(res.status), res.iters, res.evaluations);

    const double lo = std::log(cfg.bounds.min_ratio);
    const double hi = std::log(cfg.bounds.max_ratio);
    As.multiply_transpose(res.x, log_adj);
    SolverOutcome out;
    out.weights.resize(n);
    for (std::size_t i = 0; i < n; ++i) {
        out.weights[i] = original_weights[i] * std::exp(std::min(hi, std::max(lo, log_adj[i])));
    }
    out.converged = res.converged;
    out.iterations = res.iters;
    out.objective = res.obj;

    std::ostringstream oss;
    oss << (res.converged ? "Converged: " : "Did not converge: ") << math::describe(res.status)
        << " after " << res.iters << " iterations";
    out.message = oss.str();
    if (!res.converged) {
        log->warn("Entropy calibration did not converge: {} (max relative violation {:.3e})",
                  math::describe(res.status), res.grad_norm);
    }
    return out;
}

} // namespace wcal::calib
