#pragma once

#include <functional>
#include <vector>

namespace wcal::math {

using ObjectiveGrad = std::function<void(const std::vector<double>&, double&, std::vector<double>&)>;

struct LbfgsConfig {
    int max_iter = 200;
    int history = 10;
    double ftol = 1e-8;   // relative objective decrease
    double gtol = 1e-6;   // inf-norm of the projected gradient
    int max_linesearch = 40;
};

enum class LbfgsStatus {
    GradientConverged,
    ObjectiveConverged,
    MaxIterations,
    LineSearchFailed
};

const char* describe(LbfgsStatus status);

struct LbfgsResult {
    std::vector<double> x;
    double obj;
    int iters;
    int evaluations;
    double grad_norm;
    LbfgsStatus status;
    bool converged;
};

// Limited-memory BFGS with box constraints handled by projection and an
// Armijo backtracking line search. Empty lb/ub mean unbounded.
LbfgsResult minimize_lbfgs(const std::vector<double>& x0,
                           const std::vector<double>& lb,
                           const std::vector<double>& ub,
                           const ObjectiveGrad& f_grad,
                           const LbfgsConfig& cfg = {});

} // namespace wcal::math
