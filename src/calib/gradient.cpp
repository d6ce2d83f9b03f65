#include "libwcal/calib/gradient.hpp"

#include "libwcal/core/logging.hpp"
#include "libwcal/math/adam.hpp"
#include "libwcal/math/lbfgs.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace wcal::calib {

namespace {

constexpr double LOG_W_FLOOR = 1e-10;
constexpr double MAX_LOG_W = 700.0;

void exp_weights(const std::vector<double>& u, std::vector<double>& w) {
    w.resize(u.size());
    for (std::size_t i = 0; i < u.size(); ++i) {
        w[i] = std::exp(std::min(MAX_LOG_W, std::max(-MAX_LOG_W, u[i])));
    }
}

} // namespace

GradientObjective::GradientObjective(const math::ConstraintMatrix& A,
                                     std::vector<double> targets,
                                     std::vector<int> groups)
    : A_(A), targets_(std::move(targets)), groups_(std::move(groups)) {
    const std::size_t m = targets_.size();
    if (A_.rows() != m || groups_.size() != m) {
        throw std::invalid_argument("GradientObjective: targets, groups and matrix rows differ");
    }
    for (std::size_t j = 0; j < m; ++j) {
        if (targets_[j] == -1.0) {
            throw std::invalid_argument("GradientObjective: target of -1 makes the relative error undefined");
        }
        if (groups_[j] < 0) {
            throw std::invalid_argument("GradientObjective: negative group id");
        }
        const auto g = static_cast<std::size_t>(groups_[j]);
        if (g >= group_sizes_.size()) {
            group_sizes_.resize(g + 1, 0.0);
        }
        group_sizes_[g] += 1.0;
    }

    // Empty ids (gaps in the numbering) are not groups.
    group_count_ = static_cast<std::size_t>(
        std::count_if(group_sizes_.begin(), group_sizes_.end(), [](double s) { return s > 0.0; }));
    const double n_groups = static_cast<double>(group_count_);
    target_weight_.resize(m, 0.0);
    for (std::size_t j = 0; j < m; ++j) {
        target_weight_[j] = 1.0 / (n_groups * group_sizes_[static_cast<std::size_t>(groups_[j])]);
    }
}

double GradientObjective::loss(const std::vector<double>& weights) const {
    std::vector<double> est;
    A_.multiply(weights, est);
    double total = 0.0;
    for (std::size_t j = 0; j < targets_.size(); ++j) {
        const double r = (est[j] - targets_[j]) / (targets_[j] + 1.0);
        total += target_weight_[j] * r * r;
    }
    return total;
}

double GradientObjective::evaluate(const std::vector<double>& u, std::vector<double>& grad) const {
    std::vector<double> w;
    exp_weights(u, w);
    std::vector<double> est;
    A_.multiply(w, est);

    const std::size_t m = targets_.size();
    std::vector<double> coef(m, 0.0);
    double total = 0.0;
    for (std::size_t j = 0; j < m; ++j) {
        const double denom = targets_[j] + 1.0;
        const double r = (est[j] - targets_[j]) / denom;
        total += target_weight_[j] * r * r;
        // d/dw_i of weight_j * r_j^2 = weight_j * 2 r_j / (y_j + 1) * A_ji
        coef[j] = target_weight_[j] * 2.0 * r / denom;
    }

    // Chain rule through w = exp(u): d loss / d u_i = w_i * (A^T coef)_i
    A_.multiply_transpose(coef, grad);
    for (std::size_t i = 0; i < grad.size(); ++i) {
        grad[i] *= w[i];
    }
    return total;
}

BackendResult AdamBackend::minimize(const GradientObjective& objective,
                                    const std::vector<double>& log_w0,
                                    const GradientConfig& cfg) const {
    auto log = wcal::log::logger();
    math::AdamConfig acfg;
    acfg.epochs = cfg.epochs;
    acfg.learning_rate = cfg.learning_rate;

    auto f_grad = [&objective](const std::vector<double>& u, double& f, std::vector<double>& g) {
        f = objective.evaluate(u, g);
    };
    auto on_epoch = [&log](int epoch, double loss) {
        log->info("Epoch {:4d}: loss = {:.6f}", epoch, loss);
    };

    const auto res = math::minimize_adam(log_w0, f_grad, acfg, on_epoch);
    std::ostringstream oss;
    if (res.finite) {
        oss << "Completed " << res.epochs << " Adam epochs";
    } else {
        oss << "Adam diverged at epoch " << res.epochs;
    }
    return { res.x, res.obj, res.epochs, res.finite, oss.str() };
}

BackendResult LbfgsBackend::minimize(const GradientObjective& objective,
                                     const std::vector<double>& log_w0,
                                     const GradientConfig& cfg) const {
    math::LbfgsConfig lcfg;
    lcfg.max_iter = cfg.epochs;
    lcfg.ftol = cfg.lbfgs_ftol;
    lcfg.gtol = cfg.lbfgs_gtol;

    auto f_grad = [&objective](const std::vector<double>& u, double& f, std::vector<double>& g) {
        f = objective.evaluate(u, g);
    };
    const auto res = math::minimize_lbfgs(log_w0, {}, {}, f_grad, lcfg);

    std::ostringstream oss;
    oss << (res.converged ? "Converged: " : "Did not converge: ") << math::describe(res.status)
        << " after " << res.iters << " iterations";
    return { res.x, res.obj, res.iters, res.converged, oss.str() };
}

std::unique_ptr<GradientBackend> make_backend(GradientBackendKind kind) {
    switch (kind) {
        case GradientBackendKind::Auto:
        case GradientBackendKind::Adam:
            return std::make_unique<AdamBackend>();
        case GradientBackendKind::Lbfgs:
            return std::make_unique<LbfgsBackend>();
    }
    throw std::invalid_argument("make_backend: unknown backend kind");
}

GradientCalibrator::GradientCalibrator(GradientConfig cfg)
    : cfg_(cfg), backend_(make_backend(cfg.backend)) {}

SolverOutcome GradientCalibrator::solve(const std::vector<double>& original_weights,
                                        const math::ConstraintMatrix& A,
                                        const std::vector<double>& targets,
                                        const std::vector<int>& groups) const {
    const std::size_t n = original_weights.size();
    if (A.cols() != n) {
        throw std::invalid_argument("GradientCalibrator: constraint matrix shape does not match weights");
    }
    const GradientObjective objective(A, targets, groups);

    auto log = wcal::log::logger();
    log->info("Gradient calibration: {} weights, {} targets, {} groups, backend {}",
              n, targets.size(), objective.group_count(), backend_->name());

    std::vector<double> log_w0(n);
    for (std::size_t i = 0; i < n; ++i) {
        log_w0[i] = std::log(original_weights[i] + LOG_W_FLOOR);
    }

    const auto res = backend_->minimize(objective, log_w0, cfg_);

    SolverOutcome out;
    exp_weights(res.log_weights, out.weights);
    out.converged = res.converged;
    out.iterations = res.iterations;
    out.objective = res.loss;
    out.message = res.message;
    log->info("Gradient calibration finished: {} (loss {:.6e})", res.message, res.loss);
    return out;
}

} // namespace wcal::calib
