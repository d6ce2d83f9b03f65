#pragma once

#include "libwcal/calib/config.hpp"
#include "libwcal/calib/result.hpp"
#include "libwcal/math/constraint_matrix.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace wcal::calib {

// Grouped squared relative error over log-weights:
//   loss = mean_g mean_{j in g} ((A w - y)_j / (y_j + 1))^2,  w = exp(u)
// Each group contributes equally regardless of how many targets it holds.
class GradientObjective {
public:
    GradientObjective(const math::ConstraintMatrix& A,
                      std::vector<double> targets,
                      std::vector<int> groups);

    // Loss at log-weights u; grad receives d loss / d u.
    double evaluate(const std::vector<double>& u, std::vector<double>& grad) const;

    double loss(const std::vector<double>& weights) const;

    std::size_t dimension() const { return A_.cols(); }
    std::size_t group_count() const { return group_count_; }

private:
    const math::ConstraintMatrix& A_;
    std::vector<double> targets_;
    std::vector<int> groups_;
    std::vector<double> group_sizes_;
    // non-empty groups only
    std::size_t group_count_ = 0;
    // 1 / (|G| * |g(j)|) per target
    std::vector<double> target_weight_;
};

struct BackendResult {
    std::vector<double> log_weights;
    double loss;
    int iterations;
    bool converged;
    std::string message;
};

// Optimizer strategy behind the gradient calibrator; chosen once when the
// calibrator is constructed.
class GradientBackend {
public:
    virtual ~GradientBackend() = default;
    virtual const char* name() const = 0;
    virtual BackendResult minimize(const GradientObjective& objective,
                                   const std::vector<double>& log_w0,
                                   const GradientConfig& cfg) const = 0;
};

class AdamBackend final : public GradientBackend {
public:
    const char* name() const override { return "adam"; }
    BackendResult minimize(const GradientObjective& objective,
                           const std::vector<double>& log_w0,
                           const GradientConfig& cfg) const override;
};

// Quasi-Newton fallback using the closed-form gradient.
class LbfgsBackend final : public GradientBackend {
public:
    const char* name() const override { return "lbfgs"; }
    BackendResult minimize(const GradientObjective& objective,
                           const std::vector<double>& log_w0,
                           const GradientConfig& cfg) const override;
};

std::unique_ptr<GradientBackend> make_backend(GradientBackendKind kind);

class GradientCalibrator {
public:
    explicit GradientCalibrator(GradientConfig cfg = {});

    const GradientBackend& backend() const { return *backend_; }
    const GradientConfig& config() const { return cfg_; }

    SolverOutcome solve(const std::vector<double>& original_weights,
                        const math::ConstraintMatrix& A,
                        const std::vector<double>& targets,
                        const std::vector<int>& groups) const;

private:
    GradientConfig cfg_;
    std::unique_ptr<GradientBackend> backend_;
};

} // namespace wcal::calib
