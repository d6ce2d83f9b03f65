#include "libwcal/calib/calibrator.hpp"

#include "libwcal/calib/constraints.hpp"
#include "libwcal/calib/diagnostics.hpp"
#include "libwcal/calib/entropy.hpp"
#include "libwcal/calib/gradient.hpp"
#include "libwcal/calib/raking.hpp"
#include "libwcal/core/logging.hpp"
#include "libwcal/math/constraint_matrix.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>
#include <string>

namespace wcal::calib {

namespace {

std::string lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

void require(bool ok, const char* what) {
    if (!ok) {
        throw std::invalid_argument(std::string("calibrate: ") + what);
    }
}

} // namespace

const char* to_string(CalibrationMethod method) {
    switch (method) {
        case CalibrationMethod::Entropy: return "entropy";
        case CalibrationMethod::Raking: return "raking";
        case CalibrationMethod::Gradient: return "gradient";
    }
    return "unknown";
}

CalibrationMethod parse_method(const std::string& text) {
    const auto key = lower(text);
    if (key == "entropy") {
        return CalibrationMethod::Entropy;
    }
    if (key == "raking" || key == "ipf") {
        return CalibrationMethod::Raking;
    }
    if (key == "gradient" || key == "gd") {
        return CalibrationMethod::Gradient;
    }
    throw std::invalid_argument("parse_method: unknown calibration method '" + text + "'");
}

const char* to_string(GradientBackendKind kind) {
    switch (kind) {
        case GradientBackendKind::Auto: return "auto";
        case GradientBackendKind::Adam: return "adam";
        case GradientBackendKind::Lbfgs: return "lbfgs";
    }
    return "unknown";
}

GradientBackendKind parse_backend(const std::string& text) {
    const auto key = lower(text);
    if (key == "auto") {
        return GradientBackendKind::Auto;
    }
    if (key == "adam") {
        return GradientBackendKind::Adam;
    }
    if (key == "lbfgs" || key == "l-bfgs" || key == "l-bfgs-b") {
        return GradientBackendKind::Lbfgs;
    }
    throw std::invalid_argument("parse_backend: unknown gradient backend '" + text + "'");
}

void validate_inputs(const std::vector<double>& weights,
                     const std::vector<Constraint>& constraints,
                     const CalibrationConfig& cfg) {
    require(!weights.empty(), "no records to calibrate");
    require(!constraints.empty(), "constraint list is empty");
    for (double w : weights) {
        require(std::isfinite(w) && w > 0.0, "initial weights must be positive and finite");
    }
    for (const auto& c : constraints) {
        if (c.indicator.size() != weights.size()) {
            throw std::invalid_argument("calibrate: constraint '" + c.variable + "' has " +
                                        std::to_string(c.indicator.size()) + " entries for " +
                                        std::to_string(weights.size()) + " records");
        }
        if (!std::isfinite(c.target_value)) {
            throw std::invalid_argument("calibrate: constraint '" + c.variable + "' has a non-finite target");
        }
        for (double v : c.indicator) {
            if (!std::isfinite(v)) {
                throw std::invalid_argument("calibrate: constraint '" + c.variable +
                                            "' has a non-finite indicator entry");
            }
        }
    }

    require(cfg.tolerance > 0.0, "tolerance must be positive");
    require(cfg.num_threads >= 1, "num_threads must be at least 1");

    const auto& b = cfg.entropy.bounds;
    require(b.min_ratio > 0.0 && b.min_ratio <= 1.0 && b.max_ratio >= 1.0,
            "ratio bounds must satisfy 0 < min <= 1 <= max");
    require(cfg.entropy.max_iter > 0, "entropy max_iter must be positive");

    require(cfg.raking.damping > 0.0 && cfg.raking.damping <= 1.0, "raking damping must be in (0, 1]");
    require(cfg.raking.max_iter > 0, "raking max_iter must be positive");
    require(cfg.raking.max_adjustment >= 1.0, "raking max_adjustment must be at least 1");

    require(cfg.gradient.epochs > 0, "gradient epochs must be positive");
    require(cfg.gradient.learning_rate > 0.0, "gradient learning_rate must be positive");
}

CalibrationResult calibrate(const std::vector<double>& weights,
                            const std::vector<Constraint>& constraints,
                            const CalibrationConfig& cfg) {
    validate_inputs(weights, constraints, cfg);
    auto log = wcal::log::logger();

    const auto A = math::ConstraintMatrix::from_constraints(constraints, cfg.num_threads);
    const std::size_t m = constraints.size();
    std::vector<double> targets(m);
    std::vector<TargetType> types(m);
    for (std::size_t j = 0; j < m; ++j) {
        targets[j] = constraints[j].target_value;
        types[j] = constraints[j].target_type;
    }

    std::vector<double> before;
    A.multiply(weights, before);

    SolverOutcome outcome;
    switch (cfg.method) {
        case CalibrationMethod::Entropy:
            outcome = solve_entropy(weights, A, targets, cfg.entropy);
            break;
        case CalibrationMethod::Raking:
            outcome = solve_raking(weights, A, targets, types, cfg.tolerance, cfg.raking);
            break;
        case CalibrationMethod::Gradient: {
            const GradientCalibrator calibrator(cfg.gradient);
            outcome = calibrator.solve(weights, A, targets, group_ids(constraints).ids);
            break;
        }
    }

    std::vector<double> after;
    A.multiply(outcome.weights, after);
    const bool smoothed = cfg.method == CalibrationMethod::Gradient;
    auto reports = build_reports(constraints, before, after, smoothed);

    // Reports keep the engine's own error; success is judged on one scale.
    double worst = 0.0;
    for (std::size_t j = 0; j < m; ++j) {
        worst = std::max(worst, tolerance_error(after[j], targets[j]));
    }
    const bool success = outcome.converged && worst < cfg.tolerance;

    std::string message = outcome.message;
    if (outcome.converged && !success) {
        message += "; max |error| " + std::to_string(worst) + " exceeds tolerance " +
                   std::to_string(cfg.tolerance);
    }

    const double kl = kl_divergence(outcome.weights, weights);
    log->info("Calibration ({}) {}: max |error| {:.4e}, KL divergence {:.6f}",
              to_string(cfg.method), success ? "succeeded" : "failed", worst, kl);

    return CalibrationResult(cfg.method, weights, std::move(outcome.weights), std::move(reports),
                             success, std::move(message), kl, outcome.objective, outcome.iterations);
}

CalibrationResult calibrate(const data::MicrodataTable& records,
                            const std::vector<Constraint>& constraints,
                            const CalibrationConfig& cfg) {
    return calibrate(records.weights(), constraints, cfg);
}

} // namespace wcal::calib
