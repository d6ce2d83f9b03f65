#pragma once

#include <string>

namespace wcal::calib {

enum class CalibrationMethod {
    Entropy,
    Raking,
    Gradient
};

const char* to_string(CalibrationMethod method);
CalibrationMethod parse_method(const std::string& text);

enum class GradientBackendKind {
    Auto,
    Adam,
    Lbfgs
};

const char* to_string(GradientBackendKind kind);
GradientBackendKind parse_backend(const std::string& text);

// Calibrated/original weight ratio limits.
struct RatioBounds {
    double min_ratio = 0.2;
    double max_ratio = 5.0;
};

struct EntropyConfig {
    RatioBounds bounds;
    int max_iter = 200;
    double ftol = 1e-8;
    double gtol = 1e-6;
    double log_clip = 10.0;   // |A^T lambda| cap inside the dual
};

struct RakingConfig {
    int max_iter = 100;
    double damping = 0.5;
    double min_ratio = 0.8;   // per-step ratio band
    double max_ratio = 1.25;
    double max_adjustment = 3.0;
};

struct GradientConfig {
    int epochs = 500;
    double learning_rate = 0.3;
    GradientBackendKind backend = GradientBackendKind::Auto;
    double lbfgs_ftol = 1e-12;
    double lbfgs_gtol = 1e-10;
};

struct CalibrationConfig {
    CalibrationMethod method = CalibrationMethod::Entropy;
    double tolerance = 0.05;
    int num_threads = 1;
    EntropyConfig entropy;
    RakingConfig raking;
    GradientConfig gradient;
};

} // namespace wcal::calib
