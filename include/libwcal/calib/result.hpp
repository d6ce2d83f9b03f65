#pragma once

#include "libwcal/calib/config.hpp"
#include "libwcal/core/types.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace wcal::calib {

struct ConstraintReport {
    std::string name;
    std::string stratum;
    std::string group;
    TargetType target_type = TargetType::Count;
    double target = 0.0;
    double achieved_before = 0.0;
    double achieved_after = 0.0;
    double error_before = 0.0;
    double error_after = 0.0;
    double tolerance = 0.0;
    bool within_tolerance = false;
};

// What an engine hands back to the calibrate() facade.
struct SolverOutcome {
    std::vector<double> weights;
    bool converged = false;
    int iterations = 0;
    double objective = 0.0;
    std::string message;
};

struct AdjustmentStats {
    double mean = 0.0;
    double stddev = 0.0;
    double min = 0.0;
    double max = 0.0;
};

// Outcome of one calibration run. Built once by the engine and read-only
// afterwards; writing weights back to the record store is up to the caller.
class CalibrationResult {
public:
    CalibrationResult(CalibrationMethod method,
                      std::vector<double> original_weights,
                      std::vector<double> calibrated_weights,
                      std::vector<ConstraintReport> reports,
                      bool success,
                      std::string message,
                      double kl_divergence,
                      double loss,
                      int iterations);

    CalibrationMethod method() const { return method_; }
    const std::vector<double>& original_weights() const { return original_weights_; }
    const std::vector<double>& calibrated_weights() const { return calibrated_weights_; }
    const std::vector<ConstraintReport>& reports() const { return reports_; }
    bool success() const { return success_; }
    const std::string& message() const { return message_; }
    double kl_divergence() const { return kl_divergence_; }
    // Engine objective at the returned weights: normalized dual value
    // (entropy), max |error| (raking), grouped loss (gradient).
    double loss() const { return loss_; }
    int iterations() const { return iterations_; }

    double max_abs_error() const;
    double original_total() const;
    double calibrated_total() const;
    std::vector<double> adjustment_factors() const;
    AdjustmentStats adjustment_stats() const;

    // Reports sorted by descending |error_after|, at most count entries.
    std::vector<ConstraintReport> worst_offenders(std::size_t count) const;

private:
    CalibrationMethod method_;
    std::vector<double> original_weights_;
    std::vector<double> calibrated_weights_;
    std::vector<ConstraintReport> reports_;
    bool success_;
    std::string message_;
    double kl_divergence_;
    double loss_;
    int iterations_;
};

} // namespace wcal::calib
