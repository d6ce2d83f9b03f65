#include "libwcal/calib/result.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace wcal::calib {

CalibrationResult::CalibrationResult(CalibrationMethod method,
                                     std::vector<double> original_weights,
                                     std::vector<double> calibrated_weights,
                                     std::vector<ConstraintReport> reports,
                                     bool success,
                                     std::string message,
                                     double kl_divergence,
                                     double loss,
                                     int iterations)
    : method_(method),
      original_weights_(std::move(original_weights)),
      calibrated_weights_(std::move(calibrated_weights)),
      reports_(std::move(reports)),
      success_(success),
      message_(std::move(message)),
      kl_divergence_(kl_divergence),
      loss_(loss),
      iterations_(iterations) {}

double CalibrationResult::max_abs_error() const {
    double worst = 0.0;
    for (const auto& r : reports_) {
        worst = std::max(worst, std::abs(r.error_after));
    }
    return worst;
}

double CalibrationResult::original_total() const {
    return std::accumulate(original_weights_.begin(), original_weights_.end(), 0.0);
}

double CalibrationResult::calibrated_total() const {
    return std::accumulate(calibrated_weights_.begin(), calibrated_weights_.end(), 0.0);
}

std::vector<double> CalibrationResult::adjustment_factors() const {
    std::vector<double> out(calibrated_weights_.size(), 0.0);
    for (std::size_t i = 0; i < out.size(); ++i) {
        out[i] = calibrated_weights_[i] / original_weights_[i];
    }
    return out;
}

AdjustmentStats CalibrationResult::adjustment_stats() const {
    AdjustmentStats stats;
    const auto factors = adjustment_factors();
    if (factors.empty()) {
        return stats;
    }
    const double n = static_cast<double>(factors.size());
    stats.mean = std::accumulate(factors.begin(), factors.end(), 0.0) / n;
    double ss = 0.0;
    for (double f : factors) {
        ss += (f - stats.mean) * (f - stats.mean);
    }
    stats.stddev = std::sqrt(ss / n);
    const auto [lo, hi] = std::minmax_element(factors.begin(), factors.end());
    stats.min = *lo;
    stats.max = *hi;
    return stats;
}

std::vector<ConstraintReport> CalibrationResult::worst_offenders(std::size_t count) const {
    std::vector<ConstraintReport> sorted = reports_;
    std::stable_sort(sorted.begin(), sorted.end(), [](const ConstraintReport& a, const ConstraintReport& b) {
        return std::abs(a.error_after) > std::abs(b.error_after);
    });
    if (sorted.size() > count) {
        sorted.resize(count);
    }
    return sorted;
}

} // namespace wcal::calib
