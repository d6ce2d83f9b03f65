#pragma once

#include "libwcal/calib/config.hpp"
#include "libwcal/calib/result.hpp"
#include "libwcal/core/types.hpp"
#include "libwcal/data/microdata.hpp"

#include <vector>

namespace wcal::calib {

// Throws std::invalid_argument for inputs no engine can work with: empty
// constraint list, indicator length != record count, non-positive or
// non-finite weights, non-finite indicators or targets, and invalid engine
// settings.
void validate_inputs(const std::vector<double>& weights,
                     const std::vector<Constraint>& constraints,
                     const CalibrationConfig& cfg);

// Runs the engine named by cfg.method. Non-convergence is reported through
// CalibrationResult::success(), never thrown.
CalibrationResult calibrate(const std::vector<double>& weights,
                            const std::vector<Constraint>& constraints,
                            const CalibrationConfig& cfg = {});

CalibrationResult calibrate(const data::MicrodataTable& records,
                            const std::vector<Constraint>& constraints,
                            const CalibrationConfig& cfg = {});

} // namespace wcal::calib
