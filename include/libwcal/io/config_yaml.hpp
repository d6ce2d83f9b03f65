#pragma once

#include "libwcal/calib/config.hpp"

#include <string>

namespace wcal::io {

struct RunConfig {
    calib::CalibrationConfig calibration;
    // Bracket sparsity cutoff for the constraint builder.
    int min_obs = 100;
    std::string log_level = "info";
};

// Keys absent from the document keep their defaults. Unknown method or
// backend names and malformed YAML throw std::runtime_error.
RunConfig parse_run_config(const std::string& yaml_text, const std::string& origin = "<string>");

RunConfig load_run_config(const std::string& path);

} // namespace wcal::io
