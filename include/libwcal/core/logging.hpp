#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace wcal::log {

// Shared "libwcal" logger, created on first use.
std::shared_ptr<spdlog::logger> logger();

// Accepts spdlog level names (trace, debug, info, warn, err, critical, off).
void set_level(const std::string& level);

} // namespace wcal::log
