#include "libwcal/core/logging.hpp"

#include <spdlog/sinks/stdout_sinks.h>

#include <mutex>
#include <stdexcept>

namespace wcal::log {

namespace {

constexpr const char* LOGGER_NAME = "libwcal";

} // namespace

std::shared_ptr<spdlog::logger> logger() {
    static std::mutex mtx;

    std::lock_guard<std::mutex> lock(mtx);
    auto lg = spdlog::get(LOGGER_NAME);
    if (!lg) {
        lg = spdlog::stdout_logger_mt(LOGGER_NAME);
        lg->set_pattern("[%H:%M:%S.%e] [%n] [%l] %v");
    }
    return lg;
}

void set_level(const std::string& level) {
    const auto parsed = spdlog::level::from_str(level);
    if (parsed == spdlog::level::off && level != "off") {
        throw std::invalid_argument("set_level: unknown log level '" + level + "'");
    }
    logger()->set_level(parsed);
}

} // namespace wcal::log
