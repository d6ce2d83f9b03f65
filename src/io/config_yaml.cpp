#include "libwcal/io/config_yaml.hpp"

#include <yaml-cpp/yaml.h>

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace wcal::io {

namespace {

void read_entropy(const YAML::Node& node, calib::EntropyConfig& cfg) {
    if (!node) {
        return;
    }
    if (const auto bounds = node["bounds"]) {
        if (!bounds.IsSequence() || bounds.size() != 2) {
            throw std::runtime_error("entropy.bounds must be [min_ratio, max_ratio]");
        }
        cfg.bounds.min_ratio = bounds[0].as<double>();
        cfg.bounds.max_ratio = bounds[1].as<double>();
    }
    cfg.max_iter = node["max_iter"].as<int>(cfg.max_iter);
    cfg.ftol = node["ftol"].as<double>(cfg.ftol);
    cfg.gtol = node["gtol"].as<double>(cfg.gtol);
}

void read_raking(const YAML::Node& node, calib::RakingConfig& cfg) {
    if (!node) {
        return;
    }
    cfg.max_iter = node["max_iter"].as<int>(cfg.max_iter);
    cfg.damping = node["damping"].as<double>(cfg.damping);
    cfg.min_ratio = node["min_ratio"].as<double>(cfg.min_ratio);
    cfg.max_ratio = node["max_ratio"].as<double>(cfg.max_ratio);
    cfg.max_adjustment = node["max_adjustment"].as<double>(cfg.max_adjustment);
}

void read_gradient(const YAML::Node& node, calib::GradientConfig& cfg) {
    if (!node) {
        return;
    }
    cfg.epochs = node["epochs"].as<int>(cfg.epochs);
    cfg.learning_rate = node["learning_rate"].as<double>(cfg.learning_rate);
    if (const auto backend = node["backend"]) {
        cfg.backend = calib::parse_backend(backend.as<std::string>());
    }
}

} // namespace

RunConfig parse_run_config(const std::string& yaml_text, const std::string& origin) {
    RunConfig run;
    auto& cfg = run.calibration;
    try {
        const YAML::Node root = YAML::Load(yaml_text);
        if (root.IsNull()) {
            return run;
        }
        if (!root.IsMap()) {
            throw std::runtime_error("run configuration must be a mapping");
        }
        if (const auto method = root["method"]) {
            cfg.method = calib::parse_method(method.as<std::string>());
        }
        cfg.tolerance = root["tolerance"].as<double>(cfg.tolerance);
        run.min_obs = root["min_obs"].as<int>(run.min_obs);
        cfg.num_threads = root["num_threads"].as<int>(cfg.num_threads);
        run.log_level = root["log_level"].as<std::string>(run.log_level);
        read_entropy(root["entropy"], cfg.entropy);
        read_raking(root["raking"], cfg.raking);
        read_gradient(root["gradient"], cfg.gradient);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error(origin + ": YAML error: " + e.what());
    } catch (const std::exception& e) {
        throw std::runtime_error(origin + ": " + e.what());
    }
    return run;
}

RunConfig load_run_config(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("load_run_config: cannot open " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse_run_config(buffer.str(), path);
}

} // namespace wcal::io
