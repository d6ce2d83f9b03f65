#include "libwcal/io/targets_yaml.hpp"

#include "libwcal/core/logging.hpp"

#include <yaml-cpp/yaml.h>

#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace wcal::io {

namespace {

constexpr double INF = std::numeric_limits<double>::infinity();

[[noreturn]] void fail(const std::string& origin, const std::string& what) {
    throw std::runtime_error(origin + ": " + what);
}

double bound(const YAML::Node& node, double unbounded) {
    if (!node || node.IsNull()) {
        return unbounded;
    }
    return node.as<double>();
}

data::BracketScheme parse_scheme(const YAML::Node& node, const std::string& origin) {
    const auto intervals = node["intervals"];
    if (!intervals || !intervals.IsSequence()) {
        fail(origin, "brackets.intervals must be a sequence of [label, low, high]");
    }
    std::vector<data::Bracket> brackets;
    for (std::size_t i = 0; i < intervals.size(); ++i) {
        const auto item = intervals[i];
        if (!item.IsSequence() || item.size() != 3) {
            fail(origin, "brackets.intervals[" + std::to_string(i) + "] must be [label, low, high]");
        }
        brackets.push_back({ item[0].as<std::string>(), bound(item[1], -INF), bound(item[2], INF) });
    }
    try {
        return data::BracketScheme(node["zero_label"].as<std::string>("no_agi"), std::move(brackets));
    } catch (const std::invalid_argument& e) {
        fail(origin, std::string("invalid bracket scheme: ") + e.what());
    }
}

data::Target base_target(const YAML::Node& node, const TargetAsset& asset) {
    data::Target t;
    t.variable = node["variable"].as<std::string>();
    t.type = parse_target_type(node["type"].as<std::string>("count"));
    t.period = node["period"].as<int>(asset.period);
    t.source = node["source"].as<std::string>(asset.source);
    t.stratum = node["stratum"].as<std::string>("");
    t.geography = node["geography"].as<std::string>("US");
    t.bracket = node["bracket"].as<std::string>("all");
    return t;
}

std::string default_name(const data::Target& t) {
    return t.geography + "/" + t.variable + "/" + t.bracket;
}

void check_bracket(const data::Target& t, const TargetAsset& asset, const std::string& origin,
                   const std::string& entry) {
    if (asset.has_brackets && t.bracket != "all" && !asset.scheme.contains(t.bracket)) {
        fail(origin, entry + " uses unknown bracket '" + t.bracket + "'");
    }
}

// A table is keyed by bracket label, or by geography when it names a
// bracket of its own.
void parse_table(const YAML::Node& node, std::size_t index, TargetAsset& asset,
                 const std::string& origin) {
    const std::string entry = "tables[" + std::to_string(index) + "]";
    const auto values = node["values"];
    if (!values || !values.IsMap()) {
        fail(origin, entry + ".values must be a mapping");
    }
    const bool keyed_by_geography = static_cast<bool>(node["bracket"]);
    const auto base = base_target(node, asset);
    for (const auto& kv : values) {
        auto t = base;
        const auto key = kv.first.as<std::string>();
        if (keyed_by_geography) {
            t.geography = key;
        } else {
            t.bracket = key;
        }
        t.value = kv.second.as<double>();
        t.name = default_name(t);
        check_bracket(t, asset, origin, entry);
        asset.targets.add(std::move(t));
    }
}

} // namespace

TargetAsset parse_target_asset(const std::string& yaml_text, const std::string& origin) {
    TargetAsset asset;
    try {
        const YAML::Node root = YAML::Load(yaml_text);
        if (!root.IsMap()) {
            fail(origin, "target asset must be a mapping");
        }
        asset.version = root["version"].as<int>(1);
        asset.source = root["source"].as<std::string>("");
        asset.period = root["period"].as<int>(0);

        if (const auto brackets = root["brackets"]) {
            asset.scheme = parse_scheme(brackets, origin);
            asset.bracket_column = brackets["column"].as<std::string>(asset.bracket_column);
            asset.has_brackets = true;
        }

        if (const auto tables = root["tables"]) {
            for (std::size_t i = 0; i < tables.size(); ++i) {
                parse_table(tables[i], i, asset, origin);
            }
        }
        if (const auto targets = root["targets"]) {
            for (std::size_t i = 0; i < targets.size(); ++i) {
                const auto node = targets[i];
                auto t = base_target(node, asset);
                t.value = node["value"].as<double>();
                t.name = node["name"].as<std::string>(default_name(t));
                check_bracket(t, asset, origin, "targets[" + std::to_string(i) + "]");
                asset.targets.add(std::move(t));
            }
        }
    } catch (const YAML::Exception& e) {
        fail(origin, std::string("YAML error: ") + e.what());
    } catch (const std::invalid_argument& e) {
        fail(origin, e.what());
    }
    if (asset.targets.empty()) {
        fail(origin, "no targets defined");
    }
    wcal::log::logger()->debug("Loaded {} targets from {} (source '{}', period {})",
                               asset.targets.size(), origin, asset.source, asset.period);
    return asset;
}

TargetAsset load_target_asset(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("load_target_asset: cannot open " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse_target_asset(buffer.str(), path);
}

} // namespace wcal::io
