#include <catch2/catch_all.hpp>
#include <cmath>

#include "libwcal/io/config_yaml.hpp"
#include "libwcal/io/microdata_csv.hpp"
#include "libwcal/io/targets_yaml.hpp"

#include <sstream>
#include <string>

using Catch::Approx;

TEST_CASE("CSV columns are typed by content", "[io][csv]") {
    std::istringstream in(
        "id,weight,adjusted_gross_income,state_fips,name\n"
        "# comment line\n"
        "1,1500.5,42000,06,\"Smith, J\"\n"
        "\n"
        "2,900,,36,Doe\n");
    const auto table = wcal::io::read_microdata_csv(in);

    REQUIRE(table.size() == 2);
    CHECK(table.weights()[0] == Approx(1500.5));
    CHECK(table.has_numeric("id"));
    CHECK(table.has_numeric("adjusted_gross_income"));
    CHECK(std::isnan(table.numeric("adjusted_gross_income")[1]));
    // "06" parses as a number; geography matching pads it back.
    CHECK(table.numeric("state_fips")[0] == 6.0);
    CHECK(table.has_categorical("name"));
    CHECK(table.categorical("name")[0] == "Smith, J");

    const std::vector<std::string> order{"id", "weight", "adjusted_gross_income", "state_fips", "name"};
    CHECK(table.column_order() == order);
}

TEST_CASE("CSV reader rejects malformed input", "[io][csv]") {
    std::istringstream empty("");
    CHECK_THROWS_AS(wcal::io::read_microdata_csv(empty), std::runtime_error);

    std::istringstream no_weight("id,income\n1,2\n");
    CHECK_THROWS_AS(wcal::io::read_microdata_csv(no_weight), std::runtime_error);

    std::istringstream ragged("weight,income\n1,2\n3\n");
    CHECK_THROWS_WITH(wcal::io::read_microdata_csv(ragged), Catch::Matchers::ContainsSubstring("line 3"));

    std::istringstream bad_weight("weight,income\nabc,2\n");
    CHECK_THROWS_AS(wcal::io::read_microdata_csv(bad_weight), std::runtime_error);

    CHECK_THROWS_AS(wcal::io::load_microdata_csv("/nonexistent/records.csv"), std::runtime_error);
}

TEST_CASE("CSV quoting protects commas and escaped quotes", "[io][csv]") {
    std::istringstream in(
        "weight,name\n"
        "1,\"Doe, \\\"JD\\\"\"\n"
        "2,  plain  \n");
    const auto table = wcal::io::read_microdata_csv(in);
    REQUIRE(table.size() == 2);
    CHECK(table.categorical("name")[0] == "Doe, \"JD\"");
    CHECK(table.categorical("name")[1] == "plain");

    std::ostringstream out;
    wcal::io::write_microdata_csv(out, table, {1.0, 2.0});
    std::istringstream again(out.str());
    const auto reread = wcal::io::read_microdata_csv(again);
    CHECK(reread.categorical("name") == table.categorical("name"));

    std::istringstream bad_escape("weight,name\n1,ok\n2,\"a\\qb\"\n");
    CHECK_THROWS_WITH(wcal::io::read_microdata_csv(bad_escape), Catch::Matchers::ContainsSubstring("line 3"));
}

TEST_CASE("CSV writer appends original weight and adjustment", "[io][csv]") {
    std::istringstream in("id,weight,name\n1,2,a\n2,4,b\n");
    const auto table = wcal::io::read_microdata_csv(in);

    std::ostringstream out;
    wcal::io::write_microdata_csv(out, table, {3.0, 2.0});
    CHECK(out.str() ==
          "id,weight,name,original_weight,weight_adjustment\n"
          "1,3,a,2,1.5\n"
          "2,2,b,4,0.5\n");

    CHECK_THROWS_AS(wcal::io::write_microdata_csv(out, table, {1.0}), std::invalid_argument);
}

TEST_CASE("Target asset expands tables into targets", "[io][yaml]") {
    const std::string text = R"(
version: 1
source: irs-soi
period: 2021
brackets:
  column: agi
  zero_label: none
  intervals:
    - [low, null, 1000]
    - [high, 1000, null]
tables:
  - variable: returns
    type: count
    values: {none: 5, low: 10, high: 20}
  - variable: returns
    type: count
    bracket: all
    values: {"06": 12, "36": 8}
targets:
  - {name: total_agi, variable: agi, type: amount, value: 1.5e6, period: 2020}
)";
    const auto asset = wcal::io::parse_target_asset(text);
    CHECK(asset.version == 1);
    CHECK(asset.source == "irs-soi");
    CHECK(asset.has_brackets);
    CHECK(asset.bracket_column == "agi");
    CHECK(asset.scheme.assign(999.0) == "low");
    CHECK(asset.scheme.assign(0.0) == "none");

    REQUIRE(asset.targets.size() == 6);
    const auto national = asset.targets.bracket_values("returns");
    CHECK(national.at("high") == 20.0);
    CHECK(asset.targets.bracket_values("returns", "06").empty());

    const auto& states = asset.targets.targets();
    CHECK(states[3].geography == "06");
    CHECK(states[3].bracket == "all");
    CHECK(states[3].name == "06/returns/all");
    CHECK(states[3].period == 2021);

    const auto& explicit_target = states.back();
    CHECK(explicit_target.name == "total_agi");
    CHECK(explicit_target.type == wcal::TargetType::Amount);
    CHECK(explicit_target.value == Approx(1.5e6));
    CHECK(explicit_target.period == 2020);
    CHECK(asset.targets.for_period(2021).size() == 5);
}

TEST_CASE("Target asset errors name the document", "[io][yaml]") {
    CHECK_THROWS_WITH(wcal::io::parse_target_asset("tables: [", "broken.yaml"),
                      Catch::Matchers::StartsWith("broken.yaml"));
    CHECK_THROWS_AS(wcal::io::parse_target_asset("version: 1\n"), std::runtime_error);
    CHECK_THROWS_AS(wcal::io::parse_target_asset(
        "tables:\n  - {variable: returns, type: ratio, values: {a: 1}}\n"), std::runtime_error);
    CHECK_THROWS_AS(wcal::io::parse_target_asset(
        "brackets:\n  intervals:\n    - [a, 0, null]\n"
        "targets:\n  - {variable: returns, value: 1}\n"), std::runtime_error);
    CHECK_THROWS_AS(wcal::io::parse_target_asset(
        "brackets:\n  intervals:\n    - [a, null, null]\n"
        "targets:\n  - {variable: returns, bracket: b, value: 1}\n"), std::runtime_error);
    CHECK_THROWS_AS(wcal::io::load_target_asset("/nonexistent/targets.yaml"), std::runtime_error);
}

TEST_CASE("Shipped IRS SOI asset loads", "[io][yaml]") {
    const auto asset = wcal::io::load_target_asset(std::string(LIBWCAL_DATA_DIR) + "/irs_soi_2021.yaml");
    CHECK(asset.period == 2021);
    CHECK(asset.scheme.labels() == wcal::data::irs_agi_brackets().labels());

    const auto counts = asset.targets.bracket_values("returns");
    REQUIRE(counts.size() == 16);
    CHECK(counts.at("no_agi") == Approx(13992100.0));
    CHECK(counts.at("1m_plus") == Approx(664340.0));
    CHECK(asset.targets.bracket_values("agi").at("under_1") == Approx(-94e9));

    double total = 0.0;
    for (const auto& [label, value] : counts) {
        total += value;
    }
    for (const auto& t : asset.targets) {
        if (t.name == "US/returns/all") {
            CHECK(t.value == Approx(total));
        }
    }
}

TEST_CASE("Run configuration keeps defaults for missing keys", "[io][config]") {
    const auto run = wcal::io::parse_run_config(R"(
method: raking
tolerance: 0.01
log_level: debug
raking:
  damping: 0.8
gradient:
  backend: lbfgs
entropy:
  bounds: [0.5, 2.0]
)");
    const auto& cfg = run.calibration;
    CHECK(cfg.method == wcal::calib::CalibrationMethod::Raking);
    CHECK(cfg.tolerance == Approx(0.01));
    CHECK(run.min_obs == 100);
    CHECK(run.log_level == "debug");
    CHECK(cfg.raking.damping == Approx(0.8));
    CHECK(cfg.raking.max_iter == 100);
    CHECK(cfg.gradient.backend == wcal::calib::GradientBackendKind::Lbfgs);
    CHECK(cfg.gradient.epochs == 500);
    CHECK(cfg.entropy.bounds.min_ratio == Approx(0.5));
    CHECK(cfg.entropy.bounds.max_ratio == Approx(2.0));

    const auto empty = wcal::io::parse_run_config("");
    CHECK(empty.calibration.method == wcal::calib::CalibrationMethod::Entropy);

    CHECK(wcal::io::parse_run_config("min_obs: 25\n").min_obs == 25);
}

TEST_CASE("Run configuration rejects unknown names", "[io][config]") {
    CHECK_THROWS_AS(wcal::io::parse_run_config("method: simplex\n"), std::runtime_error);
    CHECK_THROWS_AS(wcal::io::parse_run_config("gradient: {backend: sgd}\n"), std::runtime_error);
    CHECK_THROWS_AS(wcal::io::parse_run_config("entropy: {bounds: [0.5]}\n"), std::runtime_error);
    CHECK_THROWS_AS(wcal::io::parse_run_config("tolerance: [1, 2]\n"), std::runtime_error);

    const auto shipped = wcal::io::load_run_config(std::string(LIBWCAL_DATA_DIR) + "/calibration.yaml");
    CHECK(shipped.calibration.method == wcal::calib::CalibrationMethod::Entropy);
}
