#include <catch2/catch_all.hpp>

#include "libwcal/data/brackets.hpp"
#include "libwcal/data/microdata.hpp"
#include "libwcal/data/targets.hpp"

#include <cmath>
#include <limits>
#include <numeric>

namespace {

constexpr double INF = std::numeric_limits<double>::infinity();

} // namespace

TEST_CASE("IRS scheme assigns boundary values to the upper bracket", "[brackets]") {
    const auto scheme = wcal::data::irs_agi_brackets();

    CHECK(scheme.assign(0.0) == "no_agi");
    CHECK(scheme.assign(std::numeric_limits<double>::quiet_NaN()) == "no_agi");
    CHECK(scheme.assign(-25000.0) == "under_1");
    CHECK(scheme.assign(0.5) == "under_1");
    CHECK(scheme.assign(1.0) == "1_to_5k");
    CHECK(scheme.assign(4999.99) == "1_to_5k");
    CHECK(scheme.assign(5000.0) == "5k_to_10k");
    CHECK(scheme.assign(99999.0) == "75k_to_100k");
    CHECK(scheme.assign(1e6) == "1m_plus");
    CHECK(scheme.assign(5e9) == "1m_plus");
}

TEST_CASE("Scheme labels start with the zero label", "[brackets]") {
    const auto labels = wcal::data::irs_agi_brackets().labels();
    REQUIRE(labels.size() == 16);
    CHECK(labels.front() == "no_agi");
    CHECK(labels[1] == "under_1");
    CHECK(labels.back() == "1m_plus");
}

TEST_CASE("Intervals are sorted on construction", "[brackets]") {
    const wcal::data::BracketScheme scheme("zero", {
        {"high", 10.0, INF},
        {"low", -INF, 10.0}
    });
    CHECK(scheme.intervals().front().label == "low");
    CHECK(scheme.assign(3.0) == "low");
    CHECK(scheme.assign(10.0) == "high");
    CHECK(scheme.contains("zero"));
    CHECK_FALSE(scheme.contains("middle"));
}

TEST_CASE("Schemes that do not partition the line are rejected", "[brackets]") {
    using wcal::data::BracketScheme;
    CHECK_THROWS_AS(BracketScheme("zero", {}), std::invalid_argument);
    CHECK_THROWS_AS(BracketScheme("zero", {{"a", 0.0, INF}}), std::invalid_argument);
    CHECK_THROWS_AS(BracketScheme("zero", {{"a", -INF, 100.0}}), std::invalid_argument);
    CHECK_THROWS_AS(BracketScheme("zero", {{"a", -INF, 5.0}, {"b", 6.0, INF}}), std::invalid_argument);
    CHECK_THROWS_AS(BracketScheme("zero", {{"a", -INF, 5.0}, {"a", 5.0, INF}}), std::invalid_argument);
    CHECK_THROWS_AS(BracketScheme("a", {{"a", -INF, 5.0}, {"b", 5.0, INF}}), std::invalid_argument);
}

TEST_CASE("Bracket counts cover every record", "[brackets]") {
    const auto scheme = wcal::data::irs_agi_brackets();
    std::vector<double> agi;
    for (int i = 0; i < 997; ++i) {
        agi.push_back(i % 7 == 0 ? 0.0 : -5000.0 + 1713.0 * i);
    }
    agi.push_back(std::numeric_limits<double>::quiet_NaN());

    const auto counts = wcal::data::bracket_counts(scheme, agi);
    CHECK(counts.size() == scheme.labels().size());
    const std::size_t total = std::accumulate(counts.begin(), counts.end(), std::size_t{0},
        [](std::size_t acc, const auto& kv) { return acc + kv.second; });
    CHECK(total == agi.size());
    CHECK(counts.at("no_agi") == 143 + 1);
}

TEST_CASE("Microdata table validates column shape", "[microdata]") {
    wcal::data::MicrodataTable table(std::vector<double>(3, 1.0));
    table.add_numeric("income", {1.0, 2.0, 3.0});
    table.add_categorical("state_fips", {"06", "36", "48"});

    CHECK_THROWS_AS(table.add_numeric("income", {1.0, 2.0, 3.0}), std::invalid_argument);
    CHECK_THROWS_AS(table.add_numeric("weight", {1.0, 2.0, 3.0}), std::invalid_argument);
    CHECK_THROWS_AS(table.add_numeric("short", {1.0}), std::invalid_argument);
    CHECK_THROWS_AS(table.numeric("missing"), std::out_of_range);
    CHECK_THROWS_AS(table.categorical("income"), std::out_of_range);

    const std::vector<std::string> expected{"weight", "income", "state_fips"};
    CHECK(table.column_order() == expected);

    const auto reweighted = table.with_weights({2.0, 2.0, 2.0});
    CHECK(reweighted.weights()[1] == 2.0);
    CHECK(table.weights()[1] == 1.0);
    CHECK(reweighted.numeric("income")[2] == 3.0);
    CHECK_THROWS_AS(table.with_weights({1.0}), std::invalid_argument);
}

TEST_CASE("Target table filters by period, source and bracket", "[targets]") {
    wcal::data::TargetTable table;
    table.add({"US/returns/under_1", "", "returns", 2021, 10.0, wcal::TargetType::Count, "irs-soi", "US", "under_1"});
    table.add({"US/returns/1_to_5k", "", "returns", 2021, 20.0, wcal::TargetType::Count, "irs-soi", "US", "1_to_5k"});
    table.add({"US/returns/all", "", "returns", 2021, 30.0, wcal::TargetType::Count, "irs-soi", "US", "all"});
    table.add({"06/returns/under_1", "", "returns", 2021, 4.0, wcal::TargetType::Count, "irs-soi", "06", "under_1"});
    table.add({"US/returns/under_1", "", "returns", 2020, 9.0, wcal::TargetType::Count, "census", "US", "under_1"});

    CHECK(table.for_period(2021).size() == 4);
    CHECK(table.from_source("census").size() == 1);

    const auto national = table.for_period(2021).bracket_values("returns");
    REQUIRE(national.size() == 2);
    CHECK(national.at("under_1") == 10.0);
    CHECK(national.at("1_to_5k") == 20.0);
    CHECK(table.bracket_values("returns", "06").at("under_1") == 4.0);
}
