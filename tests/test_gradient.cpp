#include <catch2/catch_all.hpp>
#include <cmath>

#include "libwcal/calib/diagnostics.hpp"
#include "libwcal/calib/gradient.hpp"
#include "libwcal/math/constraint_matrix.hpp"

#include <algorithm>
#include <string>

using Catch::Approx;

namespace {

wcal::math::ConstraintMatrix ones(std::size_t n) {
    wcal::math::ConstraintMatrix A(1, n);
    for (std::size_t i = 0; i < n; ++i) A(0, i) = 1.0;
    return A;
}

// 50 records at income 4000 and 150 spread over [10000, 19800].
wcal::math::ConstraintMatrix two_group_matrix() {
    wcal::math::ConstraintMatrix A(2, 200);
    for (std::size_t i = 0; i < 200; ++i) {
        const double income = i < 50 ? 4000.0 : 10000.0 + static_cast<double>((i - 50) % 50) * 200.0;
        A(0, i) = income < 10000.0 ? 1.0 : 0.0;
        A(1, i) = income;
    }
    return A;
}

double worst_smoothed_error(const wcal::math::ConstraintMatrix& A,
                            const std::vector<double>& w,
                            const std::vector<double>& targets) {
    std::vector<double> est;
    A.multiply(w, est);
    double worst = 0.0;
    for (std::size_t j = 0; j < targets.size(); ++j) {
        worst = std::max(worst, std::abs(wcal::calib::smoothed_relative_error(est[j], targets[j])));
    }
    return worst;
}

} // namespace

TEST_CASE("Backend is chosen once at construction", "[gradient]") {
    wcal::calib::GradientConfig cfg;
    CHECK(std::string(wcal::calib::GradientCalibrator(cfg).backend().name()) == "adam");
    cfg.backend = wcal::calib::GradientBackendKind::Adam;
    CHECK(std::string(wcal::calib::GradientCalibrator(cfg).backend().name()) == "adam");
    cfg.backend = wcal::calib::GradientBackendKind::Lbfgs;
    CHECK(std::string(wcal::calib::GradientCalibrator(cfg).backend().name()) == "lbfgs");
}

TEST_CASE("Group normalization weighs one national target like many state targets", "[gradient]") {
    // Record 0 is in no state; records 1..3 are one state each.
    wcal::math::ConstraintMatrix A(4, 4);
    for (std::size_t i = 0; i < 4; ++i) A(0, i) = 1.0;
    for (std::size_t s = 1; s < 4; ++s) A(s, s) = 1.0;
    const std::vector<int> groups{0, 1, 1, 1};
    const std::vector<double> w(4, 1.0);

    // National off by 0.5, states exact.
    const wcal::calib::GradientObjective national_off(A, {7.0 / 3.0, 1.0, 1.0, 1.0}, groups);
    // National exact, every state off by 0.5.
    const wcal::calib::GradientObjective states_off(A, {4.0, 1.0 / 3.0, 1.0 / 3.0, 1.0 / 3.0}, groups);

    CHECK(national_off.group_count() == 2);
    CHECK(national_off.loss(w) == Approx(0.125));
    CHECK(states_off.loss(w) == Approx(0.125));
}

TEST_CASE("Group count ignores gaps in the id numbering", "[gradient]") {
    wcal::math::ConstraintMatrix A(2, 3);
    for (std::size_t i = 0; i < 3; ++i) {
        A(0, i) = 1.0;
        A(1, i) = 1.0;
    }
    const wcal::calib::GradientObjective objective(A, {3.0, 6.0}, {0, 2});
    CHECK(objective.group_count() == 2);
    // Two groups of one: loss = (0^2 + (3/7)^2) / 2
    CHECK(objective.loss({1.0, 1.0, 1.0}) == Approx(9.0 / 98.0));
}

TEST_CASE("Conflicting targets settle between them", "[gradient]") {
    // One record, two targets in one group that no weight can meet together.
    const auto A = [] {
        wcal::math::ConstraintMatrix m(2, 1);
        m(0, 0) = 1.0;
        m(1, 0) = 1.0;
        return m;
    }();
    const std::vector<double> targets{1.0, 1.18};

    wcal::calib::GradientConfig cfg;
    cfg.backend = wcal::calib::GradientBackendKind::Adam;
    const auto out = wcal::calib::GradientCalibrator(cfg).solve({1.0}, A, targets, {0, 0});
    REQUIRE(out.converged);
    CHECK(out.weights[0] > 1.0);
    CHECK(out.weights[0] < 1.18);
    CHECK(out.weights[0] == Approx(1.0823).margin(0.005));
    CHECK(out.objective > 0.0);
    // Smoothed errors stay under 5% although the first target is 8% off.
    CHECK(worst_smoothed_error(A, out.weights, targets) < 0.05);
    CHECK(std::abs(out.weights[0] - 1.0) > 0.05);
}

TEST_CASE("Analytic gradient matches finite differences", "[gradient]") {
    const auto A = two_group_matrix();
    const wcal::calib::GradientObjective objective(A, {60.0, 1e6}, {0, 1});

    std::vector<double> u(200);
    for (std::size_t i = 0; i < u.size(); ++i) {
        u[i] = 0.1 * std::sin(static_cast<double>(i));
    }
    std::vector<double> grad;
    objective.evaluate(u, grad);
    REQUIRE(grad.size() == 200);

    std::vector<double> scratch;
    for (std::size_t i : {0u, 49u, 50u, 123u, 199u}) {
        const double h = 1e-6;
        auto up = u;
        auto dn = u;
        up[i] += h;
        dn[i] -= h;
        const double fd = (objective.evaluate(up, scratch) - objective.evaluate(dn, scratch)) / (2.0 * h);
        CHECK(grad[i] == Approx(fd).epsilon(1e-4).margin(1e-10));
    }
}

TEST_CASE("Adam doubles uniform weights to hit a doubled total", "[gradient]") {
    const std::vector<double> w0(200, 1.0);
    const auto A = ones(200);
    const wcal::calib::GradientCalibrator calibrator;

    const auto out = calibrator.solve(w0, A, {400.0}, {0});
    REQUIRE(out.converged);
    CHECK(out.iterations == 500);
    for (double w : out.weights) {
        CHECK(w == Approx(2.0).margin(1e-6));
    }
    CHECK(out.objective < 1e-12);
}

TEST_CASE("Adam keeps weights when targets already hold", "[gradient]") {
    const std::vector<double> w0(200, 1.0);
    const auto out = wcal::calib::GradientCalibrator().solve(w0, ones(200), {200.0}, {0});
    for (double w : out.weights) {
        CHECK(w == Approx(1.0).margin(1e-6));
    }
}

TEST_CASE("Both backends fit overlapping grouped targets", "[gradient]") {
    const std::vector<double> w0(200, 1.0);
    const auto A = two_group_matrix();
    const std::vector<double> targets{60.0, 1e6};

    wcal::calib::GradientConfig cfg;
    const auto adam = wcal::calib::GradientCalibrator(cfg).solve(w0, A, targets, {0, 1});
    CHECK(worst_smoothed_error(A, adam.weights, targets) < 1e-6);
    CHECK(adam.weights[0] == Approx(1.2).margin(1e-4));

    cfg.backend = wcal::calib::GradientBackendKind::Lbfgs;
    const auto lbfgs = wcal::calib::GradientCalibrator(cfg).solve(w0, A, targets, {0, 1});
    REQUIRE(lbfgs.converged);
    CHECK(lbfgs.iterations < 100);
    CHECK(worst_smoothed_error(A, lbfgs.weights, targets) < 1e-6);
    for (double w : lbfgs.weights) {
        CHECK(w > 0.0);
    }
}

TEST_CASE("Gradient objective rejects undefined inputs", "[gradient]") {
    const auto A = ones(3);
    CHECK_THROWS_AS(wcal::calib::GradientObjective(A, {-1.0}, {0}), std::invalid_argument);
    CHECK_THROWS_AS(wcal::calib::GradientObjective(A, {3.0}, {0, 1}), std::invalid_argument);
    CHECK_THROWS_AS(wcal::calib::GradientObjective(A, {3.0}, {-1}), std::invalid_argument);
    CHECK_THROWS_AS(wcal::calib::GradientCalibrator().solve({1.0, 1.0}, A, {3.0}, {0}),
                    std::invalid_argument);
}
