#include <catch2/catch_all.hpp>
#include <cmath>
#include <string>

#include "libwcal/math/adam.hpp"
#include "libwcal/math/lbfgs.hpp"

using Catch::Approx;

namespace {

void quadratic(const std::vector<double>& theta, double& f, std::vector<double>& g) {
    const double x = theta[0];
    const double y = theta[1];
    f = 0.5 * ((x - 0.5) * (x - 0.5) + 4.0 * (y + 0.25) * (y + 0.25));
    g.assign(2, 0.0);
    g[0] = (x - 0.5);
    g[1] = 4.0 * (y + 0.25);
}

} // namespace

TEST_CASE("L-BFGS minimizes convex quadratic", "[lbfgs]") {
    wcal::math::LbfgsConfig cfg;
    cfg.ftol = 1e-14;
    cfg.gtol = 1e-10;

    const auto res = wcal::math::minimize_lbfgs({-1.5, 1.2}, {-2.0, -2.0}, {2.0, 2.0}, quadratic, cfg);
    REQUIRE(res.converged);
    REQUIRE(res.x.size() == 2);
    CHECK(res.x[0] == Approx(0.5).margin(1e-6));
    CHECK(res.x[1] == Approx(-0.25).margin(1e-6));
    CHECK(res.obj < 1e-12);
    CHECK(res.iters < 50);
}

TEST_CASE("L-BFGS stops on an active bound", "[lbfgs]") {
    wcal::math::LbfgsConfig cfg;
    cfg.ftol = 1e-14;
    cfg.gtol = 1e-10;

    const auto res = wcal::math::minimize_lbfgs({-1.5, 1.2}, {-2.0, 0.0}, {2.0, 2.0}, quadratic, cfg);
    REQUIRE(res.converged);
    CHECK(res.x[0] == Approx(0.5).margin(1e-6));
    CHECK(res.x[1] == Approx(0.0).margin(1e-12));
    CHECK(res.obj == Approx(0.125).margin(1e-9));
}

TEST_CASE("L-BFGS returns the start point when it is already stationary", "[lbfgs]") {
    const auto res = wcal::math::minimize_lbfgs({0.5, -0.25}, {}, {}, quadratic);
    CHECK(res.converged);
    CHECK(res.status == wcal::math::LbfgsStatus::GradientConverged);
    CHECK(res.iters == 0);
    CHECK(res.evaluations == 1);
}

TEST_CASE("L-BFGS reports an exhausted iteration budget", "[lbfgs]") {
    wcal::math::LbfgsConfig cfg;
    cfg.max_iter = 1;
    cfg.ftol = 0.0;
    cfg.gtol = 0.0;

    const auto res = wcal::math::minimize_lbfgs({-1.5, 1.2}, {}, {}, quadratic, cfg);
    CHECK_FALSE(res.converged);
    CHECK(res.status == wcal::math::LbfgsStatus::MaxIterations);
    CHECK(std::string(wcal::math::describe(res.status)) == "iteration limit reached");
}

TEST_CASE("L-BFGS rejects a missing or non-finite objective", "[lbfgs]") {
    CHECK_THROWS_AS(wcal::math::minimize_lbfgs({0.0}, {}, {}, wcal::math::ObjectiveGrad{}),
                    std::invalid_argument);
    auto nan_obj = [](const std::vector<double>&, double& f, std::vector<double>& g) {
        f = std::nan("");
        g.assign(1, 0.0);
    };
    CHECK_THROWS_AS(wcal::math::minimize_lbfgs({0.0}, {}, {}, nan_obj), std::invalid_argument);
}

TEST_CASE("Adam minimizes convex quadratic", "[adam]") {
    wcal::math::AdamConfig cfg;
    int calls = 0;
    int last_epoch = -1;
    const auto res = wcal::math::minimize_adam({-1.5, 1.2}, quadratic, cfg,
        [&](int epoch, double) { ++calls; last_epoch = epoch; });

    REQUIRE(res.finite);
    CHECK(res.epochs == 500);
    CHECK(res.x[0] == Approx(0.5).margin(1e-6));
    CHECK(res.x[1] == Approx(-0.25).margin(1e-6));
    // Epochs 0, 50, ..., 450 and the final one.
    CHECK(calls == 11);
    CHECK(last_epoch == 499);
}

TEST_CASE("Adam validates its budget", "[adam]") {
    wcal::math::AdamConfig cfg;
    cfg.epochs = 0;
    CHECK_THROWS_AS(wcal::math::minimize_adam({0.0}, quadratic, cfg), std::invalid_argument);
    cfg.epochs = 10;
    cfg.learning_rate = -1.0;
    CHECK_THROWS_AS(wcal::math::minimize_adam({0.0}, quadratic, cfg), std::invalid_argument);
}
