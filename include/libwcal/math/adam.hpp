#pragma once

#include "libwcal/math/lbfgs.hpp"

#include <functional>
#include <vector>

namespace wcal::math {

struct AdamConfig {
    int epochs = 500;
    double learning_rate = 0.3;
    double beta1 = 0.9;
    double beta2 = 0.999;
    double eps = 1e-8;
    int log_every = 50;
};

struct AdamResult {
    std::vector<double> x;
    double obj;     // objective at the returned x
    int epochs;
    bool finite;
};

// Called every log_every epochs and on the last one with (epoch, objective).
using EpochCallback = std::function<void(int, double)>;

// Fixed-budget Adam over an objective with an analytic gradient.
AdamResult minimize_adam(const std::vector<double>& x0,
                         const ObjectiveGrad& f_grad,
                         const AdamConfig& cfg = {},
                         const EpochCallback& on_epoch = {});

} // namespace wcal::math
