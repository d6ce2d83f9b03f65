#include "libwcal/math/adam.hpp"

#include <cmath>
#include <stdexcept>

namespace wcal::math {

AdamResult minimize_adam(const std::vector<double>& x0,
                         const ObjectiveGrad& f_grad,
                         const AdamConfig& cfg,
                         const EpochCallback& on_epoch) {
    if (!f_grad) {
        throw std::invalid_argument("minimize_adam: objective is not set");
    }
    if (cfg.epochs <= 0 || !(cfg.learning_rate > 0.0)) {
        throw std::invalid_argument("minimize_adam: epochs and learning_rate must be positive");
    }

    const std::size_t n = x0.size();
    std::vector<double> x = x0;
    std::vector<double> m(n, 0.0);
    std::vector<double> v(n, 0.0);
    std::vector<double> g(n, 0.0);
    double f = 0.0;

    double b1t = 1.0;
    double b2t = 1.0;
    for (int epoch = 0; epoch < cfg.epochs; ++epoch) {
        f_grad(x, f, g);
        if (!std::isfinite(f)) {
            return { x, f, epoch, false };
        }
        if (on_epoch && cfg.log_every > 0 &&
            (epoch % cfg.log_every == 0 || epoch == cfg.epochs - 1)) {
            on_epoch(epoch, f);
        }

        b1t *= cfg.beta1;
        b2t *= cfg.beta2;
        for (std::size_t i = 0; i < n; ++i) {
            m[i] = cfg.beta1 * m[i] + (1.0 - cfg.beta1) * g[i];
            v[i] = cfg.beta2 * v[i] + (1.0 - cfg.beta2) * g[i] * g[i];
            const double m_hat = m[i] / (1.0 - b1t);
            const double v_hat = v[i] / (1.0 - b2t);
            x[i] -= cfg.learning_rate * m_hat / (std::sqrt(v_hat) + cfg.eps);
        }
    }

    f_grad(x, f, g);
    return { x, f, cfg.epochs, std::isfinite(f) };
}

} // namespace wcal::math
