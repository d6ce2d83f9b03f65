#include "libwcal/math/lbfgs.hpp"

#include <algorithm>
#include <cmath>
#include <deque>
#include <limits>
#include <stdexcept>

namespace wcal::math {

namespace {

constexpr double ARMIJO_C1 = 1e-4;
constexpr double CURVATURE_EPS = 1e-10;

double dot(const std::vector<double>& a, const std::vector<double>& b) {
    double s = 0.0;
    for (std::size_t i = 0; i < a.size(); ++i) s += a[i] * b[i];
    return s;
}

double norm2(const std::vector<double>& v) {
    return std::sqrt(dot(v, v));
}

struct Box {
    const std::vector<double>& lb;
    const std::vector<double>& ub;

    double lo(std::size_t i) const {
        return i < lb.size() ? lb[i] : -std::numeric_limits<double>::infinity();
    }
    double hi(std::size_t i) const {
        return i < ub.size() ? ub[i] : std::numeric_limits<double>::infinity();
    }
    void project(std::vector<double>& v) const {
        for (std::size_t i = 0; i < v.size(); ++i) {
            v[i] = std::min(hi(i), std::max(lo(i), v[i]));
        }
    }
    // inf-norm of P(x - g) - x
    double projected_grad_norm(const std::vector<double>& x, const std::vector<double>& g) const {
        double m = 0.0;
        for (std::size_t i = 0; i < x.size(); ++i) {
            const double p = std::min(hi(i), std::max(lo(i), x[i] - g[i]));
            m = std::max(m, std::abs(p - x[i]));
        }
        return m;
    }
};

// Two-loop recursion: returns -H g.
std::vector<double> search_direction(const std::vector<double>& g,
                                     const std::deque<std::vector<double>>& S,
                                     const std::deque<std::vector<double>>& Y) {
    std::vector<double> q = g;
    std::vector<double> alpha(S.size(), 0.0);
    std::vector<double> rho(S.size(), 0.0);
    for (std::size_t k = S.size(); k-- > 0;) {
        rho[k] = 1.0 / dot(Y[k], S[k]);
        alpha[k] = rho[k] * dot(S[k], q);
        for (std::size_t i = 0; i < q.size(); ++i) q[i] -= alpha[k] * Y[k][i];
    }

    double gamma;
    if (!S.empty()) {
        gamma = dot(S.back(), Y.back()) / dot(Y.back(), Y.back());
    } else {
        const double gn = norm2(g);
        gamma = (gn > 0.0) ? 1.0 / gn : 1.0;
    }
    for (double& v : q) v *= gamma;

    for (std::size_t k = 0; k < S.size(); ++k) {
        const double beta = rho[k] * dot(Y[k], q);
        for (std::size_t i = 0; i < q.size(); ++i) q[i] += S[k][i] * (alpha[k] - beta);
    }
    for (double& v : q) v = -v;
    return q;
}

} // namespace

const char* describe(LbfgsStatus status) {
    switch (status) {
        case LbfgsStatus::GradientConverged:  return "projected gradient below gtol";
        case LbfgsStatus::ObjectiveConverged: return "relative objective decrease below ftol";
        case LbfgsStatus::MaxIterations:      return "iteration limit reached";
        case LbfgsStatus::LineSearchFailed:   return "line search failed to decrease the objective";
    }
    return "unknown";
}

LbfgsResult minimize_lbfgs(const std::vector<double>& x0,
                           const std::vector<double>& lb,
                           const std::vector<double>& ub,
                           const ObjectiveGrad& f_grad,
                           const LbfgsConfig& cfg) {
    if (!f_grad) {
        throw std::invalid_argument("minimize_lbfgs: objective is not set");
    }
    const std::size_t n = x0.size();
    const Box box{lb, ub};
    const std::size_t history = static_cast<std::size_t>(std::max(1, cfg.history));

    std::vector<double> x = x0;
    box.project(x);
    std::vector<double> g(n, 0.0);
    double f = 0.0;
    f_grad(x, f, g);
    int evals = 1;
    if (!std::isfinite(f)) {
        throw std::invalid_argument("minimize_lbfgs: objective is not finite at the start point");
    }

    double pg = box.projected_grad_norm(x, g);
    if (pg <= cfg.gtol) {
        return { x, f, 0, evals, pg, LbfgsStatus::GradientConverged, true };
    }

    std::deque<std::vector<double>> S;
    std::deque<std::vector<double>> Y;
    std::vector<double> x_new(n), g_new(n), s(n), y(n);

    for (int it = 1; it <= cfg.max_iter; ++it) {
        std::vector<double> d = search_direction(g, S, Y);

        // Freeze coordinates sitting on a bound the step would cross.
        for (std::size_t i = 0; i < n; ++i) {
            if ((x[i] <= box.lo(i) && d[i] < 0.0) || (x[i] >= box.hi(i) && d[i] > 0.0)) {
                d[i] = 0.0;
            }
        }
        if (dot(g, d) >= 0.0) {
            // Not a descent direction: drop curvature memory, restart from steepest descent.
            S.clear();
            Y.clear();
            d = search_direction(g, S, Y);
        }

        double alpha = 1.0;
        double f_new = 0.0;
        bool accepted = false;
        for (int ls = 0; ls < cfg.max_linesearch; ++ls) {
            for (std::size_t i = 0; i < n; ++i) x_new[i] = x[i] + alpha * d[i];
            box.project(x_new);
            f_grad(x_new, f_new, g_new);
            ++evals;

            double decrease = 0.0;
            for (std::size_t i = 0; i < n; ++i) decrease += g[i] * (x_new[i] - x[i]);
            if (std::isfinite(f_new) && f_new <= f + ARMIJO_C1 * decrease) {
                accepted = true;
                break;
            }
            alpha *= 0.5;
        }
        if (!accepted) {
            return { x, f, it, evals, pg, LbfgsStatus::LineSearchFailed, false };
        }

        for (std::size_t i = 0; i < n; ++i) {
            s[i] = x_new[i] - x[i];
            y[i] = g_new[i] - g[i];
        }
        const double sy = dot(s, y);
        if (sy > CURVATURE_EPS * dot(y, y)) {
            S.push_back(s);
            Y.push_back(y);
            if (S.size() > history) {
                S.pop_front();
                Y.pop_front();
            }
        }

        const double f_old = f;
        x.swap(x_new);
        g.swap(g_new);
        f = f_new;
        pg = box.projected_grad_norm(x, g);

        const double scale = std::max({std::abs(f_old), std::abs(f), 1.0});
        if (f_old - f <= cfg.ftol * scale) {
            return { x, f, it, evals, pg, LbfgsStatus::ObjectiveConverged, true };
        }
        if (pg <= cfg.gtol) {
            return { x, f, it, evals, pg, LbfgsStatus::GradientConverged, true };
        }
    }

    return { x, f, cfg.max_iter, evals, pg, LbfgsStatus::MaxIterations, false };
}

} // namespace wcal::math
