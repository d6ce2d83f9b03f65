#include "libwcal/calib/calibrator.hpp"
#include "libwcal/calib/constraints.hpp"
#include "libwcal/data/brackets.hpp"
#include "libwcal/data/microdata.hpp"

#include <cmath>
#include <iomanip>
#include <iostream>
#include <random>
#include <string>
#include <vector>

int main() {
    try {
        const std::size_t n = 5000;
        const auto scheme = wcal::data::irs_agi_brackets();

        // Synthetic filers: lognormal income, a share with no AGI, survey
        // weights around 30k.
        std::mt19937 gen(20211231u);
        std::lognormal_distribution<double> income(10.8, 1.0);
        std::uniform_real_distribution<double> uni(0.0, 1.0);
        std::vector<double> weights(n), agi(n);
        std::vector<std::string> states(n);
        const std::vector<std::string> fips = {"06", "36", "48"};
        for (std::size_t i = 0; i < n; ++i) {
            weights[i] = 30000.0 * (0.8 + 0.4 * uni(gen));
            agi[i] = uni(gen) < 0.08 ? 0.0 : income(gen);
            states[i] = fips[i % fips.size()];
        }
        wcal::data::MicrodataTable records(weights);
        records.add_numeric("adjusted_gross_income", agi);
        records.add_categorical("state_fips", states);

        // "True" weights tilt each bracket by a known factor; the targets are
        // the totals they imply.
        const auto labels = scheme.assign_all(agi);
        const auto all_labels = scheme.labels();
        wcal::calib::BracketTargets targets;
        for (std::size_t b = 0; b < all_labels.size(); ++b) {
            const double tilt = 1.0 + 0.25 * std::sin(static_cast<double>(b));
            double count = 0.0, amount = 0.0;
            for (std::size_t i = 0; i < n; ++i) {
                if (labels[i] == all_labels[b]) {
                    count += tilt * weights[i];
                    amount += tilt * weights[i] * agi[i];
                }
            }
            targets.counts[all_labels[b]] = count;
            targets.amounts[all_labels[b]] = amount;
        }

        wcal::calib::BuilderConfig builder;
        builder.min_obs = 30;
        const auto constraints = wcal::calib::build_bracket_constraints(records, targets, builder);
        std::cout << "Built " << constraints.size() << " constraints for " << n << " records\n\n";

        std::cout << std::fixed << std::setprecision(6);
        const wcal::calib::CalibrationMethod methods[] = {
            wcal::calib::CalibrationMethod::Entropy,
            wcal::calib::CalibrationMethod::Raking,
            wcal::calib::CalibrationMethod::Gradient
        };
        for (const auto method : methods) {
            wcal::calib::CalibrationConfig cfg;
            cfg.method = method;
            cfg.gradient.epochs = 300;
            const auto result = wcal::calib::calibrate(records, constraints, cfg);
            const auto stats = result.adjustment_stats();

            std::cout << wcal::calib::to_string(method) << ":\n"
                      << "  success      = " << (result.success() ? "yes" : "no") << "\n"
                      << "  message      = " << result.message() << "\n"
                      << "  iterations   = " << result.iterations() << "\n"
                      << "  max |error|  = " << result.max_abs_error() << "\n"
                      << "  KL           = " << result.kl_divergence() << "\n"
                      << "  adjustment   = mean " << stats.mean << ", range ["
                      << stats.min << ", " << stats.max << "]\n";
            for (const auto& r : result.worst_offenders(3)) {
                std::cout << "    " << std::setw(20) << std::left << r.name << std::right
                          << " error " << std::setw(10) << r.error_after << "\n";
            }
            std::cout << "\n";
        }
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Exception: " << e.what() << "\n";
        return 1;
    }
}
