#include "libwcal/calib/calibrator.hpp"
#include "libwcal/calib/constraints.hpp"
#include "libwcal/core/logging.hpp"
#include "libwcal/data/brackets.hpp"
#include "libwcal/io/config_yaml.hpp"
#include "libwcal/io/microdata_csv.hpp"
#include "libwcal/io/targets_yaml.hpp"

#include <iostream>
#include <string>
#include <vector>

namespace {

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " <microdata.csv> <targets.yaml> [config.yaml] [output.csv]\n";
}

void log_summary(const wcal::io::TargetAsset& asset,
                 const wcal::data::MicrodataTable& records,
                 const wcal::calib::CalibrationResult& result) {
    auto log = wcal::log::logger();

    log->info("{:<24} {:>16} {:>16} {:>9} {:>16} {:>9}",
              "constraint", "target", "before", "error", "after", "error");
    for (const auto& r : result.reports()) {
        log->info("{:<24} {:>16.0f} {:>16.0f} {:>+8.2f}% {:>16.0f} {:>+8.2f}%",
                  r.name, r.target, r.achieved_before, 100.0 * r.error_before,
                  r.achieved_after, 100.0 * r.error_after);
    }

    for (const auto& r : result.worst_offenders(5)) {
        log->info("Worst: {} ({:+.4f}%)", r.name, 100.0 * r.error_after);
    }

    log->info("Weighted records: {:.0f} before, {:.0f} after",
              result.original_total(), result.calibrated_total());
    for (const auto& t : asset.targets) {
        if (t.variable == "returns" && t.geography == "US" && t.bracket == "all") {
            log->info("Coverage of {} filers: {:.2f}% before, {:.2f}% after", t.name,
                      100.0 * result.original_total() / t.value,
                      100.0 * result.calibrated_total() / t.value);
        }
    }
    if (asset.has_brackets && records.has_numeric(asset.bracket_column)) {
        for (const auto& [label, count] :
             wcal::data::bracket_counts(asset.scheme, records.numeric(asset.bracket_column))) {
            log->debug("Bracket {:<14} {:>8} records", label, count);
        }
    }

    const auto stats = result.adjustment_stats();
    log->info("Adjustment factors: mean {:.4f}, std {:.4f}, min {:.4f}, max {:.4f}",
              stats.mean, stats.stddev, stats.min, stats.max);
    log->info("KL divergence: {:.6f}", result.kl_divergence());
    log->info("Result: {} ({})", result.success() ? "success" : "failure", result.message());
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 3 || argc > 5) {
        print_usage(argv[0]);
        return 2;
    }
    try {
        auto log = wcal::log::logger();
        wcal::io::RunConfig run;
        if (argc >= 4) {
            run = wcal::io::load_run_config(argv[3]);
        }
        wcal::log::set_level(run.log_level);
        const auto& cfg = run.calibration;

        const auto records = wcal::io::load_microdata_csv(argv[1]);
        const auto asset = wcal::io::load_target_asset(argv[2]);
        log->info("Loaded {} records and {} targets ({} {})",
                  records.size(), asset.targets.size(), asset.source, asset.period);

        std::vector<wcal::Constraint> constraints;
        if (cfg.method == wcal::calib::CalibrationMethod::Gradient) {
            wcal::calib::TargetMapping mapping;
            mapping.bracket_column = asset.bracket_column;
            mapping.scheme = asset.scheme;
            mapping.tolerance = cfg.tolerance;
            constraints = wcal::calib::build_target_constraints(records, asset.targets, mapping);
        } else {
            const auto targets = wcal::calib::bracket_targets_from(asset.targets, asset.scheme,
                                                                   asset.bracket_column);
            wcal::calib::BuilderConfig builder;
            builder.min_obs = run.min_obs;
            builder.tolerance = cfg.tolerance;
            constraints = wcal::calib::build_bracket_constraints(records, targets, builder);
        }
        log->info("Built {} constraints", constraints.size());

        const auto result = wcal::calib::calibrate(records, constraints, cfg);
        log_summary(asset, records, result);

        if (argc == 5) {
            wcal::io::save_microdata_csv(argv[4], records, result.calibrated_weights());
            log->info("Wrote calibrated microdata to {}", argv[4]);
        }
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Exception: " << e.what() << "\n";
        return 1;
    }
}
