#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "libwcal/calib/calibrator.hpp"
#include "libwcal/calib/constraints.hpp"
#include "libwcal/calib/diagnostics.hpp"
#include "libwcal/calib/entropy.hpp"
#include "libwcal/calib/gradient.hpp"
#include "libwcal/calib/raking.hpp"
#include "libwcal/core/logging.hpp"
#include "libwcal/core/types.hpp"
#include "libwcal/data/brackets.hpp"
#include "libwcal/data/microdata.hpp"
#include "libwcal/data/targets.hpp"
#include "libwcal/io/config_yaml.hpp"
#include "libwcal/io/microdata_csv.hpp"
#include "libwcal/io/targets_yaml.hpp"
#include "libwcal/math/constraint_matrix.hpp"

namespace py = pybind11;

PYBIND11_MODULE(wcalpy, m) {
    m.doc() = "Survey weight calibration to administrative totals";

    // --- Core types ---
    py::enum_<wcal::TargetType>(m, "TargetType")
        .value("Count",  wcal::TargetType::Count)
        .value("Amount", wcal::TargetType::Amount)
        .value("Rate",   wcal::TargetType::Rate);

    py::class_<wcal::Constraint>(m, "Constraint")
        .def(py::init<>())
        .def_readwrite("indicator",    &wcal::Constraint::indicator)
        .def_readwrite("target_value", &wcal::Constraint::target_value)
        .def_readwrite("variable",     &wcal::Constraint::variable)
        .def_readwrite("target_type",  &wcal::Constraint::target_type)
        .def_readwrite("tolerance",    &wcal::Constraint::tolerance)
        .def_readwrite("stratum",      &wcal::Constraint::stratum)
        .def_readwrite("group",        &wcal::Constraint::group);

    m.def("set_log_level", &wcal::log::set_level, "Set the libwcal logger level", py::arg("level"));

    // --- Data ---
    py::class_<wcal::data::Bracket>(m, "Bracket")
        .def(py::init<std::string, double, double>(), py::arg("label"), py::arg("low"), py::arg("high"))
        .def_readonly("label", &wcal::data::Bracket::label)
        .def_readonly("low",   &wcal::data::Bracket::low)
        .def_readonly("high",  &wcal::data::Bracket::high);

    py::class_<wcal::data::BracketScheme>(m, "BracketScheme")
        .def(py::init<std::string, std::vector<wcal::data::Bracket>>(),
            py::arg("zero_label"), py::arg("intervals"))
        .def("assign",     &wcal::data::BracketScheme::assign, py::arg("value"))
        .def("assign_all", &wcal::data::BracketScheme::assign_all, py::arg("values"))
        .def("labels",     &wcal::data::BracketScheme::labels)
        .def("contains",   &wcal::data::BracketScheme::contains, py::arg("label"))
        .def_property_readonly("zero_label", &wcal::data::BracketScheme::zero_label);

    m.def("irs_agi_brackets", &wcal::data::irs_agi_brackets, "IRS SOI AGI bracket scheme");
    m.def("bracket_counts", &wcal::data::bracket_counts, "Record count per bracket",
        py::arg("scheme"), py::arg("values"));

    py::class_<wcal::data::MicrodataTable>(m, "MicrodataTable")
        .def(py::init<std::vector<double>, std::string>(),
            py::arg("weights"), py::arg("weight_column") = "weight")
        .def("__len__", &wcal::data::MicrodataTable::size)
        .def_property_readonly("weights", &wcal::data::MicrodataTable::weights)
        .def("add_numeric",     &wcal::data::MicrodataTable::add_numeric, py::arg("name"), py::arg("values"))
        .def("add_categorical", &wcal::data::MicrodataTable::add_categorical, py::arg("name"), py::arg("values"))
        .def("numeric",         &wcal::data::MicrodataTable::numeric, py::arg("name"))
        .def("categorical",     &wcal::data::MicrodataTable::categorical, py::arg("name"))
        .def("column_order",    &wcal::data::MicrodataTable::column_order)
        .def("with_weights",    &wcal::data::MicrodataTable::with_weights, py::arg("weights"));

    py::class_<wcal::data::Target>(m, "Target")
        .def(py::init<>())
        .def_readwrite("name",      &wcal::data::Target::name)
        .def_readwrite("stratum",   &wcal::data::Target::stratum)
        .def_readwrite("variable",  &wcal::data::Target::variable)
        .def_readwrite("period",    &wcal::data::Target::period)
        .def_readwrite("value",     &wcal::data::Target::value)
        .def_readwrite("type",      &wcal::data::Target::type)
        .def_readwrite("source",    &wcal::data::Target::source)
        .def_readwrite("geography", &wcal::data::Target::geography)
        .def_readwrite("bracket",   &wcal::data::Target::bracket);

    py::class_<wcal::data::TargetTable>(m, "TargetTable")
        .def(py::init<>())
        .def(py::init<std::vector<wcal::data::Target>>(), py::arg("targets"))
        .def("add",            &wcal::data::TargetTable::add, py::arg("target"))
        .def("__len__",        &wcal::data::TargetTable::size)
        .def("targets",        &wcal::data::TargetTable::targets)
        .def("for_period",     &wcal::data::TargetTable::for_period, py::arg("period"))
        .def("from_source",    &wcal::data::TargetTable::from_source, py::arg("source"))
        .def("bracket_values", &wcal::data::TargetTable::bracket_values,
            py::arg("variable"), py::arg("geography") = "US");

    // --- Constraint builders ---
    py::class_<wcal::calib::BracketTargets>(m, "BracketTargets")
        .def(py::init<>())
        .def_readwrite("column",          &wcal::calib::BracketTargets::column)
        .def_readwrite("scheme",          &wcal::calib::BracketTargets::scheme)
        .def_readwrite("counts",          &wcal::calib::BracketTargets::counts)
        .def_readwrite("amounts",         &wcal::calib::BracketTargets::amounts)
        .def_readwrite("count_variable",  &wcal::calib::BracketTargets::count_variable)
        .def_readwrite("amount_variable", &wcal::calib::BracketTargets::amount_variable);

    py::class_<wcal::calib::BuilderConfig>(m, "BuilderConfig")
        .def(py::init<>())
        .def_readwrite("min_obs",   &wcal::calib::BuilderConfig::min_obs)
        .def_readwrite("tolerance", &wcal::calib::BuilderConfig::tolerance);

    py::class_<wcal::calib::TargetMapping>(m, "TargetMapping")
        .def(py::init<>())
        .def_readwrite("bracket_column",   &wcal::calib::TargetMapping::bracket_column)
        .def_readwrite("geography_column", &wcal::calib::TargetMapping::geography_column)
        .def_readwrite("scheme",           &wcal::calib::TargetMapping::scheme)
        .def_readwrite("amount_columns",   &wcal::calib::TargetMapping::amount_columns)
        .def_readwrite("tolerance",        &wcal::calib::TargetMapping::tolerance);

    m.def("build_bracket_constraints", &wcal::calib::build_bracket_constraints,
        "Count and amount constraints per bracket",
        py::arg("records"), py::arg("targets"), py::arg("cfg") = wcal::calib::BuilderConfig{});
    m.def("build_target_constraints", &wcal::calib::build_target_constraints,
        "One constraint per count/amount target",
        py::arg("records"), py::arg("targets"), py::arg("mapping") = wcal::calib::TargetMapping{});
    m.def("bracket_targets_from", &wcal::calib::bracket_targets_from,
        py::arg("targets"), py::arg("scheme"),
        py::arg("column") = "adjusted_gross_income",
        py::arg("count_variable") = "returns",
        py::arg("amount_variable") = "agi");

    // --- Configuration ---
    py::enum_<wcal::calib::CalibrationMethod>(m, "CalibrationMethod")
        .value("Entropy",  wcal::calib::CalibrationMethod::Entropy)
        .value("Raking",   wcal::calib::CalibrationMethod::Raking)
        .value("Gradient", wcal::calib::CalibrationMethod::Gradient);

    py::enum_<wcal::calib::GradientBackendKind>(m, "GradientBackend")
        .value("Auto",  wcal::calib::GradientBackendKind::Auto)
        .value("Adam",  wcal::calib::GradientBackendKind::Adam)
        .value("Lbfgs", wcal::calib::GradientBackendKind::Lbfgs);

    py::class_<wcal::calib::RatioBounds>(m, "RatioBounds")
        .def(py::init<>())
        .def_readwrite("min_ratio", &wcal::calib::RatioBounds::min_ratio)
        .def_readwrite("max_ratio", &wcal::calib::RatioBounds::max_ratio);

    py::class_<wcal::calib::EntropyConfig>(m, "EntropyConfig")
        .def(py::init<>())
        .def_readwrite("bounds",   &wcal::calib::EntropyConfig::bounds)
        .def_readwrite("max_iter", &wcal::calib::EntropyConfig::max_iter)
        .def_readwrite("ftol",     &wcal::calib::EntropyConfig::ftol)
        .def_readwrite("gtol",     &wcal::calib::EntropyConfig::gtol)
        .def_readwrite("log_clip", &wcal::calib::EntropyConfig::log_clip);

    py::class_<wcal::calib::RakingConfig>(m, "RakingConfig")
        .def(py::init<>())
        .def_readwrite("max_iter",       &wcal::calib::RakingConfig::max_iter)
        .def_readwrite("damping",        &wcal::calib::RakingConfig::damping)
        .def_readwrite("min_ratio",      &wcal::calib::RakingConfig::min_ratio)
        .def_readwrite("max_ratio",      &wcal::calib::RakingConfig::max_ratio)
        .def_readwrite("max_adjustment", &wcal::calib::RakingConfig::max_adjustment);

    py::class_<wcal::calib::GradientConfig>(m, "GradientConfig")
        .def(py::init<>())
        .def_readwrite("epochs",        &wcal::calib::GradientConfig::epochs)
        .def_readwrite("learning_rate", &wcal::calib::GradientConfig::learning_rate)
        .def_readwrite("backend",       &wcal::calib::GradientConfig::backend)
        .def_readwrite("lbfgs_ftol",    &wcal::calib::GradientConfig::lbfgs_ftol)
        .def_readwrite("lbfgs_gtol",    &wcal::calib::GradientConfig::lbfgs_gtol);

    py::class_<wcal::calib::CalibrationConfig>(m, "CalibrationConfig")
        .def(py::init<>())
        .def_readwrite("method",      &wcal::calib::CalibrationConfig::method)
        .def_readwrite("tolerance",   &wcal::calib::CalibrationConfig::tolerance)
        .def_readwrite("num_threads", &wcal::calib::CalibrationConfig::num_threads)
        .def_readwrite("entropy",     &wcal::calib::CalibrationConfig::entropy)
        .def_readwrite("raking",      &wcal::calib::CalibrationConfig::raking)
        .def_readwrite("gradient",    &wcal::calib::CalibrationConfig::gradient);

    // --- Results ---
    py::class_<wcal::calib::ConstraintReport>(m, "ConstraintReport")
        .def_readonly("name",             &wcal::calib::ConstraintReport::name)
        .def_readonly("stratum",          &wcal::calib::ConstraintReport::stratum)
        .def_readonly("group",            &wcal::calib::ConstraintReport::group)
        .def_readonly("target_type",      &wcal::calib::ConstraintReport::target_type)
        .def_readonly("target",           &wcal::calib::ConstraintReport::target)
        .def_readonly("achieved_before",  &wcal::calib::ConstraintReport::achieved_before)
        .def_readonly("achieved_after",   &wcal::calib::ConstraintReport::achieved_after)
        .def_readonly("error_before",     &wcal::calib::ConstraintReport::error_before)
        .def_readonly("error_after",      &wcal::calib::ConstraintReport::error_after)
        .def_readonly("tolerance",        &wcal::calib::ConstraintReport::tolerance)
        .def_readonly("within_tolerance", &wcal::calib::ConstraintReport::within_tolerance);

    py::class_<wcal::calib::SolverOutcome>(m, "SolverOutcome")
        .def_readonly("weights",    &wcal::calib::SolverOutcome::weights)
        .def_readonly("converged",  &wcal::calib::SolverOutcome::converged)
        .def_readonly("iterations", &wcal::calib::SolverOutcome::iterations)
        .def_readonly("objective",  &wcal::calib::SolverOutcome::objective)
        .def_readonly("message",    &wcal::calib::SolverOutcome::message);

    py::class_<wcal::calib::AdjustmentStats>(m, "AdjustmentStats")
        .def_readonly("mean",   &wcal::calib::AdjustmentStats::mean)
        .def_readonly("stddev", &wcal::calib::AdjustmentStats::stddev)
        .def_readonly("min",    &wcal::calib::AdjustmentStats::min)
        .def_readonly("max",    &wcal::calib::AdjustmentStats::max);

    py::class_<wcal::calib::CalibrationResult>(m, "CalibrationResult")
        .def_property_readonly("method",             &wcal::calib::CalibrationResult::method)
        .def_property_readonly("original_weights",   &wcal::calib::CalibrationResult::original_weights)
        .def_property_readonly("calibrated_weights", &wcal::calib::CalibrationResult::calibrated_weights)
        .def_property_readonly("reports",            &wcal::calib::CalibrationResult::reports)
        .def_property_readonly("success",            &wcal::calib::CalibrationResult::success)
        .def_property_readonly("message",            &wcal::calib::CalibrationResult::message)
        .def_property_readonly("kl_divergence",      &wcal::calib::CalibrationResult::kl_divergence)
        .def_property_readonly("loss",               &wcal::calib::CalibrationResult::loss)
        .def_property_readonly("iterations",         &wcal::calib::CalibrationResult::iterations)
        .def("max_abs_error",      &wcal::calib::CalibrationResult::max_abs_error)
        .def("adjustment_factors", &wcal::calib::CalibrationResult::adjustment_factors)
        .def("adjustment_stats",   &wcal::calib::CalibrationResult::adjustment_stats)
        .def("worst_offenders",    &wcal::calib::CalibrationResult::worst_offenders, py::arg("count") = 10);

    // --- Engines ---
    py::class_<wcal::math::ConstraintMatrix>(m, "ConstraintMatrix")
        .def_static("from_constraints", &wcal::math::ConstraintMatrix::from_constraints,
            py::arg("constraints"), py::arg("num_threads") = 1)
        .def_property_readonly("rows", &wcal::math::ConstraintMatrix::rows)
        .def_property_readonly("cols", &wcal::math::ConstraintMatrix::cols);

    m.def("solve_entropy", &wcal::calib::solve_entropy,
        "Minimum-KL calibration through the dual",
        py::arg("original_weights"), py::arg("A"), py::arg("targets"),
        py::arg("cfg") = wcal::calib::EntropyConfig{});

    m.def("solve_raking", &wcal::calib::solve_raking,
        "Damped iterative proportional fitting",
        py::arg("original_weights"), py::arg("A"), py::arg("targets"), py::arg("types"),
        py::arg("tolerance"), py::arg("cfg") = wcal::calib::RakingConfig{});

    m.def("solve_gradient",
        [](const std::vector<double>& w0, const wcal::math::ConstraintMatrix& A,
           const std::vector<double>& targets, const std::vector<int>& groups,
           const wcal::calib::GradientConfig& cfg) {
            return wcal::calib::GradientCalibrator(cfg).solve(w0, A, targets, groups);
        },
        "Grouped relative-error minimization over log-weights",
        py::arg("original_weights"), py::arg("A"), py::arg("targets"), py::arg("groups"),
        py::arg("cfg") = wcal::calib::GradientConfig{});

    m.def("calibrate",
        py::overload_cast<const wcal::data::MicrodataTable&,
                          const std::vector<wcal::Constraint>&,
                          const wcal::calib::CalibrationConfig&>(&wcal::calib::calibrate),
        "Calibrate a microdata table",
        py::arg("records"), py::arg("constraints"),
        py::arg("cfg") = wcal::calib::CalibrationConfig{});

    m.def("calibrate_weights",
        py::overload_cast<const std::vector<double>&,
                          const std::vector<wcal::Constraint>&,
                          const wcal::calib::CalibrationConfig&>(&wcal::calib::calibrate),
        "Calibrate a raw weight vector",
        py::arg("weights"), py::arg("constraints"),
        py::arg("cfg") = wcal::calib::CalibrationConfig{});

    m.def("kl_divergence", &wcal::calib::kl_divergence,
        py::arg("weights"), py::arg("original_weights"));

    // --- Loaders ---
    py::class_<wcal::io::TargetAsset>(m, "TargetAsset")
        .def_readonly("version",        &wcal::io::TargetAsset::version)
        .def_readonly("source",         &wcal::io::TargetAsset::source)
        .def_readonly("period",         &wcal::io::TargetAsset::period)
        .def_readonly("has_brackets",   &wcal::io::TargetAsset::has_brackets)
        .def_readonly("bracket_column", &wcal::io::TargetAsset::bracket_column)
        .def_readonly("scheme",         &wcal::io::TargetAsset::scheme)
        .def_readonly("targets",        &wcal::io::TargetAsset::targets);

    py::class_<wcal::io::RunConfig>(m, "RunConfig")
        .def_readonly("calibration", &wcal::io::RunConfig::calibration)
        .def_readonly("min_obs",     &wcal::io::RunConfig::min_obs)
        .def_readonly("log_level",   &wcal::io::RunConfig::log_level);

    m.def("load_microdata_csv", &wcal::io::load_microdata_csv,
        py::arg("path"), py::arg("weight_column") = "weight");
    m.def("save_microdata_csv", &wcal::io::save_microdata_csv,
        py::arg("path"), py::arg("records"), py::arg("calibrated"));
    m.def("load_target_asset", &wcal::io::load_target_asset, py::arg("path"));
    m.def("load_run_config", &wcal::io::load_run_config, py::arg("path"));
}
