#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <spdlog/spdlog.h> // For spdlog::set_level
#include <spdlog/common.h> // For spdlog::level::level_enum and spdlog::to_string_view

#include "exposure_evaluator.h"
#include "hazard/hazard_limits.h"
#include "spectral/weighting_table.h"
#include "spectral/substitution.h"
#include "io/metric_parser.h"
#include "io/report.h"
#include "constants.h"
#include "errors.h"

namespace py = pybind11;
using namespace smallspot;

// C++ function to set spdlog level
void set_log_level(spdlog::level::level_enum level) {
    spdlog::set_level(level);
    spdlog::info("Global log level set to {}.", spdlog::to_string_view(level));
}


PYBIND11_MODULE(_core, m) {
    m.doc() = "smallspot - ISO 15004-2 small-spot retinal hazard evaluation";
    m.attr("__version__") = "0.1.0";

    // Bind spdlog::level::level_enum for Python control
    py::enum_<spdlog::level::level_enum>(m, "LogLevel", "Global logging levels for spdlog.")
        .value("TRACE", spdlog::level::trace)
        .value("DEBUG", spdlog::level::debug)
        .value("INFO", spdlog::level::info)
        .value("WARN", spdlog::level::warn)
        .value("ERROR", spdlog::level::err)
        .value("CRITICAL", spdlog::level::critical)
        .value("OFF", spdlog::level::off)
        .export_values();

    // Domain errors surface as smallspot.DomainError (a ValueError)
    py::register_exception<DomainError>(m, "DomainError", PyExc_ValueError);

    py::enum_<DomainErrorKind>(m, "DomainErrorKind")
        .value("InvalidWavelength", DomainErrorKind::InvalidWavelength)
        .value("InvalidDuration", DomainErrorKind::InvalidDuration)
        .value("InvalidPower", DomainErrorKind::InvalidPower)
        .value("NumericOverflow", DomainErrorKind::NumericOverflow)
        .value("InvalidPulseTrain", DomainErrorKind::InvalidPulseTrain);

    py::enum_<HazardType>(m, "HazardType")
        .value("Thermal", HazardType::Thermal)
        .value("Photochemical", HazardType::Photochemical);

    // Configuration
    py::class_<PulseTrain>(m, "PulseTrain")
        .def(py::init<>())
        .def_readwrite("repetition_rate_hz", &PulseTrain::repetition_rate_hz)
        .def_readwrite("pulse_duration_s", &PulseTrain::pulse_duration_s);

    py::class_<EvaluationConfig>(m, "EvaluationConfig")
        .def(py::init<>())
        .def_readwrite("evaluate_single_pulse", &EvaluationConfig::evaluate_single_pulse)
        .def_readwrite("pulse_train", &EvaluationConfig::pulse_train);

    // Records
    py::class_<ExposureRequest>(m, "ExposureRequest")
        .def(py::init<>())
        .def(py::init([](double wavelength_nm, double duration_s, double power_w) {
                 ExposureRequest request;
                 request.wavelength_nm = wavelength_nm;
                 request.duration_s = duration_s;
                 request.power_w = power_w;
                 return request;
             }),
             py::arg("wavelength_nm"), py::arg("duration_s"), py::arg("power_w"))
        .def_readwrite("wavelength_nm", &ExposureRequest::wavelength_nm)
        .def_readwrite("duration_s", &ExposureRequest::duration_s)
        .def_readwrite("power_w", &ExposureRequest::power_w);

    py::class_<WeightingKnot>(m, "WeightingKnot")
        .def_readonly("wavelength_nm", &WeightingKnot::wavelength_nm)
        .def_readonly("r", &WeightingKnot::r)
        .def_readonly("b", &WeightingKnot::b);

    py::class_<WeightingFactors>(m, "WeightingFactors")
        .def(py::init<>())
        .def_readonly("r", &WeightingFactors::r)
        .def_readonly("b", &WeightingFactors::b);

    py::class_<EffectiveWeighting>(m, "EffectiveWeighting")
        .def(py::init<>())
        .def_readonly("r_eff", &EffectiveWeighting::r_eff)
        .def_readonly("b_eff", &EffectiveWeighting::b_eff);

    py::class_<HazardLimits>(m, "HazardLimits")
        .def(py::init<>())
        .def_readonly("thermal_exposure", &HazardLimits::thermal_exposure)
        .def_readonly("thermal_limit", &HazardLimits::thermal_limit)
        .def_readonly("photochemical_exposure", &HazardLimits::photochemical_exposure)
        .def_readonly("photochemical_limit", &HazardLimits::photochemical_limit);

    py::class_<SinglePulseCheck>(m, "SinglePulseCheck")
        .def(py::init<>())
        .def_readonly("pulse_energy_j", &SinglePulseCheck::pulse_energy_j)
        .def_readonly("r_pulse", &SinglePulseCheck::r_pulse)
        .def_readonly("weighted_pulse_energy_j", &SinglePulseCheck::weighted_pulse_energy_j)
        .def_readonly("limit_j", &SinglePulseCheck::limit_j)
        .def_readonly("margin", &SinglePulseCheck::margin);

    py::class_<EvaluationResult>(m, "EvaluationResult")
        .def(py::init<>())
        .def_readonly("request", &EvaluationResult::request)
        .def_readonly("weighting", &EvaluationResult::weighting)
        .def_readonly("effective", &EvaluationResult::effective)
        .def_readonly("limits", &EvaluationResult::limits)
        .def_readonly("thermal_margin", &EvaluationResult::thermal_margin)
        .def_readonly("photochemical_margin", &EvaluationResult::photochemical_margin)
        .def_readonly("thermal_safe_duration_s", &EvaluationResult::thermal_safe_duration_s)
        .def_readonly("photochemical_safe_duration_s", &EvaluationResult::photochemical_safe_duration_s)
        .def_readonly("governing_hazard", &EvaluationResult::governing_hazard)
        .def_readonly("margin", &EvaluationResult::margin)
        .def_readonly("safe_duration_s", &EvaluationResult::safe_duration_s)
        .def_readonly("single_pulse", &EvaluationResult::single_pulse)
        .def("__str__", &format_report);

    // Evaluator
    py::class_<ExposureEvaluator>(m, "ExposureEvaluator")
        .def(py::init<>(), "Creates an evaluator with the default configuration.")
        .def(py::init<const EvaluationConfig&>(), py::arg("config"),
             "Creates an evaluator with the given configuration.")
        .def("evaluate",
             py::overload_cast<double, double, double>(&ExposureEvaluator::evaluate, py::const_),
             py::arg("wavelength_nm"), py::arg("duration_s"), py::arg("power_w"),
             "Evaluates one exposure. Raises DomainError for inputs outside the model domain.")
        .def("evaluate",
             py::overload_cast<const ExposureRequest&>(&ExposureEvaluator::evaluate, py::const_),
             py::arg("request"))
        .def_property_readonly("config", &ExposureEvaluator::config);

    // Lower-level functions
    m.def("weighting_table", &weighting_table, py::return_value_policy::reference,
          "Returns the ordered (wavelength, R, B) knot table.");
    m.def("weighting_at", &weighting_at, py::arg("wavelength_nm"),
          "Returns raw R and B at the given wavelength.");
    m.def("apply_time_substitution", &apply_time_substitution, py::arg("raw"), py::arg("duration_s"));
    m.def("thermal_safe_duration", &HazardCalculator::thermal_safe_duration,
          py::arg("raw_r"), py::arg("power_w"));
    m.def("photochemical_safe_duration", &HazardCalculator::photochemical_safe_duration,
          py::arg("b_eff"), py::arg("power_w"));

    // I/O helpers
    m.def("parse_metric_value", &parse_metric_value, py::arg("text"),
          "Parses strings like '5u' or '100 ms' into SI base units.");
    m.def("parse_wavelength_nm", &parse_wavelength_nm, py::arg("text"),
          "Parses a wavelength such as '450' or '450 nm'.");
    m.def("format_report", &format_report, py::arg("result"));

    // Bind the set_log_level function
    m.def("set_log_level", &set_log_level,
          py::arg("level"),
          "Sets the global logging level. Use LogLevel enum (e.g., smallspot.LogLevel.INFO).");

    // 常量
    m.attr("SPOT_DIAMETER_M") = SPOT_DIAMETER_M;
    m.attr("SPOT_AREA_M2") = SPOT_AREA_M2;
}
