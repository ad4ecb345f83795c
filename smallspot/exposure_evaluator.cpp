#include "exposure_evaluator.h"
#include "spectral/weighting_table.h"
#include "spectral/substitution.h"
#include "hazard/hazard_limits.h"
#include "constants.h"
#include "errors.h"
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <cmath>

namespace smallspot {

ExposureEvaluator::ExposureEvaluator(const EvaluationConfig& config) : config_(config) {
    if (!config_.evaluate_single_pulse) {
        return;
    }
    const PulseTrain& pulses = config_.pulse_train;
    if (!(pulses.repetition_rate_hz > 0.0) || !std::isfinite(pulses.repetition_rate_hz)) {
        throw DomainError(DomainErrorKind::InvalidPulseTrain,
            fmt::format("repetition rate must be positive, got {} Hz", pulses.repetition_rate_hz));
    }
    if (!(pulses.pulse_duration_s > 0.0) || !std::isfinite(pulses.pulse_duration_s)) {
        throw DomainError(DomainErrorKind::InvalidPulseTrain,
            fmt::format("pulse duration must be positive, got {} s", pulses.pulse_duration_s));
    }
}

void ExposureEvaluator::validate(const ExposureRequest& request) {
    if (!(request.wavelength_nm >= MIN_WAVELENGTH_NM && request.wavelength_nm <= MAX_WAVELENGTH_NM)) {
        throw DomainError(DomainErrorKind::InvalidWavelength,
            fmt::format("wavelength {} nm is outside [400, 500] nm", request.wavelength_nm));
    }
    if (!(request.duration_s > 0.0) || !std::isfinite(request.duration_s)) {
        throw DomainError(DomainErrorKind::InvalidDuration,
            fmt::format("exposure duration must be positive and finite, got {} s", request.duration_s));
    }
    if (!(request.power_w >= 0.0) || !std::isfinite(request.power_w)) {
        throw DomainError(DomainErrorKind::InvalidPower,
            fmt::format("power must be non-negative and finite, got {} W", request.power_w));
    }
}

EvaluationResult ExposureEvaluator::evaluate(double wavelength_nm, double duration_s, double power_w) const {
    ExposureRequest request;
    request.wavelength_nm = wavelength_nm;
    request.duration_s = duration_s;
    request.power_w = power_w;
    return evaluate(request);
}

EvaluationResult ExposureEvaluator::evaluate(const ExposureRequest& request) const {
    validate(request);

    spdlog::debug("Evaluating λ = {} nm, t = {} s, P = {} W",
                  request.wavelength_nm, request.duration_s, request.power_w);

    EvaluationResult result;
    result.request = request;

    // 1. Spectral weighting and time substitution
    result.weighting = weighting_at(request.wavelength_nm);
    result.effective = apply_time_substitution(result.weighting, request.duration_s);
    spdlog::debug("R = {}, B = {} (R_eff = {}, B_eff = {})",
                  result.weighting.r, result.weighting.b, result.effective.r_eff, result.effective.b_eff);

    // 2. Exposures and limits
    result.limits = HazardCalculator::calculate(request, result.effective);

    // 3. Margins and safe durations for both mechanisms
    result.thermal_margin = HazardCalculator::safety_margin(
        result.limits.thermal_limit, result.limits.thermal_exposure);
    result.photochemical_margin = HazardCalculator::safety_margin(
        result.limits.photochemical_limit, result.limits.photochemical_exposure);
    result.thermal_safe_duration_s = HazardCalculator::thermal_safe_duration(
        result.weighting.r, request.power_w);
    result.photochemical_safe_duration_s = HazardCalculator::photochemical_safe_duration(
        result.effective.b_eff, request.power_w);

    // 4. Governing hazard: the smaller margin, ties go to thermal
    if (result.thermal_margin <= result.photochemical_margin) {
        result.governing_hazard = HazardType::Thermal;
        result.margin = result.thermal_margin;
        result.safe_duration_s = result.thermal_safe_duration_s;
    } else {
        result.governing_hazard = HazardType::Photochemical;
        result.margin = result.photochemical_margin;
        result.safe_duration_s = result.photochemical_safe_duration_s;
    }

    if (config_.evaluate_single_pulse) {
        result.single_pulse = HazardCalculator::single_pulse_check(
            result.weighting.r, request.power_w, config_.pulse_train);
    }

    spdlog::debug("Governing hazard: {} (margin {}, safe duration {} s)",
                  to_string(result.governing_hazard), result.margin, result.safe_duration_s);
    return result;
}

} // namespace smallspot
