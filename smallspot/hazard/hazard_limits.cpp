#include "hazard_limits.h"
#include "spectral/substitution.h"
#include "constants.h"
#include "errors.h"
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <cmath>
#include <limits>

namespace smallspot {

namespace {

constexpr double kInfinity = std::numeric_limits<double>::infinity();

void require_finite(double value, const char* name) {
    if (!std::isfinite(value)) {
        throw DomainError(DomainErrorKind::NumericOverflow,
            fmt::format("{} is not finite ({})", name, value));
    }
}

// One interval of constant R_eff in the thermal limit equation.
struct ThermalRegime {
    double r_eff;
    double begin_s;
    double end_s;
    bool closed;    // [begin, end] when true, (begin, end) otherwise

    bool contains(double t) const {
        return closed ? (t >= begin_s && t <= end_s) : (t > begin_s && t < end_s);
    }
};

} // namespace

double HazardCalculator::radiant_exposure(double power_w, double duration_s) {
    return power_w * duration_s / SPOT_AREA_M2;
}

double HazardCalculator::thermal_limit(double duration_s, double r_eff) {
    return THERMAL_RADIANT_EXPOSURE_COEFF * std::pow(duration_s, THERMAL_TIME_EXPONENT) / r_eff;
}

double HazardCalculator::photochemical_limit(double b_eff) {
    return PHOTOCHEMICAL_DOSE_LIMIT / b_eff;
}

HazardLimits HazardCalculator::calculate(const ExposureRequest& request, const EffectiveWeighting& effective) {
    HazardLimits limits;

    limits.thermal_exposure = radiant_exposure(request.power_w, request.duration_s);
    limits.thermal_limit = thermal_limit(request.duration_s, effective.r_eff);

    // Same radiant-exposure convention for both mechanisms.
    limits.photochemical_exposure = limits.thermal_exposure;
    limits.photochemical_limit = photochemical_limit(effective.b_eff);

    require_finite(limits.thermal_exposure, "thermal exposure");
    require_finite(limits.thermal_limit, "thermal limit");
    require_finite(limits.photochemical_exposure, "photochemical exposure");
    require_finite(limits.photochemical_limit, "photochemical limit");

    spdlog::debug("Thermal: H = {} J/m², limit = {} J/m²", limits.thermal_exposure, limits.thermal_limit);
    spdlog::debug("Photochemical: H = {} J/m², limit = {} J/m²",
                  limits.photochemical_exposure, limits.photochemical_limit);
    return limits;
}

double HazardCalculator::safety_margin(double limit, double exposure) {
    if (exposure <= 0.0) {
        return kInfinity;
    }
    return limit / exposure;
}

double HazardCalculator::thermal_safe_duration(double raw_r, double power_w) {
    if (power_w <= 0.0) {
        return kInfinity;
    }

    // R_eff is sampled inside each interval so the substitution rule stays the single source of truth.
    const ThermalRegime regimes[] = {
        {substitute_thermal_weight(raw_r, 0.5 * ULTRASHORT_PULSE_S), 0.0, ULTRASHORT_PULSE_S, false},
        {substitute_thermal_weight(raw_r, ULTRASHORT_PULSE_S), ULTRASHORT_PULSE_S, LONG_EXPOSURE_S, true},
        {substitute_thermal_weight(raw_r, 2.0 * LONG_EXPOSURE_S), LONG_EXPOSURE_S, kInfinity, false},
    };

    // P·t/A = K_T·t^a/R  =>  t = (K_T·A / (R·P))^(1/(1-a)), with K_T·A = 1.7 mJ.
    const double inverse_exponent = 1.0 / (1.0 - THERMAL_TIME_EXPONENT);

    for (const auto& regime : regimes) {
        if (regime.r_eff <= 0.0) {
            continue;  // no thermal weighting, limit unbounded in this interval
        }
        double t = std::pow(THERMAL_ENERGY_COEFF_J / (regime.r_eff * power_w), inverse_exponent);
        if (std::isinf(t)) {
            return kInfinity;  // later regimes have R_eff no larger, so their roots overflow too
        }
        if (regime.contains(t)) {
            return t;
        }
    }

    if (raw_r <= 0.0) {
        return kInfinity;
    }
    throw DomainError(DomainErrorKind::NumericOverflow,
        fmt::format("thermal limit equation has no solution for R = {}, P = {} W", raw_r, power_w));
}

double HazardCalculator::photochemical_safe_duration(double b_eff, double power_w) {
    if (power_w <= 0.0 || b_eff <= 0.0) {
        return kInfinity;
    }
    return PHOTOCHEMICAL_DOSE_LIMIT * SPOT_AREA_M2 / (b_eff * power_w);
}

SinglePulseCheck HazardCalculator::single_pulse_check(double raw_r, double power_w, const PulseTrain& pulse_train) {
    SinglePulseCheck check;
    check.pulse_energy_j = power_w / pulse_train.repetition_rate_hz;
    check.r_pulse = substitute_thermal_weight(raw_r, pulse_train.pulse_duration_s);
    check.weighted_pulse_energy_j = check.r_pulse * check.pulse_energy_j;
    check.limit_j = SINGLE_PULSE_LIMIT_J;
    check.margin = safety_margin(check.limit_j, check.weighted_pulse_energy_j);

    require_finite(check.pulse_energy_j, "pulse energy");
    return check;
}

} // namespace smallspot
