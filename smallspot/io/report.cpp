#include "report.h"
#include "constants.h"
#include <cmath>
#include <iomanip>
#include <sstream>

namespace smallspot {

namespace {

// Infinite values (zero exposure) read as "unlimited".
std::string sci(double value, int precision = 3) {
    if (std::isinf(value)) {
        return "unlimited";
    }
    std::ostringstream ss;
    ss << std::scientific << std::setprecision(precision) << value;
    return ss.str();
}

std::string general(double value, int precision = 3) {
    if (std::isinf(value)) {
        return "unlimited";
    }
    std::ostringstream ss;
    ss << std::setprecision(precision) << value;
    return ss.str();
}

std::string margin_text(double margin) {
    if (std::isinf(margin)) {
        return "unlimited (no exposure)";
    }
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(1) << margin;
    ss << (margin >= 1.0 ? " x below limit" : " x (EXCEEDS limit)");
    return ss.str();
}

void row(std::ostream& os, const char* label, const std::string& value) {
    os << std::left << std::setw(27) << label << value << "\n";
}

} // namespace

void print_report(std::ostream& os, const EvaluationResult& result) {
    const ExposureRequest& req = result.request;
    const HazardLimits& limits = result.limits;

    os << "\n=== ISO 15004-2:2025 Small-Spot Safety Evaluation ===\n";
    row(os, "Wavelength (nm):", general(req.wavelength_nm, 6));
    row(os, "Exposure time (s):", general(req.duration_s));
    row(os, "Power at pupil (W):", general(req.power_w));
    row(os, "Spot diameter (mm):", general(SPOT_DIAMETER_M * 1e3) + " (fixed small-spot)");

    os << "\n--- Spectral weighting ---\n";
    row(os, "R(lambda):", general(result.weighting.r, 4));
    row(os, "B(lambda):", general(result.weighting.b, 4));
    row(os, "R_eff:", general(result.effective.r_eff, 4));
    row(os, "B_eff:", general(result.effective.b_eff, 4));

    if (result.single_pulse) {
        const SinglePulseCheck& pulse = *result.single_pulse;
        os << "\n--- Single-pulse check ---\n";
        row(os, "Pulse energy (J):", sci(pulse.pulse_energy_j));
        row(os, "Weighted pulse (J):", sci(pulse.weighted_pulse_energy_j));
        row(os, "Limit (J):", sci(pulse.limit_j, 2));
        row(os, "Margin:", margin_text(pulse.margin));
    }

    os << "\n--- Thermal hazard ---\n";
    row(os, "Radiant exposure (J/m2):", sci(limits.thermal_exposure));
    row(os, "Thermal limit (J/m2):", sci(limits.thermal_limit));
    row(os, "Margin:", margin_text(result.thermal_margin));
    row(os, "Safe duration (s):", sci(result.thermal_safe_duration_s));

    os << "\n--- Photochemical hazard ---\n";
    row(os, "Radiant exposure (J/m2):", sci(limits.photochemical_exposure));
    row(os, "Limit (J/m2):", sci(limits.photochemical_limit));
    row(os, "Margin:", margin_text(result.photochemical_margin));
    row(os, "Safe duration (s):", sci(result.photochemical_safe_duration_s));

    os << "\n";
    row(os, "Governing hazard:", to_string(result.governing_hazard));
    row(os, "Margin:", margin_text(result.margin));
    row(os, "Safe exposure time (s):", sci(result.safe_duration_s));
    os << "=====================================================\n";
}

std::string format_report(const EvaluationResult& result) {
    std::ostringstream ss;
    print_report(ss, result);
    return ss.str();
}

} // namespace smallspot
