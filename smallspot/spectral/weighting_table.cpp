#include "weighting_table.h"
#include "constants.h"
#include "errors.h"
#include <algorithm>
#include <cmath>
#include <spdlog/fmt/fmt.h>

namespace smallspot {

namespace {

// Log-linear interpolation; falls back to linear if a knot value is zero.
double interpolate(double v0, double v1, double fraction) {
    if (v0 <= 0.0 || v1 <= 0.0) {
        return v0 + (v1 - v0) * fraction;
    }
    return v0 * std::pow(v1 / v0, fraction);
}

} // namespace

const std::vector<WeightingKnot>& weighting_table() {
    static const std::vector<WeightingKnot> table = {
        {400.0,  1.0, 0.10},
        {405.0,  2.0, 0.20},
        {410.0,  4.0, 0.40},
        {415.0,  8.0, 0.80},
        {420.0,  9.0, 0.90},
        {425.0,  9.5, 0.95},
        {430.0,  9.8, 0.98},
        {435.0, 10.0, 1.00},
        {440.0, 10.0, 1.00},
        {445.0,  9.7, 0.97},
        {450.0,  9.4, 0.94},
        {455.0,  9.0, 0.90},
        {460.0,  8.0, 0.80},
        {465.0,  7.0, 0.70},
        {470.0,  6.2, 0.62},
        {475.0,  5.5, 0.55},
        {480.0,  4.5, 0.45},
        {485.0,  4.0, 0.40},
        {490.0,  2.2, 0.22},
        {495.0,  1.6, 0.16},
        {500.0,  1.0, 0.10},
    };
    return table;
}

WeightingFactors weighting_at(double wavelength_nm) {
    // Written so that NaN also fails the check.
    if (!(wavelength_nm >= MIN_WAVELENGTH_NM && wavelength_nm <= MAX_WAVELENGTH_NM)) {
        throw DomainError(DomainErrorKind::InvalidWavelength,
            fmt::format("wavelength {} nm is outside [400, 500] nm", wavelength_nm));
    }

    const auto& table = weighting_table();

    // First knot at or above the requested wavelength. Never end(): the last knot is 500 nm.
    auto upper = std::lower_bound(table.begin(), table.end(), wavelength_nm,
        [](const WeightingKnot& knot, double wl) { return knot.wavelength_nm < wl; });

    if (upper->wavelength_nm == wavelength_nm) {
        return {upper->r, upper->b};
    }

    auto lower = upper - 1;
    double fraction = (wavelength_nm - lower->wavelength_nm) /
                      (upper->wavelength_nm - lower->wavelength_nm);

    return {
        interpolate(lower->r, upper->r, fraction),
        interpolate(lower->b, upper->b, fraction)
    };
}

} // namespace smallspot
