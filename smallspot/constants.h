#pragma once

// 物理常量与 ISO 15004-2 小光斑限值常量
// Units: SI throughout (m, s, W, J) unless a name says otherwise.

namespace smallspot {

    constexpr double PI = 3.14159265358979323846;

    // --- Fixed small-spot geometry (immobilized eye) ---
    constexpr double SPOT_DIAMETER_M = 0.03e-3;
    constexpr double SPOT_RADIUS_M = SPOT_DIAMETER_M / 2.0;
    constexpr double SPOT_AREA_M2 = PI * SPOT_RADIUS_M * SPOT_RADIUS_M;  // ≈ 7.07e-10 m²

    // --- Valid spectral band ---
    constexpr double MIN_WAVELENGTH_NM = 400.0;
    constexpr double MAX_WAVELENGTH_NM = 500.0;

    // --- R(λ) substitution thresholds ---
    constexpr double ULTRASHORT_PULSE_S = 1e-11;
    constexpr double LONG_EXPOSURE_S = 10.0;

    // --- Thermal limit: 1.7 mJ · t^0.75 on the small spot ---
    constexpr double THERMAL_ENERGY_COEFF_J = 1.7e-3;
    constexpr double THERMAL_TIME_EXPONENT = 0.75;
    constexpr double THERMAL_RADIANT_EXPOSURE_COEFF = THERMAL_ENERGY_COEFF_J / SPOT_AREA_M2;  // J/m² per s^0.75

    // --- Photochemical (blue-light) dose limit: 2.2 J/cm², independent of duration ---
    constexpr double PHOTOCHEMICAL_DOSE_LIMIT = 2.2e4;       // J/m²

    // --- Single-pulse energy limit for pulsed sources ---
    constexpr double SINGLE_PULSE_LIMIT_J = 40e-9;

} // namespace smallspot
