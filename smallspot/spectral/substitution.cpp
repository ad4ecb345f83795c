#include "substitution.h"
#include "constants.h"
#include <spdlog/spdlog.h>

namespace smallspot {

double substitute_thermal_weight(double r, double duration_s) {
    if (duration_s < ULTRASHORT_PULSE_S && r < 1.0) {
        return 1.0;
    }
    if (duration_s > LONG_EXPOSURE_S && r > 1.0) {
        return 1.0;
    }
    return r;
}

EffectiveWeighting apply_time_substitution(const WeightingFactors& raw, double duration_s) {
    EffectiveWeighting effective;
    effective.r_eff = substitute_thermal_weight(raw.r, duration_s);
    effective.b_eff = raw.b;

    if (effective.r_eff != raw.r) {
        spdlog::debug("R substituted {} -> {} for t = {} s", raw.r, effective.r_eff, duration_s);
    }
    return effective;
}

} // namespace smallspot
