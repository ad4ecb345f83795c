#pragma once

#include "hazard/evaluation_result.h"

namespace smallspot {

// R(λ) time-dependent substitution:
//   t < 1e-11 s and R < 1  ->  R = 1
//   t > 10 s    and R > 1  ->  R = 1
// Both comparisons are strict. B(λ) is never substituted.
double substitute_thermal_weight(double r, double duration_s);

EffectiveWeighting apply_time_substitution(const WeightingFactors& raw, double duration_s);

} // namespace smallspot
