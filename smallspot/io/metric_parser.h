#pragma once

#include <string>

namespace smallspot {

/**
 * Parse a value with an optional SI prefix and unit letter into base units.
 *
 *   "5u" -> 5e-6, "100m" -> 0.1, "5 µW" -> 5e-6, "2.5e-3" -> 0.0025
 *
 * Prefixes (case-insensitive, so "M" is milli): T G k m u/µ n p f.
 * An optional trailing unit letter 'W' or 's' is accepted and ignored.
 *
 * @throws std::invalid_argument on malformed or non-finite input.
 */
double parse_metric_value(const std::string& text);

/**
 * Parse a wavelength in nanometres: a plain number with an optional "nm" unit
 * ("450", "450nm", "450 NM"). Metric prefixes are not accepted here.
 *
 * @throws std::invalid_argument on malformed or non-finite input.
 */
double parse_wavelength_nm(const std::string& text);

/**
 * Scale factor for a single prefix character; 0 if the character is not a prefix.
 */
double metric_prefix_scale(char prefix);

} // namespace smallspot
