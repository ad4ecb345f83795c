#include "metric_parser.h"
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <stdexcept>

namespace smallspot {

namespace {

const std::string kMicroSign = "\xC2\xB5";  // U+00B5 in UTF-8

std::string trim(const std::string& s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(begin, end - begin);
}

} // namespace

double metric_prefix_scale(char prefix) {
    switch (std::tolower(static_cast<unsigned char>(prefix))) {
        case 't': return 1e12;
        case 'g': return 1e9;
        case 'k': return 1e3;
        case 'm': return 1e-3;
        case 'u': return 1e-6;
        case 'n': return 1e-9;
        case 'p': return 1e-12;
        case 'f': return 1e-15;
        default:  return 0.0;
    }
}

double parse_metric_value(const std::string& text) {
    std::string value = trim(text);

    // Normalise the micro sign to 'u'
    for (size_t pos = value.find(kMicroSign); pos != std::string::npos; pos = value.find(kMicroSign, pos)) {
        value.replace(pos, kMicroSign.size(), "u");
    }

    if (value.empty()) {
        throw std::invalid_argument("Invalid value format: empty input");
    }

    const char* begin = value.c_str();
    char* end = nullptr;
    errno = 0;
    double number = std::strtod(begin, &end);
    if (end == begin || errno == ERANGE || !std::isfinite(number)) {
        throw std::invalid_argument("Invalid value format: " + text);
    }

    std::string suffix = trim(std::string(end));
    double scale = 1.0;

    if (!suffix.empty()) {
        char last = static_cast<char>(std::tolower(static_cast<unsigned char>(suffix.back())));
        // A two-character suffix is prefix + unit; a single 's' or 'w' is a bare unit.
        if (suffix.size() == 2 && (last == 's' || last == 'w')) {
            suffix.pop_back();
        } else if (suffix.size() == 1 && (last == 's' || last == 'w')) {
            suffix.clear();
        }

        if (suffix.size() == 1) {
            scale = metric_prefix_scale(suffix[0]);
            if (scale == 0.0) {
                throw std::invalid_argument("Unknown metric prefix '" + suffix + "' in: " + text);
            }
        } else if (!suffix.empty()) {
            throw std::invalid_argument("Invalid value format: " + text);
        }
    }

    return number * scale;
}

double parse_wavelength_nm(const std::string& text) {
    std::string value = trim(text);
    if (value.empty()) {
        throw std::invalid_argument("Invalid wavelength format: empty input");
    }

    const char* begin = value.c_str();
    char* end = nullptr;
    errno = 0;
    double number = std::strtod(begin, &end);
    if (end == begin || errno == ERANGE || !std::isfinite(number)) {
        throw std::invalid_argument("Invalid wavelength format: " + text);
    }

    std::string unit = trim(std::string(end));
    for (auto& c : unit) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (!unit.empty() && unit != "nm") {
        throw std::invalid_argument("Invalid wavelength format (expected nm): " + text);
    }
    return number;
}

} // namespace smallspot
