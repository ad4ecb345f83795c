#include "errors.h"

namespace smallspot {

const char* to_string(DomainErrorKind kind) {
    switch (kind) {
        case DomainErrorKind::InvalidWavelength: return "InvalidWavelength";
        case DomainErrorKind::InvalidDuration:   return "InvalidDuration";
        case DomainErrorKind::InvalidPower:      return "InvalidPower";
        case DomainErrorKind::NumericOverflow:   return "NumericOverflow";
        case DomainErrorKind::InvalidPulseTrain: return "InvalidPulseTrain";
    }
    return "Unknown";
}

} // namespace smallspot
