#include "starsim/types.h"

namespace starsim {
namespace catalog {

// =============================================================================
// StarArrays Implementation
// =============================================================================

bool StarArrays::isConsistent() const {
    const size_t n = ra.size();
    return dec.size() == n && pmra.size() == n && pmdec.size() == n &&
           tmag.size() == n && temperature.size() == n;
}

// =============================================================================
// Utility Functions
// =============================================================================

std::string errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::SUCCESS:            return "SUCCESS";
        case ErrorCode::NETWORK_ERROR:      return "NETWORK_ERROR";
        case ErrorCode::PARSE_ERROR:        return "PARSE_ERROR";
        case ErrorCode::INVALID_PARAMS:     return "INVALID_PARAMS";
        case ErrorCode::CACHE_ERROR:        return "CACHE_ERROR";
        case ErrorCode::SOURCE_UNAVAILABLE: return "SOURCE_UNAVAILABLE";
        case ErrorCode::NAME_NOT_RESOLVED:  return "NAME_NOT_RESOLVED";
        default: return "UNKNOWN";
    }
}

std::string kindToString(CatalogKind kind) {
    switch (kind) {
        case CatalogKind::TEST_PATTERN: return "TestPattern";
        case CatalogKind::SURVEY:       return "Survey";
        case CatalogKind::SUBSET:       return "Subset";
        default: return "UNKNOWN";
    }
}

double bjdToEpoch(double bjd) {
    return (bjd - BJD_AT_EPOCH_2000) / DAYS_PER_YEAR + 2000.0;
}

double epochToBjd(double epoch) {
    return (epoch - 2000.0) * DAYS_PER_YEAR + BJD_AT_EPOCH_2000;
}

bool isValidCoordinate(const EquatorialCoordinates& coord) {
    return (coord.ra >= 0.0 && coord.ra < 360.0 &&
            coord.dec >= -90.0 && coord.dec <= 90.0);
}

} // namespace catalog
} // namespace starsim
