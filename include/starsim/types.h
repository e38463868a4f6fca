#pragma once

#include <cstdint>
#include <exception>
#include <string>
#include <vector>

namespace starsim {
namespace catalog {

/**
 * Barycentric time of the J2000.0 reference year used by every catalog
 */
constexpr double BJD_AT_EPOCH_2000 = 2451544.5;

/**
 * Days per Julian year
 */
constexpr double DAYS_PER_YEAR = 365.25;

/**
 * Milliarcseconds per degree
 */
constexpr double MAS_PER_DEGREE = 3600000.0;

/**
 * Which construction route produced a catalog
 */
enum class CatalogKind {
    TEST_PATTERN,   ///< Deterministic synthetic grid
    SURVEY,         ///< Cone query against an external survey
    SUBSET          ///< Selection copied out of another catalog
};

/**
 * Equatorial coordinates (ICRS)
 */
struct EquatorialCoordinates {
    double ra;                   ///< Right Ascension [degrees]
    double dec;                  ///< Declination [degrees]

    EquatorialCoordinates() : ra(0.0), dec(0.0) {}
    EquatorialCoordinates(double ra_, double dec_) : ra(ra_), dec(dec_) {}
};

/**
 * Sky positions of an ensemble, one entry per star
 */
struct SkyPositions {
    std::vector<double> ra;      ///< Right Ascension [degrees]
    std::vector<double> dec;     ///< Declination [degrees]
};

/**
 * Static per-star arrays a loader hands to a Catalog
 */
struct StarArrays {
    std::vector<double> ra;          ///< [degrees] at the catalog epoch
    std::vector<double> dec;         ///< [degrees] at the catalog epoch
    std::vector<double> pmra;        ///< Proper motion in RA * cos(dec) [mas/yr]
    std::vector<double> pmdec;       ///< Proper motion in Dec [mas/yr]
    std::vector<double> tmag;        ///< Static brightness [mag]
    std::vector<double> temperature; ///< Effective temperature [K]

    size_t size() const { return ra.size(); }
    bool isConsistent() const;
};

/**
 * Positions, brightness and temperature handed to imaging consumers
 */
struct CatalogArrays {
    std::vector<double> ra;
    std::vector<double> dec;
    std::vector<double> tmag;
    std::vector<double> temperature;
};

/**
 * Error types for exception handling
 */
enum class ErrorCode {
    SUCCESS = 0,
    NETWORK_ERROR,
    PARSE_ERROR,
    INVALID_PARAMS,
    CACHE_ERROR,
    SOURCE_UNAVAILABLE,
    NAME_NOT_RESOLVED
};

/**
 * Exception class for catalog errors
 */
class CatalogException : public std::exception {
public:
    CatalogException(ErrorCode code, const std::string& message)
        : code_(code), message_(message) {}

    const char* what() const noexcept override { return message_.c_str(); }
    ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
    std::string message_;
};

// =============================================================================
// Utility Functions
// =============================================================================

/**
 * Convert ErrorCode enum to string
 */
std::string errorCodeToString(ErrorCode code);

/**
 * Convert CatalogKind enum to string
 */
std::string kindToString(CatalogKind kind);

/**
 * Convert a barycentric time [days] to a decimal year
 */
double bjdToEpoch(double bjd);

/**
 * Convert a decimal year to a barycentric time [days]
 */
double epochToBjd(double epoch);

/**
 * Validate coordinate ranges
 */
bool isValidCoordinate(const EquatorialCoordinates& coord);

} // namespace catalog
} // namespace starsim
