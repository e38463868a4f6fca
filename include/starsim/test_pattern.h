#pragma once

#include "catalog.h"
#include "config.h"
#include <cstdint>
#include <optional>

namespace starsim {
namespace catalog {

/**
 * Inputs of the synthetic grid catalog
 */
struct TestPatternParams {
    double size = 3000.0;            ///< Side of the square field [arcsec]
    double spacing = 200.0;          ///< Distance between grid cells [arcsec]
    double magnitude_min = 6.0;      ///< Brightest magnitude on the grid
    double magnitude_max = 16.0;     ///< Faintest magnitude on the grid
    double ra = 0.0;                 ///< Field centre [degrees]
    double dec = 0.0;                ///< Field centre [degrees]
    bool random = false;             ///< Uniform magnitudes and nudged positions
    double nudge = 21.1;             ///< Full width of the position nudge [arcsec]
    double pm = 0.0;                 ///< Std. dev. of random proper motions [mas/yr]
    std::optional<uint64_t> seed;    ///< Seed for random mode and proper motions
};

/// Reference epoch of every test pattern
constexpr double TEST_PATTERN_EPOCH = 2018.0;

/// Effective temperature given to every test pattern star [K]
constexpr double TEST_PATTERN_TEMPERATURE = 5800.0;

/**
 * Build a pixels x pixels grid of stars, pixels = max(floor(size/spacing), 1)
 *
 * Magnitudes run linearly between the two limits in reverse cell order;
 * positions form a regular mesh centred on (ra, dec) with RA offsets
 * stretched by 1/cos(dec).
 *
 * @throws CatalogException(INVALID_PARAMS) for non-positive size/spacing
 */
Catalog makeTestPattern(const TestPatternParams& params, const CatalogConfig& config);

/**
 * Name of a test pattern, e.g. "testpattern_6to16"
 */
std::string testPatternName(const TestPatternParams& params);

} // namespace catalog
} // namespace starsim
