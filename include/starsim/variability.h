#pragma once

#include "lightcurve.h"
#include "logger.h"
#include <cstdint>
#include <optional>
#include <random>
#include <vector>

namespace starsim {
namespace catalog {

/**
 * Which stars vary and how
 */
struct VariabilityOptions {
    std::optional<double> magmax;        ///< Faintest eligible star; unset = max(tmag) + 1
    double fraction = 1.0;               ///< Share of eligible stars that vary [0, 1]
    std::optional<uint64_t> seed;        ///< Unset = seeded from std::random_device
    LightCurveParams params;             ///< Passed through to the factory
};

/**
 * Draw round(fraction * |eligible|) distinct indices among stars with
 * tmag <= magmax, uniformly and without replacement
 *
 * @return Selected star indices, in draw order
 */
std::vector<size_t> selectVariableStars(
    const std::vector<double>& tmag,
    double magmax,
    double fraction,
    std::mt19937_64& rng
);

/**
 * Build one light-curve handle per star: every star gets the factory's
 * constant handle, then the selected ones get an independent random handle
 *
 * @throws CatalogException(INVALID_PARAMS) if fraction is outside [0, 1]
 *         or magmax is NaN
 */
std::vector<LightCurvePtr> assignVariability(
    const std::vector<double>& tmag,
    const VariabilityOptions& options,
    const LightCurveFactory& factory,
    const Logger& logger
);

} // namespace catalog
} // namespace starsim
