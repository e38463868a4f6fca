#pragma once

#include "types.h"
#include <vector>

namespace starsim {
namespace catalog {

/**
 * Move positions from one epoch to another under linear proper motion
 *
 * Declination advances at pmdec. The RA rate is recovered from the
 * projected pmra by dividing by cos(dec) taken at the temporal midpoint of
 * the interval (dec0 + dt * decRate / 2). This approximates a full
 * great-circle propagation; it is not exact.
 *
 * @param ra0 Right Ascension at epoch0 [degrees]
 * @param dec0 Declination at epoch0 [degrees]
 * @param pmra Proper motion in RA * cos(dec) [mas/yr]
 * @param pmdec Proper motion in Dec [mas/yr]
 * @param epoch0 Epoch of ra0/dec0 [year]
 * @param epoch_target Requested epoch [year]
 * @param parallel Split the loop across OpenMP threads
 * @return Positions at epoch_target
 * @throws CatalogException(INVALID_PARAMS) if array lengths differ
 */
SkyPositions propagate(
    const std::vector<double>& ra0,
    const std::vector<double>& dec0,
    const std::vector<double>& pmra,
    const std::vector<double>& pmdec,
    double epoch0,
    double epoch_target,
    bool parallel = false
);

/**
 * Single-star form of propagate()
 */
EquatorialCoordinates propagateOne(
    double ra0, double dec0, double pmra, double pmdec,
    double epoch0, double epoch_target
);

} // namespace catalog
} // namespace starsim
