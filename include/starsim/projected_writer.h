#pragma once

#include "catalog.h"
#include "types.h"
#include <string>
#include <vector>

namespace starsim {
namespace catalog {

/**
 * Detector coordinates of an ensemble, one entry per star [pixels]
 */
struct PixelPositions {
    std::vector<double> x;
    std::vector<double> y;
};

/**
 * SkyProjector - maps sky positions onto a detector
 */
class SkyProjector {
public:
    virtual ~SkyProjector() = default;

    /**
     * @return Pixel positions, NaN for stars the projection can't place
     */
    virtual PixelPositions project(const std::vector<double>& ra,
                                   const std::vector<double>& dec) const = 0;
};

/**
 * Tangent-plane (gnomonic) projection about a field centre
 *
 * x grows with the standard coordinate xi (east), y with eta (north).
 * Stars 90 degrees or more from the centre come back as NaN.
 */
class GnomonicProjector : public SkyProjector {
public:
    /**
     * @param center Tangent point [degrees]
     * @param pixel_scale Plate scale [arcsec/pixel]
     * @param reference_x Pixel column of the tangent point
     * @param reference_y Pixel row of the tangent point
     * @throws CatalogException(INVALID_PARAMS) for a non-positive scale
     */
    GnomonicProjector(const EquatorialCoordinates& center, double pixel_scale,
                      double reference_x = 0.0, double reference_y = 0.0);

    PixelPositions project(const std::vector<double>& ra,
                           const std::vector<double>& dec) const override;

private:
    EquatorialCoordinates center_;
    double pixel_scale_;
    double reference_x_;
    double reference_y_;
};

/**
 * Write a fixed-width text table with columns ra dec x y tmag lc
 *
 * Positions are the snapshot positions at bjd, (x, y) come from the
 * projector, tmag is the static magnitude and lc the light-curve code.
 *
 * @param exptime Exposure length [days]
 * @throws CatalogException(INVALID_PARAMS) if the file can't be written or
 *         the projector returns the wrong number of positions
 */
void writeProjected(const Catalog& catalog, const SkyProjector& projector,
                    double bjd, double exptime, const std::string& path);

} // namespace catalog
} // namespace starsim
