#include "starsim/subset.h"

namespace starsim {
namespace catalog {

Catalog makeSubset(const Catalog& source, const std::vector<bool>& keep) {
    if (keep.size() != source.size()) {
        throw CatalogException(ErrorCode::INVALID_PARAMS,
                               "Subset mask has " + std::to_string(keep.size()) +
                               " entries for a catalog of " + std::to_string(source.size()) + " stars");
    }

    std::vector<size_t> indices;
    for (size_t i = 0; i < keep.size(); ++i) {
        if (keep[i]) indices.push_back(i);
    }
    return makeSubset(source, indices);
}

Catalog makeSubset(const Catalog& source, const std::vector<size_t>& indices) {
    StarArrays stars;
    std::vector<LightCurvePtr> lightcurves;

    stars.ra.reserve(indices.size());
    stars.dec.reserve(indices.size());
    stars.pmra.reserve(indices.size());
    stars.pmdec.reserve(indices.size());
    stars.tmag.reserve(indices.size());
    stars.temperature.reserve(indices.size());
    lightcurves.reserve(indices.size());

    for (size_t index : indices) {
        if (index >= source.size()) {
            throw CatalogException(ErrorCode::INVALID_PARAMS,
                                   "Subset index " + std::to_string(index) +
                                   " out of range for " + std::to_string(source.size()) + " stars");
        }
        stars.ra.push_back(source.ra()[index]);
        stars.dec.push_back(source.dec()[index]);
        stars.pmra.push_back(source.pmra()[index]);
        stars.pmdec.push_back(source.pmdec()[index]);
        stars.tmag.push_back(source.tmag()[index]);
        stars.temperature.push_back(source.temperature()[index]);
        lightcurves.push_back(source.lightcurves()[index]);
    }

    source.logger().debug("keeping " + std::to_string(indices.size()) + " of " +
                          std::to_string(source.size()) + " stars");

    return Catalog(CatalogKind::SUBSET, source.name() + "_subset", std::move(stars),
                   std::move(lightcurves), source.epoch(), source.config());
}

} // namespace catalog
} // namespace starsim
