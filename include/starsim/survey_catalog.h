#pragma once

#include "catalog.h"
#include "color_relations.h"
#include "config.h"
#include "survey_cache.h"
#include "survey_provider.h"
#include <optional>

namespace starsim {
namespace catalog {

/// Native epoch of UCAC4 positions
constexpr double SURVEY_EPOCH = 2000.0;

/**
 * Cone of a survey catalog
 */
struct SurveyQueryParams {
    double ra = 0.0;                     ///< Cone centre [degrees]
    double dec = 90.0;                   ///< Cone centre [degrees]
    double radius = 0.2;                 ///< Cone radius [degrees]
    std::optional<double> faint_limit;   ///< Drop stars fainter than this working magnitude
};

/**
 * Magnitudes of one star in the three survey bands
 */
struct BandMagnitudes {
    double primary;
    double alternate1;
    double alternate2;
};

/**
 * Fill missing bands from the others, in this order:
 *   primary    <- alternate2, then alternate1
 *   alternate1 <- alternate2, then primary
 *   alternate2 <- primary,    then alternate1
 * A band is only overwritten while it is non-finite, and only from a
 * finite source. A star ends with all bands non-finite only if it started
 * that way.
 */
void reconcileBands(BandMagnitudes& bands);

/**
 * Build a survey catalog over a cone
 *
 * A cached table for (provider catalog, ra, dec, radius) is loaded without
 * touching the provider. Otherwise the provider is queried exactly once and
 * the raw table is stored under the same key before it is used.
 *
 * Per star: bands are reconciled, temperature = relations.temperature(p - a1),
 * working magnitude = p - relations.magnitudeCorrection(p - a1), non-finite
 * proper motions become 0. Stars without a finite working magnitude (or
 * fainter than faint_limit) are dropped. The epoch is 2000.0.
 *
 * @throws CatalogException(SOURCE_UNAVAILABLE) if the query fails
 * @throws CatalogException(CACHE_ERROR) if the cache can't be read or written
 * @throws CatalogException(PARSE_ERROR) if the table lacks a required column
 */
Catalog loadSurveyCatalog(
    const SurveyQueryParams& params,
    SurveyProvider& provider,
    SurveyCache& cache,
    const ColorRelations& relations,
    const CatalogConfig& config
);

} // namespace catalog
} // namespace starsim
