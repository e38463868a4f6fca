#pragma once

#include "catalog.h"
#include "color_relations.h"
#include "config.h"
#include "lightcurve.h"
#include "name_resolver.h"
#include "survey_cache.h"
#include "survey_catalog.h"
#include "survey_provider.h"
#include "test_pattern.h"
#include "variability.h"
#include <string>

namespace starsim {
namespace catalog {

/**
 * Everything needed to choose and build one catalog
 */
struct CatalogRequest {
    std::string name = "testpattern";    ///< "testpattern", "ucac4" or an object name
    TestPatternParams test_pattern;
    SurveyQueryParams survey;
    bool stars_are_variable = false;     ///< Assign light curves after loading
    VariabilityOptions variability;

    /**
     * @brief Parse a flat JSON request
     * @throws CatalogException(INVALID_PARAMS) on malformed values
     *
     * Example:
     * {
     *   "name": "WASP-12",
     *   "radius": 0.3,
     *   "faint_limit": 14,
     *   "stars_are_variable": true,
     *   "fraction": 0.5,
     *   "options": ["sin", "trapezoid"],
     *   "seed": 42
     * }
     *
     * "magnitudes": [min, max] is accepted in place of the two
     * magnitude_min/magnitude_max keys. "seed" seeds both the test pattern
     * and the variability draw.
     */
    static CatalogRequest fromJSON(const std::string& json_request);
};

/**
 * Construction route picked from a request name
 */
enum class CatalogSource {
    TEST_PATTERN,   ///< "testpattern"
    SURVEY_CONE,    ///< "ucac4": cone at the request's (ra, dec)
    NAMED_TARGET    ///< Anything else: resolve the name, then survey cone there
};

/**
 * Case-insensitive route for a catalog name
 */
CatalogSource sourceForName(const std::string& name);

/**
 * CatalogFactory - one-shot dispatch from a request to a finished catalog
 *
 * Collaborators are borrowed and must outlive the factory.
 *
 * Example usage:
 * @code
 *   VizierClient client(config);
 *   SurveyCache cache(config);
 *   auto resolver = makeNameResolver(config);
 *   TabulatedColorRelations relations;
 *   DefaultLightCurveFactory lightcurves;
 *
 *   CatalogFactory factory(config, client, cache, *resolver, relations, lightcurves);
 *   Catalog cat = factory.make(CatalogRequest::fromJSON(text));
 * @endcode
 */
class CatalogFactory {
public:
    CatalogFactory(const CatalogConfig& config,
                   SurveyProvider& provider,
                   SurveyCache& cache,
                   NameResolver& resolver,
                   const ColorRelations& relations,
                   const LightCurveFactory& lightcurves);

    /**
     * @throws CatalogException as raised by the chosen route
     *         (INVALID_PARAMS, SOURCE_UNAVAILABLE, CACHE_ERROR, NAME_NOT_RESOLVED)
     */
    Catalog make(const CatalogRequest& request) const;

private:
    CatalogConfig config_;
    SurveyProvider& provider_;
    SurveyCache& cache_;
    NameResolver& resolver_;
    const ColorRelations& relations_;
    const LightCurveFactory& lightcurves_;
    Logger logger_;
};

} // namespace catalog
} // namespace starsim
