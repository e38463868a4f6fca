#pragma once

#include "survey_table.h"
#include "types.h"
#include <string>
#include <vector>

namespace starsim {
namespace catalog {

/**
 * Names of the survey table and of the columns a survey catalog reads
 */
struct SurveyDefinition {
    std::string name;            ///< Catalog identity, part of the cache key
    std::string table;           ///< Remote table name
    std::string ra_column;       ///< [degrees]
    std::string dec_column;      ///< [degrees]
    std::string pmra_column;     ///< [mas/yr], already multiplied by cos(dec)
    std::string pmdec_column;    ///< [mas/yr]
    std::string primary_band;    ///< Magnitude the working band is derived from
    std::string alternate1_band; ///< Colour partner of the primary band
    std::string alternate2_band; ///< Extra fallback band

    /**
     * All columns, in query order
     */
    std::vector<std::string> columns() const;

    /**
     * UCAC4 on VizieR (I/322A): f.mag primary, Jmag and Vmag fallbacks
     */
    static SurveyDefinition ucac4();
};

/**
 * SurveyProvider - source of raw cone-search tables
 */
class SurveyProvider {
public:
    virtual ~SurveyProvider() = default;

    /**
     * All entries within radius of center
     *
     * @param center Cone centre (ICRS) [degrees]
     * @param radius Cone radius [degrees]
     * @return Table holding definition().columns()
     * @throws CatalogException(NETWORK_ERROR / PARSE_ERROR) on failure
     */
    virtual SurveyTable queryCone(const EquatorialCoordinates& center, double radius) = 0;

    virtual const SurveyDefinition& definition() const = 0;
};

} // namespace catalog
} // namespace starsim
