#include "starsim/survey_catalog.h"
#include "starsim/logger.h"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace starsim {
namespace catalog {

void reconcileBands(BandMagnitudes& bands) {
    auto fill = [](double& target, double source) {
        if (!std::isfinite(target) && std::isfinite(source)) {
            target = source;
        }
    };

    fill(bands.primary, bands.alternate2);
    fill(bands.primary, bands.alternate1);

    fill(bands.alternate1, bands.alternate2);
    fill(bands.alternate1, bands.primary);

    fill(bands.alternate2, bands.primary);
    fill(bands.alternate2, bands.alternate1);
}

namespace {

SurveyTable fetchTable(const SurveyQueryParams& params,
                       SurveyProvider& provider,
                       SurveyCache& cache,
                       const Logger& logger) {
    const std::string& catalog = provider.definition().name;

    if (cache.contains(catalog, params.ra, params.dec, params.radius)) {
        std::string path = cache.pathFor(catalog, params.ra, params.dec, params.radius);
        logger.info("loading a catalog of stars from " + path);
        return cache.load(catalog, params.ra, params.dec, params.radius);
    }

    std::ostringstream msg;
    msg << "querying " << catalog << " for ra = " << params.ra << ", dec = " << params.dec
        << ", radius = " << params.radius;
    logger.info(msg.str());

    SurveyTable table;
    try {
        table = provider.queryCone(EquatorialCoordinates(params.ra, params.dec), params.radius);
        for (const auto& name : provider.definition().columns()) {
            if (!table.hasColumn(name)) {
                throw CatalogException(ErrorCode::PARSE_ERROR, "reply lacks column " + name);
            }
        }
    } catch (const CatalogException& e) {
        if (e.code() != ErrorCode::NETWORK_ERROR && e.code() != ErrorCode::PARSE_ERROR) {
            throw;
        }
        logger.error(std::string("query failed: ") + e.what());
        throw CatalogException(ErrorCode::SOURCE_UNAVAILABLE,
                               catalog + " query failed (" + errorCodeToString(e.code()) +
                               "): " + e.what());
    }

    cache.store(catalog, params.ra, params.dec, params.radius, table);
    return table;
}

} // anonymous namespace

Catalog loadSurveyCatalog(const SurveyQueryParams& params,
                          SurveyProvider& provider,
                          SurveyCache& cache,
                          const ColorRelations& relations,
                          const CatalogConfig& config) {
    if (!(params.radius > 0.0) || !isValidCoordinate(EquatorialCoordinates(params.ra, params.dec))) {
        throw CatalogException(ErrorCode::INVALID_PARAMS, "Invalid survey cone");
    }

    Logger logger(config, "Survey");
    const SurveyDefinition& def = provider.definition();

    SurveyTable table = fetchTable(params, provider, cache, logger);

    const auto& ra = table.column(def.ra_column);
    const auto& dec = table.column(def.dec_column);
    const auto& pmra = table.column(def.pmra_column);
    const auto& pmdec = table.column(def.pmdec_column);
    const auto& primary = table.column(def.primary_band);
    const auto& alternate1 = table.column(def.alternate1_band);
    const auto& alternate2 = table.column(def.alternate2_band);

    const size_t rows = table.rowCount();
    StarArrays stars;
    size_t dropped_unmeasured = 0;
    size_t dropped_faint = 0;
    size_t pm_defaulted = 0;
    double brightest = 0.0;
    double faintest = 0.0;

    for (size_t i = 0; i < rows; ++i) {
        BandMagnitudes bands{primary[i], alternate1[i], alternate2[i]};
        reconcileBands(bands);

        const double color = bands.primary - bands.alternate1;
        const double working = bands.primary - relations.magnitudeCorrection(color);

        if (!std::isfinite(working)) {
            dropped_unmeasured++;
            continue;
        }
        if (params.faint_limit && working > *params.faint_limit) {
            dropped_faint++;
            continue;
        }

        double star_pmra = pmra[i];
        double star_pmdec = pmdec[i];
        if (!std::isfinite(star_pmra) || !std::isfinite(star_pmdec)) {
            pm_defaulted++;
        }
        if (!std::isfinite(star_pmra)) star_pmra = 0.0;
        if (!std::isfinite(star_pmdec)) star_pmdec = 0.0;

        if (stars.size() == 0) {
            brightest = faintest = bands.primary;
        } else {
            brightest = std::min(brightest, bands.primary);
            faintest = std::max(faintest, bands.primary);
        }

        stars.ra.push_back(ra[i]);
        stars.dec.push_back(dec[i]);
        stars.pmra.push_back(star_pmra);
        stars.pmdec.push_back(star_pmdec);
        stars.tmag.push_back(working);
        stars.temperature.push_back(relations.temperature(color));
    }

    if (dropped_unmeasured > 0) {
        logger.info("dropped " + std::to_string(dropped_unmeasured) +
                    " stars with no usable magnitude in any band");
    }
    if (dropped_faint > 0) {
        std::ostringstream msg;
        msg << "dropped " << dropped_faint << " stars fainter than " << *params.faint_limit;
        logger.info(msg.str());
    }
    if (pm_defaulted > 0) {
        logger.debug(std::to_string(pm_defaulted) + " stars had no proper motion; set to 0");
    }

    std::ostringstream summary;
    summary << "found " << stars.size() << " stars";
    if (stars.size() > 0) {
        summary << " with " << brightest << " < V < " << faintest;
    }
    logger.info(summary.str());

    std::ostringstream name;
    name << def.name << "_" << params.ra << "_" << params.dec << "_" << params.radius;

    return Catalog(CatalogKind::SURVEY, name.str(), std::move(stars), SURVEY_EPOCH, config);
}

} // namespace catalog
} // namespace starsim
