/**
 * Build a star catalog from a JSON request and print a snapshot summary
 *
 * Usage: starsim_catalog <request.json> [config.json] [projected.txt]
 */

#include "starsim/catalog_factory.h"
#include "starsim/color_relations.h"
#include "starsim/lightcurve.h"
#include "starsim/name_resolver.h"
#include "starsim/projected_writer.h"
#include "starsim/survey_cache.h"
#include "starsim/vizier_client.h"
#include <algorithm>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <numeric>
#include <sstream>

using namespace starsim::catalog;

namespace {

std::string readFile(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs) {
        throw CatalogException(ErrorCode::INVALID_PARAMS, "Cannot open " + path);
    }
    std::stringstream buffer;
    buffer << ifs.rdbuf();
    return buffer.str();
}

// TESS-like plate scale for the optional projected export [arcsec/pixel]
constexpr double PROJECTED_PIXEL_SCALE = 21.1;

} // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <request.json> [config.json] [projected.txt]" << std::endl;
        return 1;
    }

    try {
        CatalogConfig config;
        if (argc > 2) {
            config = CatalogConfig::fromJSON(readFile(argv[2]));
        }
        CatalogRequest request = CatalogRequest::fromJSON(readFile(argv[1]));

        VizierClient client(config);
        SurveyCache cache(config);
        auto resolver = makeNameResolver(config);
        TabulatedColorRelations relations;
        DefaultLightCurveFactory lightcurves;

        CatalogFactory factory(config, client, cache, *resolver, relations, lightcurves);
        Catalog catalog = factory.make(request);

        std::cout << "Catalog:      " << catalog.name() << " (" << kindToString(catalog.kind()) << ")" << std::endl;
        std::cout << "Stars:        " << catalog.size() << std::endl;
        std::cout << "Epoch:        " << std::fixed << std::setprecision(1) << catalog.epoch() << std::endl;

        if (catalog.empty()) {
            return 0;
        }

        auto codes = catalog.lightCurveCodes();
        size_t variable = static_cast<size_t>(std::count_if(codes.begin(), codes.end(),
            [](const std::string& code) { return code != "--"; }));
        std::cout << "Variable:     " << variable << std::endl;

        CatalogArrays now = catalog.snapshotAtEpoch(catalog.epoch());
        auto range = std::minmax_element(now.tmag.begin(), now.tmag.end());
        std::cout << "Magnitudes:   " << std::setprecision(2) << *range.first
                  << " to " << *range.second << std::endl;

        std::cout << "\nFirst stars at epoch " << std::setprecision(1) << catalog.epoch() << ":" << std::endl;
        for (size_t i = 0; i < std::min(catalog.size(), size_t(5)); i++) {
            std::cout << "  RA=" << std::setprecision(6) << now.ra[i]
                      << " Dec=" << now.dec[i]
                      << " Tmag=" << std::setprecision(3) << now.tmag[i]
                      << " Teff=" << std::setprecision(0) << now.temperature[i]
                      << " lc=" << codes[i] << std::endl;
        }

        if (argc > 3) {
            EquatorialCoordinates center(
                std::accumulate(now.ra.begin(), now.ra.end(), 0.0) / now.ra.size(),
                std::accumulate(now.dec.begin(), now.dec.end(), 0.0) / now.dec.size());
            GnomonicProjector projector(center, PROJECTED_PIXEL_SCALE);
            writeProjected(catalog, projector, epochToBjd(catalog.epoch()),
                           Catalog::DEFAULT_EXPTIME, argv[3]);
            std::cout << "\nProjected catalog written to " << argv[3] << std::endl;
        }

        return 0;

    } catch (const CatalogException& e) {
        std::cerr << "\n✗ CatalogException (" << errorCodeToString(e.code()) << "): "
                  << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "\n✗ Exception: " << e.what() << std::endl;
        return 1;
    }
}
