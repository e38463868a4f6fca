/**
 * Variable test pattern: build a grid, make the bright half variable,
 * cut out the brightest stars and follow them through one night
 */

#include "starsim/lightcurve.h"
#include "starsim/subset.h"
#include "starsim/test_pattern.h"
#include <iomanip>
#include <iostream>

using namespace starsim::catalog;

int main() {
    try {
        CatalogConfig config;
        config.log_level = CatalogConfig::LogLevel::INFO;

        TestPatternParams params;
        params.ra = 270.0;
        params.dec = 66.56;
        params.pm = 100.0;
        params.seed = 2018;

        Catalog grid = makeTestPattern(params, config);

        VariabilityOptions variability;
        variability.magmax = 11.0;
        variability.fraction = 0.5;
        variability.seed = 2018;
        DefaultLightCurveFactory factory;
        grid.addLightCurves(variability, factory);

        std::vector<bool> bright(grid.size());
        for (size_t i = 0; i < grid.size(); i++) {
            bright[i] = grid.tmag()[i] < 7.0;
        }
        Catalog subset = makeSubset(grid, bright);

        std::cout << "Grid: " << grid.size() << " stars, bright subset: "
                  << subset.size() << " stars" << std::endl;

        const double start = epochToBjd(2018.5);
        for (int hour = 0; hour <= 8; hour += 2) {
            CatalogArrays now = subset.snapshotAtBjd(start + hour / 24.0);
            std::cout << "+" << hour << "h";
            for (double m : now.tmag) {
                std::cout << " " << std::fixed << std::setprecision(4) << m;
            }
            std::cout << std::endl;
        }

        auto codes = subset.lightCurveCodes();
        for (size_t i = 0; i < codes.size(); i++) {
            std::cout << "  star " << i << ": " << codes[i] << std::endl;
        }

        return 0;

    } catch (const CatalogException& e) {
        std::cerr << "✗ CatalogException (" << errorCodeToString(e.code()) << "): "
                  << e.what() << std::endl;
        return 1;
    }
}
