#include "starsim/variability.h"
#include "starsim/types.h"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace starsim {
namespace catalog {

std::vector<size_t> selectVariableStars(
    const std::vector<double>& tmag,
    double magmax,
    double fraction,
    std::mt19937_64& rng) {

    std::vector<size_t> eligible;
    for (size_t i = 0; i < tmag.size(); ++i) {
        if (tmag[i] <= magmax) {
            eligible.push_back(i);
        }
    }

    size_t count = static_cast<size_t>(std::llround(fraction * eligible.size()));
    count = std::min(count, eligible.size());

    std::shuffle(eligible.begin(), eligible.end(), rng);
    eligible.resize(count);
    return eligible;
}

std::vector<LightCurvePtr> assignVariability(
    const std::vector<double>& tmag,
    const VariabilityOptions& options,
    const LightCurveFactory& factory,
    const Logger& logger) {

    if (!(options.fraction >= 0.0 && options.fraction <= 1.0)) {
        throw CatalogException(ErrorCode::INVALID_PARAMS,
                               "Variable fraction must lie in [0, 1]");
    }
    if (options.magmax && std::isnan(*options.magmax)) {
        throw CatalogException(ErrorCode::INVALID_PARAMS, "magmax is NaN");
    }

    // everything starts out constant
    std::vector<LightCurvePtr> lightcurves(tmag.size(), factory.constant());
    if (tmag.empty()) {
        return lightcurves;
    }

    double magmax = options.magmax
        ? *options.magmax
        : *std::max_element(tmag.begin(), tmag.end()) + 1.0;

    uint64_t seed = options.seed ? *options.seed
                                 : (static_cast<uint64_t>(std::random_device{}()) << 32) |
                                   std::random_device{}();
    std::mt19937_64 rng(seed);

    auto selected = selectVariableStars(tmag, magmax, options.fraction, rng);

    size_t eligible = std::count_if(tmag.begin(), tmag.end(),
                                    [magmax](double m) { return m <= magmax; });
    std::ostringstream msg;
    msg << eligible << " stars are brighter than " << magmax
        << "; populating " << std::fixed << std::setprecision(1)
        << options.fraction * 100.0 << "% of them with light curves";
    logger.info(msg.str());

    for (size_t index : selected) {
        lightcurves[index] = factory.random(options.params, rng);
    }

    logger.debug(std::to_string(selected.size()) + " light curves assigned (seed " +
                 std::to_string(seed) + ")");
    return lightcurves;
}

} // namespace catalog
} // namespace starsim
