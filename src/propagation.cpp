#include "starsim/propagation.h"
#include <cmath>

namespace starsim {
namespace catalog {

namespace {

// below this many stars the thread start-up costs more than the loop
constexpr long PARALLEL_THRESHOLD = 20000;

} // anonymous namespace

EquatorialCoordinates propagateOne(
    double ra0, double dec0, double pmra, double pmdec,
    double epoch0, double epoch_target) {

    constexpr double DEG_TO_RAD = M_PI / 180.0;

    double dt = epoch_target - epoch0;                  // years
    double dec_rate = pmdec / MAS_PER_DEGREE;           // degrees/year
    double dec = dec0 + dt * dec_rate;

    // un-project pmra at the declination halfway through the interval
    double mean_dec = dec0 + dt * dec_rate / 2.0;
    double ra_rate = pmra / MAS_PER_DEGREE / std::cos(mean_dec * DEG_TO_RAD);
    double ra = ra0 + dt * ra_rate;

    return EquatorialCoordinates(ra, dec);
}

SkyPositions propagate(
    const std::vector<double>& ra0,
    const std::vector<double>& dec0,
    const std::vector<double>& pmra,
    const std::vector<double>& pmdec,
    double epoch0,
    double epoch_target,
    bool parallel) {

    const size_t n = ra0.size();
    if (dec0.size() != n || pmra.size() != n || pmdec.size() != n) {
        throw CatalogException(ErrorCode::INVALID_PARAMS,
                               "propagate: position and proper motion arrays differ in length");
    }

    SkyPositions result;
    result.ra.resize(n);
    result.dec.resize(n);

    const long count = static_cast<long>(n);

    #pragma omp parallel for schedule(static) if(parallel && count > PARALLEL_THRESHOLD)
    for (long i = 0; i < count; ++i) {
        if (pmra[i] == 0.0 && pmdec[i] == 0.0) {
            result.ra[i] = ra0[i];
            result.dec[i] = dec0[i];
            continue;
        }
        EquatorialCoordinates pos = propagateOne(ra0[i], dec0[i], pmra[i], pmdec[i],
                                                 epoch0, epoch_target);
        result.ra[i] = pos.ra;
        result.dec[i] = pos.dec;
    }

    return result;
}

} // namespace catalog
} // namespace starsim
