#pragma once

#include "config.h"
#include "lightcurve.h"
#include "logger.h"
#include "types.h"
#include "variability.h"
#include <optional>
#include <string>
#include <vector>

namespace starsim {
namespace catalog {

/**
 * Catalog - an ensemble of stars held as parallel per-star arrays
 *
 * Every construction route (test pattern, survey query, subset) ends in
 * this one class; the route is recorded in kind(). All arrays share one
 * length, proper motions are finite (non-finite inputs become 0) and
 * magnitudes are finite. The reference epoch never changes after
 * construction.
 *
 * Example usage:
 * @code
 *   Catalog cat = makeTestPattern(TestPatternParams(), config);
 *   DefaultLightCurveFactory factory;
 *   VariabilityOptions variability;
 *   variability.seed = 0;
 *   cat.addLightCurves(variability, factory);
 *   auto now = cat.snapshotAtBjd(2458354.5);
 * @endcode
 */
class Catalog {
public:
    /// Default exposure for snapshots: half an hour [days]
    static constexpr double DEFAULT_EXPTIME = 0.5 / 24.0;

    /**
     * @param kind Construction route
     * @param name Human-readable catalog name
     * @param stars Static arrays valid at epoch
     * @param epoch Reference year of the positions
     * @param config Logging and parallelism settings
     * @throws CatalogException(INVALID_PARAMS) on mismatched arrays,
     *         non-finite magnitudes or a non-finite epoch
     */
    Catalog(CatalogKind kind, std::string name, StarArrays stars,
            double epoch, const CatalogConfig& config);

    /**
     * As above, with light curves already bound (one per star)
     */
    Catalog(CatalogKind kind, std::string name, StarArrays stars,
            std::vector<LightCurvePtr> lightcurves,
            double epoch, const CatalogConfig& config);

    /**
     * Static positions, magnitudes and temperatures at the catalog epoch
     */
    CatalogArrays arrays() const;

    /**
     * Positions propagated to the requested epoch [year]
     */
    SkyPositions atEpoch(double epoch) const;

    /**
     * Positions, brightness and temperature during one exposure
     *
     * Exactly one of bjd/epoch must be given; the other follows from
     * epoch = (bjd - 2451544.5)/365.25 + 2000. Brightness is the static
     * magnitude plus each light curve integrated over [bjd, bjd + exptime].
     *
     * @param exptime Exposure length [days]
     * @throws CatalogException(INVALID_PARAMS) unless exactly one of
     *         bjd/epoch is set
     */
    CatalogArrays snapshot(std::optional<double> bjd,
                           std::optional<double> epoch,
                           double exptime = DEFAULT_EXPTIME) const;

    CatalogArrays snapshotAtBjd(double bjd, double exptime = DEFAULT_EXPTIME) const;
    CatalogArrays snapshotAtEpoch(double epoch, double exptime = DEFAULT_EXPTIME) const;

    /**
     * Replace every light curve: constant for all, then random ones for a
     * seeded selection of the stars with tmag <= magmax
     */
    void addLightCurves(const VariabilityOptions& options, const LightCurveFactory& factory);

    /**
     * Light-curve code of every star
     */
    std::vector<std::string> lightCurveCodes() const;

    size_t size() const { return ra_.size(); }
    bool empty() const { return ra_.empty(); }
    double epoch() const { return epoch_; }
    CatalogKind kind() const { return kind_; }
    const std::string& name() const { return name_; }

    const std::vector<double>& ra() const { return ra_; }
    const std::vector<double>& dec() const { return dec_; }
    const std::vector<double>& pmra() const { return pmra_; }
    const std::vector<double>& pmdec() const { return pmdec_; }
    const std::vector<double>& tmag() const { return tmag_; }
    const std::vector<double>& temperature() const { return temperature_; }
    const std::vector<LightCurvePtr>& lightcurves() const { return lightcurves_; }

    const CatalogConfig& config() const { return config_; }
    const Logger& logger() const { return logger_; }

private:
    void adopt(StarArrays stars);

    CatalogKind kind_;
    std::string name_;
    double epoch_;
    CatalogConfig config_;
    Logger logger_;

    std::vector<double> ra_;
    std::vector<double> dec_;
    std::vector<double> pmra_;
    std::vector<double> pmdec_;
    std::vector<double> tmag_;
    std::vector<double> temperature_;
    std::vector<LightCurvePtr> lightcurves_;
};

} // namespace catalog
} // namespace starsim
