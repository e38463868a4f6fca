#include "starsim/catalog.h"
#include "starsim/propagation.h"
#include <cmath>
#include <iomanip>
#include <sstream>

namespace starsim {
namespace catalog {

// =============================================================================
// Construction
// =============================================================================

Catalog::Catalog(CatalogKind kind, std::string name, StarArrays stars,
                 double epoch, const CatalogConfig& config)
    : kind_(kind), name_(std::move(name)), epoch_(epoch), config_(config),
      logger_(config, kindToString(kind)) {
    adopt(std::move(stars));
    lightcurves_.assign(ra_.size(), std::make_shared<ConstantLightCurve>());
}

Catalog::Catalog(CatalogKind kind, std::string name, StarArrays stars,
                 std::vector<LightCurvePtr> lightcurves,
                 double epoch, const CatalogConfig& config)
    : kind_(kind), name_(std::move(name)), epoch_(epoch), config_(config),
      logger_(config, kindToString(kind)) {
    adopt(std::move(stars));

    if (lightcurves.size() != ra_.size()) {
        throw CatalogException(ErrorCode::INVALID_PARAMS,
                               "Catalog " + name_ + ": " + std::to_string(lightcurves.size()) +
                               " light curves for " + std::to_string(ra_.size()) + " stars");
    }
    for (const auto& lc : lightcurves) {
        if (!lc) {
            throw CatalogException(ErrorCode::INVALID_PARAMS,
                                   "Catalog " + name_ + ": missing light curve handle");
        }
    }
    lightcurves_ = std::move(lightcurves);
}

void Catalog::adopt(StarArrays stars) {
    if (!stars.isConsistent()) {
        throw CatalogException(ErrorCode::INVALID_PARAMS,
                               "Catalog " + name_ + ": per-star arrays differ in length");
    }
    if (!std::isfinite(epoch_)) {
        throw CatalogException(ErrorCode::INVALID_PARAMS,
                               "Catalog " + name_ + ": epoch is not finite");
    }

    for (double m : stars.tmag) {
        if (!std::isfinite(m)) {
            throw CatalogException(ErrorCode::INVALID_PARAMS,
                                   "Catalog " + name_ + ": non-finite magnitude");
        }
    }

    size_t defaulted = 0;
    for (size_t i = 0; i < stars.size(); ++i) {
        if (!std::isfinite(stars.pmra[i])) {
            stars.pmra[i] = 0.0;
            ++defaulted;
        }
        if (!std::isfinite(stars.pmdec[i])) {
            stars.pmdec[i] = 0.0;
            ++defaulted;
        }
    }
    if (defaulted > 0) {
        logger_.debug(std::to_string(defaulted) + " non-finite proper motions set to 0");
    }

    ra_ = std::move(stars.ra);
    dec_ = std::move(stars.dec);
    pmra_ = std::move(stars.pmra);
    pmdec_ = std::move(stars.pmdec);
    tmag_ = std::move(stars.tmag);
    temperature_ = std::move(stars.temperature);
}

// =============================================================================
// Read paths
// =============================================================================

CatalogArrays Catalog::arrays() const {
    CatalogArrays result;
    result.ra = ra_;
    result.dec = dec_;
    result.tmag = tmag_;
    result.temperature = temperature_;
    return result;
}

SkyPositions Catalog::atEpoch(double epoch) const {
    double elapsed = epoch - epoch_;
    if (logger_.enabled(CatalogConfig::LogLevel::DEBUG)) {
        std::ostringstream msg;
        msg << "projecting catalog " << std::fixed << std::setprecision(3) << elapsed
            << " years relative to " << std::setprecision(0) << epoch_;
        logger_.debug(msg.str());
    }
    return propagate(ra_, dec_, pmra_, pmdec_, epoch_, epoch, config_.enable_parallel);
}

CatalogArrays Catalog::snapshot(std::optional<double> bjd,
                                std::optional<double> epoch,
                                double exptime) const {
    if (bjd.has_value() == epoch.has_value()) {
        throw CatalogException(ErrorCode::INVALID_PARAMS,
                               "snapshot needs exactly one of bjd or epoch");
    }

    double when_bjd = bjd ? *bjd : epochToBjd(*epoch);
    double when_epoch = epoch ? *epoch : bjdToEpoch(*bjd);

    SkyPositions positions = atEpoch(when_epoch);

    CatalogArrays result;
    result.ra = std::move(positions.ra);
    result.dec = std::move(positions.dec);
    result.tmag.resize(tmag_.size());
    result.temperature = temperature_;

    const long count = static_cast<long>(tmag_.size());

    #pragma omp parallel for schedule(static) if(config_.enable_parallel && count > 20000)
    for (long i = 0; i < count; ++i) {
        const LightCurvePtr& lc = lightcurves_[i];
        double moment = lc ? lc->integrated(when_bjd, exptime) : 0.0;
        result.tmag[i] = tmag_[i] + moment;
    }

    return result;
}

CatalogArrays Catalog::snapshotAtBjd(double bjd, double exptime) const {
    return snapshot(bjd, std::nullopt, exptime);
}

CatalogArrays Catalog::snapshotAtEpoch(double epoch, double exptime) const {
    return snapshot(std::nullopt, epoch, exptime);
}

// =============================================================================
// Variability
// =============================================================================

void Catalog::addLightCurves(const VariabilityOptions& options, const LightCurveFactory& factory) {
    lightcurves_ = assignVariability(tmag_, options, factory, logger_);
}

std::vector<std::string> Catalog::lightCurveCodes() const {
    std::vector<std::string> codes;
    codes.reserve(lightcurves_.size());
    for (const auto& lc : lightcurves_) {
        codes.push_back(lc ? lc->code() : "--");
    }
    return codes;
}

} // namespace catalog
} // namespace starsim
