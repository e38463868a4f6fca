#pragma once

#include <memory>
#include <random>
#include <string>
#include <vector>

namespace starsim {
namespace catalog {

/**
 * LightCurve - time-varying brightness bound to one star
 *
 * Handles are immutable once built, so catalogs (and subsets copied from
 * them) may share one instance between many stars.
 */
class LightCurve {
public:
    virtual ~LightCurve() = default;

    /**
     * Mean magnitude offset over an exposure
     *
     * @param bjd Start of the exposure [days]
     * @param duration Exposure length [days]
     * @return Offset to add to the static magnitude [mag]
     */
    virtual double integrated(double bjd, double duration) const = 0;

    /**
     * integrated() over many exposure start times
     */
    virtual std::vector<double> integrated(const std::vector<double>& bjd,
                                           double duration) const;

    /**
     * Stable text identifying the model and its parameters
     */
    virtual std::string code() const = 0;

    /**
     * True for the no-variability handle
     */
    virtual bool isConstant() const { return false; }
};

using LightCurvePtr = std::shared_ptr<const LightCurve>;

/**
 * No variability: every exposure integrates to exactly 0
 */
class ConstantLightCurve : public LightCurve {
public:
    using LightCurve::integrated;
    double integrated(double bjd, double duration) const override;
    std::string code() const override { return "--"; }
    bool isConstant() const override { return true; }
};

/**
 * Sinusoidal modulation
 */
class SinusoidLightCurve : public LightCurve {
public:
    SinusoidLightCurve(double period, double semiamplitude, double phase);

    using LightCurve::integrated;
    double integrated(double bjd, double duration) const override;
    std::string code() const override;

    double period() const { return period_; }
    double semiamplitude() const { return semiamplitude_; }

private:
    double instantaneous(double bjd) const;

    double period_;          ///< [days]
    double semiamplitude_;   ///< [mag]
    double phase_;           ///< [radians]
};

/**
 * Periodic trapezoidal dimming (transit or eclipse shaped)
 */
class TrapezoidLightCurve : public LightCurve {
public:
    TrapezoidLightCurve(double period, double t0, double duration,
                        double ingress, double depth);

    using LightCurve::integrated;
    double integrated(double bjd, double duration) const override;
    std::string code() const override;

private:
    double instantaneous(double bjd) const;

    double period_;          ///< [days]
    double t0_;              ///< Mid-event time [days]
    double duration_;        ///< Full event length [days]
    double ingress_;         ///< Ingress/egress length [days]
    double depth_;           ///< [mag]
};

/**
 * Parameters of random light-curve draws
 */
struct LightCurveParams {
    std::vector<std::string> options = {"trapezoid", "sin"};
    double fraction_extreme = 0.01;    ///< Share drawn from the extreme range
};

/**
 * LightCurveFactory - source of light-curve handles
 *
 * The random generator is owned by the caller so that a seeded call
 * reproduces the same light curves.
 */
class LightCurveFactory {
public:
    virtual ~LightCurveFactory() = default;

    virtual LightCurvePtr constant() const = 0;
    virtual LightCurvePtr random(const LightCurveParams& params,
                                 std::mt19937_64& rng) const = 0;
};

/**
 * Default factory: sinusoids and trapezoids with log-uniform periods and
 * amplitudes
 */
class DefaultLightCurveFactory : public LightCurveFactory {
public:
    DefaultLightCurveFactory();

    LightCurvePtr constant() const override;

    /**
     * @throws CatalogException(INVALID_PARAMS) on an empty or unknown option
     */
    LightCurvePtr random(const LightCurveParams& params,
                         std::mt19937_64& rng) const override;

private:
    LightCurvePtr constant_;
};

} // namespace catalog
} // namespace starsim
