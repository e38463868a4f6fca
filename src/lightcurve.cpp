#include "starsim/lightcurve.h"
#include "starsim/types.h"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace starsim {
namespace catalog {

namespace {

// sub-steps used to average a model over an exposure
constexpr int INTEGRATION_STEPS = 10;

template<typename Model>
double averageOver(const Model& instantaneous, double bjd, double duration) {
    if (duration <= 0.0) {
        return instantaneous(bjd);
    }
    double sum = 0.0;
    double step = duration / INTEGRATION_STEPS;
    for (int i = 0; i < INTEGRATION_STEPS; ++i) {
        sum += instantaneous(bjd + (i + 0.5) * step);
    }
    return sum / INTEGRATION_STEPS;
}

double logUniform(std::mt19937_64& rng, double low, double high) {
    std::uniform_real_distribution<double> dist(std::log(low), std::log(high));
    return std::exp(dist(rng));
}

} // anonymous namespace

// =============================================================================
// LightCurve
// =============================================================================

std::vector<double> LightCurve::integrated(const std::vector<double>& bjd,
                                           double duration) const {
    std::vector<double> result;
    result.reserve(bjd.size());
    for (double t : bjd) {
        result.push_back(integrated(t, duration));
    }
    return result;
}

double ConstantLightCurve::integrated(double /*bjd*/, double /*duration*/) const {
    return 0.0;
}

// =============================================================================
// SinusoidLightCurve
// =============================================================================

SinusoidLightCurve::SinusoidLightCurve(double period, double semiamplitude, double phase)
    : period_(period), semiamplitude_(semiamplitude), phase_(phase) {
    if (!(period_ > 0.0)) {
        throw CatalogException(ErrorCode::INVALID_PARAMS, "Sinusoid period must be positive");
    }
}

double SinusoidLightCurve::instantaneous(double bjd) const {
    return semiamplitude_ * std::sin(2.0 * M_PI * bjd / period_ + phase_);
}

double SinusoidLightCurve::integrated(double bjd, double duration) const {
    return averageOver([this](double t) { return instantaneous(t); }, bjd, duration);
}

std::string SinusoidLightCurve::code() const {
    std::ostringstream ss;
    ss << std::setprecision(6);
    ss << "sin|p=" << period_ << "|a=" << semiamplitude_ << "|phi=" << phase_;
    return ss.str();
}

// =============================================================================
// TrapezoidLightCurve
// =============================================================================

TrapezoidLightCurve::TrapezoidLightCurve(double period, double t0, double duration,
                                         double ingress, double depth)
    : period_(period), t0_(t0), duration_(duration), ingress_(ingress), depth_(depth) {
    if (!(period_ > 0.0) || !(duration_ > 0.0) || duration_ > period_) {
        throw CatalogException(ErrorCode::INVALID_PARAMS,
                               "Trapezoid needs 0 < duration <= period");
    }
    if (!(ingress_ > 0.0) || ingress_ > duration_ / 2.0) {
        throw CatalogException(ErrorCode::INVALID_PARAMS,
                               "Trapezoid needs 0 < ingress <= duration/2");
    }
}

double TrapezoidLightCurve::instantaneous(double bjd) const {
    // time from the nearest event centre
    double x = std::fmod(bjd - t0_, period_);
    if (x < 0.0) x += period_;
    if (x > period_ / 2.0) x -= period_;
    x = std::abs(x);

    double half = duration_ / 2.0;
    if (x >= half) return 0.0;
    if (x <= half - ingress_) return depth_;
    return depth_ * (half - x) / ingress_;
}

double TrapezoidLightCurve::integrated(double bjd, double duration) const {
    return averageOver([this](double t) { return instantaneous(t); }, bjd, duration);
}

std::string TrapezoidLightCurve::code() const {
    std::ostringstream ss;
    ss << std::setprecision(6);
    ss << "trapezoid|p=" << period_ << "|t0=" << t0_ << "|dur=" << duration_
       << "|in=" << ingress_ << "|d=" << depth_;
    return ss.str();
}

// =============================================================================
// DefaultLightCurveFactory
// =============================================================================

DefaultLightCurveFactory::DefaultLightCurveFactory()
    : constant_(std::make_shared<ConstantLightCurve>()) {}

LightCurvePtr DefaultLightCurveFactory::constant() const {
    return constant_;
}

LightCurvePtr DefaultLightCurveFactory::random(const LightCurveParams& params,
                                               std::mt19937_64& rng) const {
    if (params.options.empty()) {
        throw CatalogException(ErrorCode::INVALID_PARAMS, "No light curve options given");
    }

    std::uniform_int_distribution<size_t> pick(0, params.options.size() - 1);
    const std::string& option = params.options[pick(rng)];

    std::uniform_real_distribution<double> unit(0.0, 1.0);
    bool extreme = unit(rng) < params.fraction_extreme;
    double amplitude = extreme ? logUniform(rng, 0.01, 1.0) : logUniform(rng, 1e-4, 0.01);

    if (option == "sin") {
        double period = logUniform(rng, 0.1, 30.0);
        double phase = 2.0 * M_PI * unit(rng);
        return std::make_shared<SinusoidLightCurve>(period, amplitude, phase);
    }

    if (option == "trapezoid") {
        double period = logUniform(rng, 0.5, 30.0);
        double t0 = BJD_AT_EPOCH_2000 + period * unit(rng);
        double duration = std::min(logUniform(rng, 0.02, 0.3), period / 2.0);
        double ingress = duration * (0.05 + 0.45 * unit(rng));
        return std::make_shared<TrapezoidLightCurve>(period, t0, duration, ingress, amplitude);
    }

    throw CatalogException(ErrorCode::INVALID_PARAMS, "Unknown light curve option: " + option);
}

} // namespace catalog
} // namespace starsim
