#include "starsim/projected_writer.h"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>

namespace starsim {
namespace catalog {

// =============================================================================
// GnomonicProjector
// =============================================================================

GnomonicProjector::GnomonicProjector(const EquatorialCoordinates& center, double pixel_scale,
                                     double reference_x, double reference_y)
    : center_(center), pixel_scale_(pixel_scale),
      reference_x_(reference_x), reference_y_(reference_y) {
    if (!(pixel_scale_ > 0.0)) {
        throw CatalogException(ErrorCode::INVALID_PARAMS, "Pixel scale must be positive");
    }
}

PixelPositions GnomonicProjector::project(const std::vector<double>& ra,
                                          const std::vector<double>& dec) const {
    constexpr double DEG_TO_RAD = M_PI / 180.0;
    constexpr double RAD_TO_ARCSEC = 180.0 / M_PI * 3600.0;

    if (ra.size() != dec.size()) {
        throw CatalogException(ErrorCode::INVALID_PARAMS, "ra and dec differ in length");
    }

    const double sin_dec0 = std::sin(center_.dec * DEG_TO_RAD);
    const double cos_dec0 = std::cos(center_.dec * DEG_TO_RAD);

    PixelPositions pixels;
    pixels.x.resize(ra.size());
    pixels.y.resize(ra.size());

    for (size_t i = 0; i < ra.size(); ++i) {
        const double delta_ra = (ra[i] - center_.ra) * DEG_TO_RAD;
        const double sin_dec = std::sin(dec[i] * DEG_TO_RAD);
        const double cos_dec = std::cos(dec[i] * DEG_TO_RAD);

        // cosine of the angular distance from the tangent point
        const double cos_sep = sin_dec * sin_dec0 + cos_dec * cos_dec0 * std::cos(delta_ra);
        if (cos_sep <= 0.0) {
            pixels.x[i] = std::numeric_limits<double>::quiet_NaN();
            pixels.y[i] = std::numeric_limits<double>::quiet_NaN();
            continue;
        }

        const double xi = cos_dec * std::sin(delta_ra) / cos_sep;
        const double eta = (sin_dec * cos_dec0 - cos_dec * sin_dec0 * std::cos(delta_ra)) / cos_sep;

        pixels.x[i] = reference_x_ + xi * RAD_TO_ARCSEC / pixel_scale_;
        pixels.y[i] = reference_y_ + eta * RAD_TO_ARCSEC / pixel_scale_;
    }

    return pixels;
}

// =============================================================================
// Fixed-width export
// =============================================================================

namespace {

std::string formatValue(double value) {
    std::ostringstream oss;
    oss << std::setprecision(10) << value;
    return oss.str();
}

} // anonymous namespace

void writeProjected(const Catalog& catalog, const SkyProjector& projector,
                    double bjd, double exptime, const std::string& path) {
    CatalogArrays now = catalog.snapshotAtBjd(bjd, exptime);
    PixelPositions pixels = projector.project(now.ra, now.dec);
    if (pixels.x.size() != catalog.size() || pixels.y.size() != catalog.size()) {
        throw CatalogException(ErrorCode::INVALID_PARAMS,
                               "Projector returned " + std::to_string(pixels.x.size()) +
                               " positions for " + std::to_string(catalog.size()) + " stars");
    }

    const std::vector<std::string> names = {"ra", "dec", "x", "y", "tmag", "lc"};
    std::vector<std::vector<std::string>> cells(names.size());
    const std::vector<std::string> codes = catalog.lightCurveCodes();

    for (size_t i = 0; i < catalog.size(); ++i) {
        cells[0].push_back(formatValue(now.ra[i]));
        cells[1].push_back(formatValue(now.dec[i]));
        cells[2].push_back(formatValue(pixels.x[i]));
        cells[3].push_back(formatValue(pixels.y[i]));
        cells[4].push_back(formatValue(catalog.tmag()[i]));
        cells[5].push_back(codes[i]);
    }

    std::vector<size_t> widths(names.size());
    for (size_t c = 0; c < names.size(); ++c) {
        widths[c] = names[c].size();
        for (const auto& cell : cells[c]) {
            widths[c] = std::max(widths[c], cell.size());
        }
    }

    std::ofstream ofs(path, std::ios::trunc);
    if (!ofs) {
        throw CatalogException(ErrorCode::INVALID_PARAMS, "Cannot write projected catalog " + path);
    }

    for (size_t c = 0; c < names.size(); ++c) {
        if (c > 0) ofs << ' ';
        ofs << std::left << std::setw(static_cast<int>(widths[c])) << names[c];
    }
    ofs << '\n';

    for (size_t i = 0; i < catalog.size(); ++i) {
        for (size_t c = 0; c < names.size(); ++c) {
            if (c > 0) ofs << ' ';
            ofs << std::left << std::setw(static_cast<int>(widths[c])) << cells[c][i];
        }
        ofs << '\n';
    }

    if (!ofs) {
        throw CatalogException(ErrorCode::INVALID_PARAMS, "Failed writing projected catalog " + path);
    }

    catalog.logger().info("save projected star catalog " + path);
}

} // namespace catalog
} // namespace starsim
