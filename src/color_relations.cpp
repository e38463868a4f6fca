#include "starsim/color_relations.h"
#include "starsim/types.h"
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace starsim {
namespace catalog {

namespace {

// V-J, Teff, V-Ic for main-sequence stars (B0 through M8)
const std::vector<ColorRelationRow> DEFAULT_ROWS = {
    {-0.80, 31500.0, -0.35},
    {-0.40, 15700.0, -0.17},
    { 0.00,  9700.0,  0.00},
    { 0.30,  8180.0,  0.16},
    { 0.60,  7220.0,  0.33},
    { 0.90,  6340.0,  0.51},
    { 1.15,  5770.0,  0.68},
    { 1.50,  5280.0,  0.85},
    { 1.85,  4830.0,  1.01},
    { 2.20,  4450.0,  1.20},
    { 2.90,  3850.0,  1.70},
    { 3.60,  3400.0,  2.25},
    { 4.50,  3060.0,  3.00},
    { 6.00,  2570.0,  4.00},
};

} // anonymous namespace

TabulatedColorRelations::TabulatedColorRelations()
    : rows_(DEFAULT_ROWS) {}

TabulatedColorRelations::TabulatedColorRelations(std::vector<ColorRelationRow> rows)
    : rows_(std::move(rows)) {
    if (rows_.size() < 2) {
        throw CatalogException(ErrorCode::INVALID_PARAMS,
                               "Colour relation table needs at least two rows");
    }
    for (size_t i = 1; i < rows_.size(); ++i) {
        if (!(rows_[i].color > rows_[i - 1].color)) {
            throw CatalogException(ErrorCode::INVALID_PARAMS,
                                   "Colour relation table must be sorted by colour");
        }
    }
}

TabulatedColorRelations TabulatedColorRelations::loadFromCSV(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw CatalogException(ErrorCode::PARSE_ERROR,
                               "Cannot open colour relation table: " + path);
    }

    std::vector<ColorRelationRow> rows;
    std::string line;
    size_t line_number = 0;

    while (std::getline(file, line)) {
        line_number++;
        if (line.empty() || line[0] == '#') continue;

        std::stringstream ss(line);
        std::string field;
        std::vector<double> values;
        while (std::getline(ss, field, ',')) {
            char* end = nullptr;
            double value = std::strtod(field.c_str(), &end);
            if (end == field.c_str()) {
                throw CatalogException(ErrorCode::PARSE_ERROR,
                                       path + ":" + std::to_string(line_number) +
                                       ": not a number: '" + field + "'");
            }
            values.push_back(value);
        }
        if (values.size() != 3) {
            throw CatalogException(ErrorCode::PARSE_ERROR,
                                   path + ":" + std::to_string(line_number) +
                                   ": expected color,temperature,correction");
        }
        rows.push_back({values[0], values[1], values[2]});
    }

    return TabulatedColorRelations(std::move(rows));
}

double TabulatedColorRelations::interpolate(double color, double ColorRelationRow::*field) const {
    if (std::isnan(color)) {
        return color;
    }
    if (color <= rows_.front().color) return rows_.front().*field;
    if (color >= rows_.back().color) return rows_.back().*field;

    auto upper = std::upper_bound(rows_.begin(), rows_.end(), color,
        [](double c, const ColorRelationRow& row) { return c < row.color; });
    auto lower = upper - 1;

    double t = (color - lower->color) / (upper->color - lower->color);
    return (*lower).*field + t * ((*upper).*field - (*lower).*field);
}

double TabulatedColorRelations::temperature(double color) const {
    return interpolate(color, &ColorRelationRow::temperature);
}

double TabulatedColorRelations::magnitudeCorrection(double color) const {
    return interpolate(color, &ColorRelationRow::correction);
}

} // namespace catalog
} // namespace starsim
