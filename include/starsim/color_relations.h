#pragma once

#include <string>
#include <vector>

namespace starsim {
namespace catalog {

/**
 * ColorRelations - colour index to temperature and magnitude conversions
 */
class ColorRelations {
public:
    virtual ~ColorRelations() = default;

    /**
     * Effective temperature [K] for a colour index [mag]
     */
    virtual double temperature(double color) const = 0;

    /**
     * Magnitude difference between the survey's primary band and the
     * working band for a colour index [mag]
     */
    virtual double magnitudeCorrection(double color) const = 0;
};

/**
 * One row of a colour relation table
 */
struct ColorRelationRow {
    double color;                ///< Colour index [mag], strictly increasing
    double temperature;          ///< [K]
    double correction;           ///< [mag]
};

/**
 * Piecewise-linear relations over a table, clamped at the table ends
 *
 * The default table maps V-J to dwarf effective temperatures and V-Ic
 * offsets, from early B (V-J ~ -0.8) to late M (V-J ~ 6).
 */
class TabulatedColorRelations : public ColorRelations {
public:
    TabulatedColorRelations();

    /**
     * @throws CatalogException(INVALID_PARAMS) for fewer than two rows or
     *         colours that do not strictly increase
     */
    explicit TabulatedColorRelations(std::vector<ColorRelationRow> rows);

    /**
     * Load "color,temperature,correction" rows ('#' starts a comment)
     * @throws CatalogException(PARSE_ERROR) on unreadable files or rows
     */
    static TabulatedColorRelations loadFromCSV(const std::string& path);

    double temperature(double color) const override;
    double magnitudeCorrection(double color) const override;

    const std::vector<ColorRelationRow>& rows() const { return rows_; }

private:
    double interpolate(double color, double ColorRelationRow::*field) const;

    std::vector<ColorRelationRow> rows_;
};

} // namespace catalog
} // namespace starsim
