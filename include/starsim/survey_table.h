#pragma once

#include <string>
#include <vector>

namespace starsim {
namespace catalog {

/**
 * SurveyTable - raw tabular result of a survey query
 *
 * Named columns of doubles, all of one length; missing measurements are
 * NaN. Column order is preserved so that a table read back from the cache
 * is identical to the one stored.
 */
class SurveyTable {
public:
    SurveyTable() = default;

    /**
     * @throws CatalogException(INVALID_PARAMS) on a duplicate name or a
     *         length that differs from the existing columns
     */
    void addColumn(const std::string& name, std::vector<double> values);

    bool hasColumn(const std::string& name) const;

    /**
     * @throws CatalogException(PARSE_ERROR) if the column is absent
     */
    const std::vector<double>& column(const std::string& name) const;

    const std::vector<std::string>& columnNames() const { return names_; }
    const std::vector<std::vector<double>>& columns() const { return columns_; }

    size_t rowCount() const { return columns_.empty() ? 0 : columns_.front().size(); }
    size_t columnCount() const { return names_.size(); }

    /**
     * Bitwise equality (NaN payloads included)
     */
    bool identical(const SurveyTable& other) const;

private:
    std::vector<std::string> names_;
    std::vector<std::vector<double>> columns_;
};

} // namespace catalog
} // namespace starsim
