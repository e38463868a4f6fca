#include "starsim/survey_table.h"
#include "starsim/types.h"
#include <algorithm>
#include <cstring>

namespace starsim {
namespace catalog {

void SurveyTable::addColumn(const std::string& name, std::vector<double> values) {
    if (hasColumn(name)) {
        throw CatalogException(ErrorCode::INVALID_PARAMS, "Duplicate survey column: " + name);
    }
    if (!columns_.empty() && values.size() != rowCount()) {
        throw CatalogException(ErrorCode::INVALID_PARAMS,
                               "Survey column " + name + " has " + std::to_string(values.size()) +
                               " rows, expected " + std::to_string(rowCount()));
    }
    names_.push_back(name);
    columns_.push_back(std::move(values));
}

bool SurveyTable::hasColumn(const std::string& name) const {
    return std::find(names_.begin(), names_.end(), name) != names_.end();
}

const std::vector<double>& SurveyTable::column(const std::string& name) const {
    auto it = std::find(names_.begin(), names_.end(), name);
    if (it == names_.end()) {
        throw CatalogException(ErrorCode::PARSE_ERROR, "Survey table has no column " + name);
    }
    return columns_[static_cast<size_t>(it - names_.begin())];
}

bool SurveyTable::identical(const SurveyTable& other) const {
    if (names_ != other.names_) return false;
    for (size_t c = 0; c < columns_.size(); ++c) {
        const auto& a = columns_[c];
        const auto& b = other.columns_[c];
        if (a.size() != b.size()) return false;
        if (!a.empty() && std::memcmp(a.data(), b.data(), a.size() * sizeof(double)) != 0) {
            return false;
        }
    }
    return true;
}

} // namespace catalog
} // namespace starsim
