#pragma once

#include "catalog.h"
#include <string>
#include <vector>

namespace starsim {
namespace catalog {

/**
 * Copy the stars selected by a boolean mask out of a catalog
 *
 * The result owns its arrays (including light-curve handles), keeps the
 * source epoch and reports CatalogKind::SUBSET. Later changes to the source
 * do not reach it.
 *
 * @throws CatalogException(INVALID_PARAMS) if keep.size() != source.size()
 */
Catalog makeSubset(const Catalog& source, const std::vector<bool>& keep);

/**
 * Copy the stars at the given indices, in the given order
 *
 * @throws CatalogException(INVALID_PARAMS) if any index is >= source.size()
 */
Catalog makeSubset(const Catalog& source, const std::vector<size_t>& indices);

} // namespace catalog
} // namespace starsim
