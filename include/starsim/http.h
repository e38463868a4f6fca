#pragma once

#include <string>

namespace starsim {
namespace catalog {
namespace http {

/**
 * Blocking HTTP GET, one attempt
 *
 * @param timeout_seconds Transfer timeout, 0 = none
 * @return Response body
 * @throws CatalogException(NETWORK_ERROR) on transport failure or a non-200 status
 */
std::string get(const std::string& url, int timeout_seconds);

/**
 * Blocking form-encoded HTTP POST, one attempt
 * @throws CatalogException(NETWORK_ERROR) on transport failure or a non-200 status
 */
std::string post(const std::string& url, const std::string& data, int timeout_seconds);

/**
 * Form/query-string encoding (spaces become '+')
 */
std::string urlEncode(const std::string& str);

} // namespace http
} // namespace catalog
} // namespace starsim
