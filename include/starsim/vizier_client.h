#pragma once

#include "config.h"
#include "survey_provider.h"
#include <memory>
#include <string>

namespace starsim {
namespace catalog {

/**
 * VizierClient - cone searches against the VizieR TAP service via ADQL
 *
 * Each queryCone() issues exactly one synchronous request. There is no
 * retry loop and no rate limiting; a failed request surfaces as a
 * CatalogException to the caller.
 *
 * Example usage:
 * @code
 *   VizierClient client(config);
 *   SurveyTable t = client.queryCone({270.0, 66.56}, 0.2);
 *   std::cout << t.rowCount() << " UCAC4 rows\n";
 * @endcode
 */
class VizierClient : public SurveyProvider {
public:
    /**
     * @param config Supplies the TAP endpoint and transport timeout
     * @param definition Table and columns to query (default: UCAC4)
     */
    explicit VizierClient(const CatalogConfig& config,
                          SurveyDefinition definition = SurveyDefinition::ucac4());

    ~VizierClient() override;

    // No copy, allow move
    VizierClient(const VizierClient&) = delete;
    VizierClient& operator=(const VizierClient&) = delete;
    VizierClient(VizierClient&&) noexcept;
    VizierClient& operator=(VizierClient&&) noexcept;

    SurveyTable queryCone(const EquatorialCoordinates& center, double radius) override;

    const SurveyDefinition& definition() const override;

    /**
     * ADQL sent for a cone
     */
    std::string buildConeQuery(const EquatorialCoordinates& center, double radius) const;

    /**
     * Get the TAP service URL being used
     */
    std::string getTapUrl() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};

/**
 * Parse a TAP CSV response into a table holding the requested columns
 *
 * Empty fields become NaN. Columns are matched by header name.
 *
 * @throws CatalogException(PARSE_ERROR) on a missing header, a missing
 *         requested column, a short row or a non-numeric field
 */
SurveyTable parseSurveyCSV(const std::string& csv_data,
                           const std::vector<std::string>& columns);

} // namespace catalog
} // namespace starsim
