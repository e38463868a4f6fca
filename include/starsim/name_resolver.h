#pragma once

#include "config.h"
#include "logger.h"
#include "types.h"
#include <memory>
#include <string>

struct sqlite3;

namespace starsim {
namespace catalog {

/**
 * NameResolver - maps an object name to ICRS coordinates
 */
class NameResolver {
public:
    virtual ~NameResolver() = default;

    /**
     * @return (ra, dec) [degrees], ICRS
     * @throws CatalogException(NAME_NOT_RESOLVED) if the name is unknown
     */
    virtual EquatorialCoordinates resolve(const std::string& name) = 0;
};

/**
 * CDS Sesame over HTTP (one request per name, no retries)
 */
class SesameResolver : public NameResolver {
public:
    explicit SesameResolver(const CatalogConfig& config);

    /**
     * @throws CatalogException(NAME_NOT_RESOLVED) if Sesame has no position
     * @throws CatalogException(NETWORK_ERROR) if the service can't be reached
     */
    EquatorialCoordinates resolve(const std::string& name) override;

private:
    std::string url_;
    int timeout_seconds_;
    Logger logger_;
};

/**
 * Extract the position from a Sesame "-oI" text response (the "%J ra dec" line)
 * @throws CatalogException(NAME_NOT_RESOLVED) if there is no usable %J line
 */
EquatorialCoordinates parseSesameResponse(const std::string& response, const std::string& name);

/**
 * Local lookup in an SQLite table names(name TEXT, ra REAL, dec REAL)
 *
 * Names match case-insensitively. The database is opened read-only.
 */
class SqliteNameResolver : public NameResolver {
public:
    /**
     * @throws CatalogException(INVALID_PARAMS) if the database can't be opened
     */
    SqliteNameResolver(const std::string& db_path, const CatalogConfig& config);
    ~SqliteNameResolver() override;

    SqliteNameResolver(const SqliteNameResolver&) = delete;
    SqliteNameResolver& operator=(const SqliteNameResolver&) = delete;

    EquatorialCoordinates resolve(const std::string& name) override;

private:
    void closeDatabase();

    sqlite3* db_ = nullptr;
    std::string db_path_;
    Logger logger_;
};

/**
 * SQLite resolver when config.names_database is set, Sesame otherwise
 */
std::unique_ptr<NameResolver> makeNameResolver(const CatalogConfig& config);

} // namespace catalog
} // namespace starsim
