#include "starsim/name_resolver.h"
#include "starsim/http.h"
#include <cmath>
#include <sstream>
#include <sqlite3.h>

namespace starsim {
namespace catalog {

// =============================================================================
// Sesame
// =============================================================================

EquatorialCoordinates parseSesameResponse(const std::string& response, const std::string& name) {
    std::istringstream stream(response);
    std::string line;

    while (std::getline(stream, line)) {
        if (line.compare(0, 2, "%J") != 0) continue;

        std::istringstream fields(line.substr(2));
        EquatorialCoordinates coord;
        if (fields >> coord.ra >> coord.dec && isValidCoordinate(coord)) {
            return coord;
        }
    }

    throw CatalogException(ErrorCode::NAME_NOT_RESOLVED, "Sesame could not resolve '" + name + "'");
}

SesameResolver::SesameResolver(const CatalogConfig& config)
    : url_(config.sesame_url),
      timeout_seconds_(config.timeout_seconds),
      logger_(config, "Sesame") {}

EquatorialCoordinates SesameResolver::resolve(const std::string& name) {
    std::string response = http::get(url_ + "?" + http::urlEncode(name), timeout_seconds_);
    EquatorialCoordinates coord = parseSesameResponse(response, name);

    std::ostringstream msg;
    msg << "resolved " << name << " to ra = " << coord.ra << ", dec = " << coord.dec;
    logger_.info(msg.str());
    return coord;
}

// =============================================================================
// SQLite
// =============================================================================

SqliteNameResolver::SqliteNameResolver(const std::string& db_path, const CatalogConfig& config)
    : db_path_(db_path), logger_(config, "NameDatabase") {
    int rc = sqlite3_open_v2(db_path_.c_str(), &db_, SQLITE_OPEN_READONLY, nullptr);
    if (rc != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : "out of memory";
        closeDatabase();
        throw CatalogException(ErrorCode::INVALID_PARAMS,
                               "Failed to open name database " + db_path_ + ": " + error);
    }
}

SqliteNameResolver::~SqliteNameResolver() {
    closeDatabase();
}

void SqliteNameResolver::closeDatabase() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

EquatorialCoordinates SqliteNameResolver::resolve(const std::string& name) {
    const char* sql = "SELECT ra, dec FROM names WHERE name = ? COLLATE NOCASE LIMIT 1";
    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        throw CatalogException(ErrorCode::NAME_NOT_RESOLVED,
                               "Name database " + db_path_ + " is unusable: " + sqlite3_errmsg(db_));
    }

    sqlite3_bind_text(stmt, 1, name.c_str(), -1, SQLITE_TRANSIENT);

    bool found = false;
    EquatorialCoordinates coord;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        coord.ra = sqlite3_column_double(stmt, 0);
        coord.dec = sqlite3_column_double(stmt, 1);
        found = true;
    }

    sqlite3_finalize(stmt);

    if (!found || !isValidCoordinate(coord)) {
        throw CatalogException(ErrorCode::NAME_NOT_RESOLVED,
                               "'" + name + "' is not in " + db_path_);
    }

    logger_.debug("found " + name + " in " + db_path_);
    return coord;
}

// =============================================================================
// Factory
// =============================================================================

std::unique_ptr<NameResolver> makeNameResolver(const CatalogConfig& config) {
    if (!config.names_database.empty()) {
        return std::make_unique<SqliteNameResolver>(config.names_database, config);
    }
    return std::make_unique<SesameResolver>(config);
}

} // namespace catalog
} // namespace starsim
