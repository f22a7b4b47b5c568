#include <iostream>
#include "SQLiteStore.hpp"

SQLiteStore::SQLiteStore(std::string const& path)
    : db(nullptr), insertSampleStmt(nullptr), insertAlertStmt(nullptr)
{
    int rc = sqlite3_open(path.c_str(), &db);
    if (rc != SQLITE_OK)
    {
        std::cerr << "[History] Failed to open SQLite DB: " << sqlite3_errmsg(db) << "\n";
        sqlite3_close(db);
        db = nullptr;
        return;
    }

    const char* createSql =
        "CREATE TABLE IF NOT EXISTS VehicleSamples ("
        "  id INTEGER PRIMARY KEY AUTOINCREMENT, "
        "  timestamp INTEGER, "
        "  vehicleId TEXT, "
        "  edgeU TEXT, "
        "  edgeV TEXT, "
        "  progress REAL, "
        "  speed REAL, "
        "  status TEXT, "
        "  source TEXT"
        ");"
        "CREATE INDEX IF NOT EXISTS idx_samples_time ON VehicleSamples(timestamp);"
        "CREATE TABLE IF NOT EXISTS AlertLog ("
        "  id INTEGER PRIMARY KEY AUTOINCREMENT, "
        "  timestamp INTEGER, "
        "  pairKey TEXT, "
        "  severity TEXT, "
        "  distance REAL, "
        "  relativeSpeed REAL"
        ");";

    char* errMsg = nullptr;
    rc = sqlite3_exec(db, createSql, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK)
    {
        std::cerr << "[History] Failed to create tables: "
                  << (errMsg ? errMsg : "unknown error") << "\n";
        if (errMsg) sqlite3_free(errMsg);
    }

    const char* sampleSql =
        "INSERT INTO VehicleSamples "
        "(timestamp, vehicleId, edgeU, edgeV, progress, speed, status, source) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?);";

    if (sqlite3_prepare_v2(db, sampleSql, -1, &insertSampleStmt, nullptr) != SQLITE_OK)
    {
        std::cerr << "[History] Failed to prepare sample insert: " << sqlite3_errmsg(db) << "\n";
        insertSampleStmt = nullptr;
    }

    const char* alertSql =
        "INSERT INTO AlertLog (timestamp, pairKey, severity, distance, relativeSpeed) "
        "VALUES (?, ?, ?, ?, ?);";

    if (sqlite3_prepare_v2(db, alertSql, -1, &insertAlertStmt, nullptr) != SQLITE_OK)
    {
        std::cerr << "[History] Failed to prepare alert insert: " << sqlite3_errmsg(db) << "\n";
        insertAlertStmt = nullptr;
    }
}

SQLiteStore::~SQLiteStore()
{
    if (insertSampleStmt) sqlite3_finalize(insertSampleStmt);
    if (insertAlertStmt) sqlite3_finalize(insertAlertStmt);
    if (db) sqlite3_close(db);
}

void SQLiteStore::insertSampleInternal(VehicleState const& v, std::int64_t timestampMs, std::string const& source)
{
    sqlite3_reset(insertSampleStmt);

    std::string edgeU = v.edge ? v.edge->u : "";
    std::string edgeV = v.edge ? v.edge->v : "";
    std::string status = toString(v.status);

    sqlite3_bind_int64(insertSampleStmt, 1, static_cast<sqlite3_int64>(timestampMs));
    sqlite3_bind_text(insertSampleStmt, 2, v.id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(insertSampleStmt, 3, edgeU.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(insertSampleStmt, 4, edgeV.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_double(insertSampleStmt, 5, v.progress);
    sqlite3_bind_double(insertSampleStmt, 6, v.speedMetersPerSecond);
    sqlite3_bind_text(insertSampleStmt, 7, status.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(insertSampleStmt, 8, source.c_str(), -1, SQLITE_TRANSIENT);

    if (sqlite3_step(insertSampleStmt) != SQLITE_DONE)
    {
        std::cerr << "[History] Sample insert failed: " << sqlite3_errmsg(db) << "\n";
    }
}

void SQLiteStore::insertAlertInternal(AlertRecord const& a, std::int64_t timestampMs)
{
    sqlite3_reset(insertAlertStmt);

    std::string key = a.pairKey();
    std::string severity = toString(a.severity);

    sqlite3_bind_int64(insertAlertStmt, 1, static_cast<sqlite3_int64>(timestampMs));
    sqlite3_bind_text(insertAlertStmt, 2, key.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(insertAlertStmt, 3, severity.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_double(insertAlertStmt, 4, a.distanceMeters);
    sqlite3_bind_double(insertAlertStmt, 5, a.relativeSpeedMetersPerSecond);

    if (sqlite3_step(insertAlertStmt) != SQLITE_DONE)
    {
        std::cerr << "[History] Alert insert failed: " << sqlite3_errmsg(db) << "\n";
    }
}

void SQLiteStore::insertSnapshot(std::vector<VehicleState> const& vehicles, std::int64_t timestampMs, std::string const& source)
{
    if (!insertSampleStmt || vehicles.empty())
        return;

    sqlite3_exec(db, "BEGIN TRANSACTION;", nullptr, nullptr, nullptr);

    for (VehicleState const& v : vehicles)
        insertSampleInternal(v, timestampMs, source);

    sqlite3_exec(db, "COMMIT;", nullptr, nullptr, nullptr);
}

void SQLiteStore::insertAlerts(std::vector<AlertRecord> const& alerts, std::int64_t timestampMs)
{
    if (!insertAlertStmt || alerts.empty())
        return;

    sqlite3_exec(db, "BEGIN TRANSACTION;", nullptr, nullptr, nullptr);

    for (AlertRecord const& a : alerts)
        insertAlertInternal(a, timestampMs);

    sqlite3_exec(db, "COMMIT;", nullptr, nullptr, nullptr);
}

void SQLiteStore::pruneOldData(int daysToKeep, std::int64_t nowMs)
{
    if (!db)
        return;

    const std::int64_t cutoff = nowMs - static_cast<std::int64_t>(daysToKeep) * 86400000LL;
    const char* statements[] = {
        "DELETE FROM VehicleSamples WHERE timestamp < ?;",
        "DELETE FROM AlertLog WHERE timestamp < ?;"
    };

    sqlite3_exec(db, "BEGIN TRANSACTION;", nullptr, nullptr, nullptr);

    for (const char* sql : statements)
    {
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) == SQLITE_OK)
        {
            sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(cutoff));
            if (sqlite3_step(stmt) != SQLITE_DONE)
            {
                std::cerr << "[History] Prune failed: " << sqlite3_errmsg(db) << "\n";
            }
            sqlite3_finalize(stmt);
        }
        else
        {
            std::cerr << "[History] Failed to prepare prune: " << sqlite3_errmsg(db) << "\n";
        }
    }

    sqlite3_exec(db, "COMMIT;", nullptr, nullptr, nullptr);
}

std::vector<AlertLogEntry> SQLiteStore::getRecentAlerts(int limit)
{
    std::vector<AlertLogEntry> results;
    if (!db)
        return results;

    const char* sql =
        "SELECT timestamp, pairKey, severity, distance, relativeSpeed "
        "FROM AlertLog ORDER BY timestamp DESC, id DESC LIMIT ?;";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK)
    {
        std::cerr << "[History] Failed to prepare getRecentAlerts: " << sqlite3_errmsg(db) << "\n";
        return results;
    }

    sqlite3_bind_int(stmt, 1, limit);

    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW)
    {
        AlertLogEntry e;
        const unsigned char* key      = sqlite3_column_text(stmt, 1);
        const unsigned char* severity = sqlite3_column_text(stmt, 2);

        e.timestampMs = sqlite3_column_int64(stmt, 0);
        e.pairKey     = key ? reinterpret_cast<const char*>(key) : "";
        e.severity    = severity ? reinterpret_cast<const char*>(severity) : "";
        e.distanceMeters               = sqlite3_column_double(stmt, 3);
        e.relativeSpeedMetersPerSecond = sqlite3_column_double(stmt, 4);

        results.push_back(std::move(e));
    }

    if (rc != SQLITE_DONE)
    {
        std::cerr << "[History] Error stepping getRecentAlerts: " << sqlite3_errmsg(db) << "\n";
    }

    sqlite3_finalize(stmt);
    return results;
}

int SQLiteStore::countSamples(std::string const& vehicleId)
{
    int result = 0;
    if (!db)
        return result;

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, "SELECT count(*) FROM VehicleSamples WHERE vehicleId = ?", -1, &stmt, nullptr) == SQLITE_OK)
    {
        sqlite3_bind_text(stmt, 1, vehicleId.c_str(), -1, SQLITE_TRANSIENT);
        if (sqlite3_step(stmt) == SQLITE_ROW)
            result = sqlite3_column_int(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return result;
}
