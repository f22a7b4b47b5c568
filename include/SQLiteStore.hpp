#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include "sqlite3.h"
#include "Types.hpp"

struct AlertLogEntry
{
    std::int64_t timestampMs;
    std::string pairKey;
    std::string severity;
    double distanceMeters;
    double relativeSpeedMetersPerSecond;
};

// Session history: authoritative vehicle samples and incoming alerts.
class SQLiteStore
{
private:
    sqlite3* db;
    sqlite3_stmt* insertSampleStmt;
    sqlite3_stmt* insertAlertStmt;

    void insertSampleInternal(VehicleState const& v, std::int64_t timestampMs, std::string const& source);
    void insertAlertInternal(AlertRecord const& a, std::int64_t timestampMs);

public:
    SQLiteStore(std::string const& path);
    ~SQLiteStore();
    SQLiteStore(SQLiteStore const&) = delete;
    SQLiteStore& operator=(SQLiteStore const&) = delete;

    bool isOpen() const noexcept { return db != nullptr; }

    void insertSnapshot(std::vector<VehicleState> const& vehicles, std::int64_t timestampMs, std::string const& source);
    void insertAlerts(std::vector<AlertRecord> const& alerts, std::int64_t timestampMs);
    void pruneOldData(int daysToKeep, std::int64_t nowMs);

    std::vector<AlertLogEntry> getRecentAlerts(int limit);
    int countSamples(std::string const& vehicleId);
};
