#include <iostream>
#include <stdexcept>
#include "ArchiveErrors.hpp"
#include "SQLiteStore.hpp"

namespace
{
    const char* createSql =
        "CREATE TABLE IF NOT EXISTS vehicle_positions ("
        "  trip_id TEXT, "
        "  route_id TEXT, "
        "  direction_id INT8, "
        "  start_time DATETIME, "
        "  schedule_relationship INT8, "
        "  latitude REAL, "
        "  longitude REAL, "
        "  bearing REAL, "
        "  odometer REAL, "
        "  speed REAL, "
        "  current_stop_sequence INTEGER, "
        "  stop_id TEXT, "
        "  current_status INT8, "
        "  timestamp DATETIME, "
        "  congestion_level INT8, "
        "  occupancy_status INT8, "
        "  vehicle_id TEXT, "
        "  vehicle_label TEXT, "
        "  license_plate TEXT, "
        "  UNIQUE(trip_id, timestamp)"
        ");"
        "CREATE INDEX IF NOT EXISTS idx_vehicle_positions_timestamp "
        "  ON vehicle_positions (timestamp);";

    const char* insertSql =
        "INSERT OR IGNORE INTO vehicle_positions "
        "(trip_id, route_id, direction_id, start_time, schedule_relationship, "
        " latitude, longitude, bearing, odometer, speed, "
        " current_stop_sequence, stop_id, current_status, timestamp, "
        " congestion_level, occupancy_status, vehicle_id, vehicle_label, license_plate) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);";

    // timestamp > 0 drops rows the feed never stamped.
    const char* boundsSql =
        "SELECT "
        "  COALESCE(strftime('%Y-%m', MIN(timestamp), 'unixepoch'), ''), "
        "  COALESCE(strftime('%Y-%m', MAX(timestamp), 'unixepoch'), '') "
        "FROM vehicle_positions WHERE timestamp > 0;";

    const char* windowSql =
        "SELECT "
        "  trip_id, route_id, direction_id, CAST(start_time AS INT), schedule_relationship, "
        "  latitude, longitude, bearing, odometer, speed, "
        "  current_stop_sequence, stop_id, current_status, CAST(timestamp AS INT), "
        "  congestion_level, occupancy_status, vehicle_id, vehicle_label, license_plate "
        "FROM vehicle_positions "
        "WHERE timestamp > 0 AND timestamp >= ? AND timestamp < ? "
        "ORDER BY timestamp;";

    const char* columnNames[] = {
        "trip_id", "route_id", "direction_id", "start_time", "schedule_relationship",
        "latitude", "longitude", "bearing", "odometer", "speed",
        "current_stop_sequence", "stop_id", "current_status", "timestamp",
        "congestion_level", "occupancy_status", "vehicle_id", "vehicle_label", "license_plate"
    };

    std::string columnText(sqlite3_stmt* stmt, int col)
    {
        const unsigned char* text = sqlite3_column_text(stmt, col);
        return text ? reinterpret_cast<const char*>(text) : "";
    }

    int64_t columnInteger(sqlite3_stmt* stmt, int col)
    {
        switch (sqlite3_column_type(stmt, col))
        {
            case SQLITE_NULL:    return 0;
            case SQLITE_INTEGER: return sqlite3_column_int64(stmt, col);
            default:
                throw ArchiveError(ArchiveError::Kind::Codec,
                    std::string("column ") + columnNames[col] + " does not hold an integer");
        }
    }

    double columnReal(sqlite3_stmt* stmt, int col)
    {
        switch (sqlite3_column_type(stmt, col))
        {
            case SQLITE_NULL:    return 0.0;
            case SQLITE_INTEGER:
            case SQLITE_FLOAT:   return sqlite3_column_double(stmt, col);
            default:
                throw ArchiveError(ArchiveError::Kind::Codec,
                    std::string("column ") + columnNames[col] + " does not hold a number");
        }
    }
}

PositionCursor::PositionCursor(sqlite3* connection, sqlite3_stmt* statement)
    : db(connection), stmt(statement)
{
}

PositionCursor::PositionCursor(PositionCursor&& other) noexcept
    : db(other.db), stmt(other.stmt)
{
    other.stmt = nullptr;
}

PositionCursor::~PositionCursor()
{
    if (stmt) sqlite3_finalize(stmt);
}

bool PositionCursor::next(VehiclePosition& out)
{
    if (!stmt)
        return false;

    int rc = sqlite3_step(stmt);
    if (rc == SQLITE_DONE)
        return false;
    if (rc != SQLITE_ROW)
        throw ArchiveError(ArchiveError::Kind::Io,
            std::string("stepping vehicle_positions query failed: ") + sqlite3_errmsg(db));

    out.tripId               = columnText(stmt, 0);
    out.routeId              = columnText(stmt, 1);
    out.directionId          = static_cast<int32_t>(columnInteger(stmt, 2));
    out.startTime            = columnInteger(stmt, 3);
    out.scheduleRelationship = static_cast<int32_t>(columnInteger(stmt, 4));
    out.latitude             = static_cast<float>(columnReal(stmt, 5));
    out.longitude            = static_cast<float>(columnReal(stmt, 6));
    out.bearing              = static_cast<float>(columnReal(stmt, 7));
    out.odometer             = columnReal(stmt, 8);
    out.speed                = static_cast<float>(columnReal(stmt, 9));
    out.currentStopSequence  = static_cast<uint32_t>(columnInteger(stmt, 10));
    out.stopId               = columnText(stmt, 11);
    out.currentStatus        = static_cast<int32_t>(columnInteger(stmt, 12));
    out.timestamp            = columnInteger(stmt, 13);
    out.congestionLevel      = static_cast<int32_t>(columnInteger(stmt, 14));
    out.occupancyStatus      = static_cast<int32_t>(columnInteger(stmt, 15));
    out.vehicleId            = columnText(stmt, 16);
    out.vehicleLabel         = columnText(stmt, 17);
    out.licensePlate         = columnText(stmt, 18);
    return true;
}

SQLiteStore::SQLiteStore(std::string const& path, OpenMode mode)
    : db(nullptr), insertStmt(nullptr)
{
    int flags = mode == OpenMode::ReadOnly ? SQLITE_OPEN_READONLY : SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;
    int rc = sqlite3_open_v2(path.c_str(), &db, flags, nullptr);
    if (rc != SQLITE_OK)
    {
        std::string message = "Failed to open SQLite DB " + path + ": "
                            + (db ? sqlite3_errmsg(db) : sqlite3_errstr(rc));
        sqlite3_close(db);
        throw std::runtime_error(message);
    }

    // The ingestor keeps writing while the archiver reads.
    sqlite3_busy_timeout(db, 5000);

    if (mode == OpenMode::ReadOnly)
        return;

    try
    {
        exec("PRAGMA journal_mode=WAL;");
        exec(createSql);
    }
    catch (...)
    {
        sqlite3_close(db);
        throw;
    }

    rc = sqlite3_prepare_v2(db, insertSql, -1, &insertStmt, nullptr);
    if (rc != SQLITE_OK)
    {
        std::string message = std::string("Failed to prepare insert statement: ") + sqlite3_errmsg(db);
        sqlite3_close(db);
        throw std::runtime_error(message);
    }
}

SQLiteStore::~SQLiteStore()
{
    if (insertStmt) sqlite3_finalize(insertStmt);
    if (db) sqlite3_close(db);
}

void SQLiteStore::exec(char const* sql)
{
    char* errMsg = nullptr;
    int rc = sqlite3_exec(db, sql, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK)
    {
        std::string message = errMsg ? errMsg : sqlite3_errstr(rc);
        if (errMsg) sqlite3_free(errMsg);
        throw std::runtime_error("SQLite: " + message);
    }
}

void SQLiteStore::requireWritable() const
{
    if (!insertStmt)
        throw std::runtime_error("SQLite store was opened read-only");
}

bool SQLiteStore::insert(VehiclePosition const& p)
{
    requireWritable();
    std::lock_guard<std::mutex> lock(mutex);
    return insertInternal(p);
}

bool SQLiteStore::insertInternal(VehiclePosition const& p)
{
    sqlite3_reset(insertStmt);
    sqlite3_clear_bindings(insertStmt);

    sqlite3_bind_text(insertStmt, 1, p.tripId.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(insertStmt, 2, p.routeId.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(insertStmt, 3, p.directionId);
    sqlite3_bind_int64(insertStmt, 4, static_cast<sqlite3_int64>(p.startTime));
    sqlite3_bind_int(insertStmt, 5, p.scheduleRelationship);
    sqlite3_bind_double(insertStmt, 6, p.latitude);
    sqlite3_bind_double(insertStmt, 7, p.longitude);
    sqlite3_bind_double(insertStmt, 8, p.bearing);
    sqlite3_bind_double(insertStmt, 9, p.odometer);
    sqlite3_bind_double(insertStmt, 10, p.speed);
    sqlite3_bind_int64(insertStmt, 11, static_cast<sqlite3_int64>(p.currentStopSequence));
    sqlite3_bind_text(insertStmt, 12, p.stopId.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(insertStmt, 13, p.currentStatus);
    sqlite3_bind_int64(insertStmt, 14, static_cast<sqlite3_int64>(p.timestamp));
    sqlite3_bind_int(insertStmt, 15, p.congestionLevel);
    sqlite3_bind_int(insertStmt, 16, p.occupancyStatus);
    sqlite3_bind_text(insertStmt, 17, p.vehicleId.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(insertStmt, 18, p.vehicleLabel.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(insertStmt, 19, p.licensePlate.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(insertStmt);
    if (rc != SQLITE_DONE)
        throw std::runtime_error(std::string("SQLite insert failed: ") + sqlite3_errmsg(db));

    return sqlite3_changes(db) > 0;
}

std::size_t SQLiteStore::insertMany(std::vector<VehiclePosition> const& positions)
{
    requireWritable();
    std::lock_guard<std::mutex> lock(mutex);

    exec("BEGIN TRANSACTION;");

    std::size_t inserted = 0;
    try
    {
        for (VehiclePosition const& p : positions)
        {
            if (insertInternal(p))
                ++inserted;
        }
        exec("COMMIT;");
    }
    catch (...)
    {
        sqlite3_reset(insertStmt);
        char* errMsg = nullptr;
        if (sqlite3_exec(db, "ROLLBACK;", nullptr, nullptr, &errMsg) != SQLITE_OK)
        {
            std::cerr << "[DB] Rollback failed: " << (errMsg ? errMsg : "unknown error") << "\n";
            if (errMsg) sqlite3_free(errMsg);
        }
        throw;
    }

    return inserted;
}

std::optional<std::pair<std::string, std::string>> SQLiteStore::archiveMonthBounds()
{
    std::lock_guard<std::mutex> lock(mutex);

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, boundsSql, -1, &stmt, nullptr) != SQLITE_OK)
    {
        throw ArchiveError(ArchiveError::Kind::Discovery,
            std::string("Failed to prepare archive range query: ") + sqlite3_errmsg(db));
    }

    int rc = sqlite3_step(stmt);
    if (rc != SQLITE_ROW)
    {
        std::string message = std::string("Archive range query failed: ") + sqlite3_errmsg(db);
        sqlite3_finalize(stmt);
        throw ArchiveError(ArchiveError::Kind::Discovery, message);
    }

    std::string minMonth = columnText(stmt, 0);
    std::string maxMonth = columnText(stmt, 1);
    sqlite3_finalize(stmt);

    if (minMonth.empty() || maxMonth.empty())
        return std::nullopt;

    return std::make_pair(minMonth, maxMonth);
}

PositionCursor SQLiteStore::queryWindow(int64_t from, int64_t until)
{
    std::lock_guard<std::mutex> lock(mutex);

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, windowSql, -1, &stmt, nullptr) != SQLITE_OK)
    {
        std::string message = std::string("Failed to prepare partition query: ") + sqlite3_errmsg(db);
        sqlite3_finalize(stmt);
        throw ArchiveError(ArchiveError::Kind::Io, message);
    }

    sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(from));
    sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(until));

    return PositionCursor(db, stmt);
}
