#pragma once
#include <string>
#include <vector>
#include <mutex>
#include <optional>
#include <utility>
#include "sqlite3.h"
#include "Types.hpp"

// Forward-only cursor over rows of vehicle_positions. Owns its prepared
// statement; must not outlive the SQLiteStore that produced it.
class PositionCursor
{
private:
    sqlite3* db;
    sqlite3_stmt* stmt;

public:
    PositionCursor(sqlite3* connection, sqlite3_stmt* statement);
    PositionCursor(PositionCursor&& other) noexcept;
    PositionCursor(PositionCursor const&) = delete;
    PositionCursor& operator=(PositionCursor const&) = delete;
    PositionCursor& operator=(PositionCursor&&) = delete;
    ~PositionCursor();

    // Fills `out` with the next row. Returns false once the result set is
    // exhausted; throws ArchiveError on a step or decode failure.
    bool next(VehiclePosition& out);
};

enum class OpenMode
{
    ReadWrite,
    ReadOnly
};

class SQLiteStore
{
private:
    sqlite3* db;
    sqlite3_stmt* insertStmt;
    std::mutex mutex;

    void exec(char const* sql);
    void requireWritable() const;
    bool insertInternal(VehiclePosition const& p);

public:
    // ReadWrite creates the file and schema if needed and switches to WAL.
    // ReadOnly opens an existing store without touching it; inserts throw.
    explicit SQLiteStore(std::string const& path, OpenMode mode = OpenMode::ReadWrite);
    ~SQLiteStore();

    SQLiteStore(SQLiteStore const&) = delete;
    SQLiteStore& operator=(SQLiteStore const&) = delete;

    // Returns true when the row was new, false when (trip_id, timestamp)
    // was already present.
    bool insert(VehiclePosition const& p);
    std::size_t insertMany(std::vector<VehiclePosition> const& positions);

    // "YYYY-MM" months (UTC) of the oldest and newest valid timestamps, or
    // nothing when the store holds no row with timestamp > 0.
    std::optional<std::pair<std::string, std::string>> archiveMonthBounds();

    // Valid rows with from <= timestamp < until, ordered by timestamp.
    PositionCursor queryWindow(int64_t from, int64_t until);
};
