#include <iostream>
#include <stdexcept>
#include "TimeFormat.hpp"
#include "SQLiteStore.hpp"

namespace
{
    std::string columnText(sqlite3_stmt* stmt, int col)
    {
        const unsigned char* text = sqlite3_column_text(stmt, col);
        return text ? reinterpret_cast<const char*>(text) : "";
    }
}

SQLiteStore::SQLiteStore(std::string const& path)
    : db(nullptr), insertStmt(nullptr)
{
    int rc = sqlite3_open(path.c_str(), &db);
    if (rc != SQLITE_OK)
    {
        std::string msg = db ? sqlite3_errmsg(db) : "out of memory";
        if (db) sqlite3_close(db);
        throw std::runtime_error("Failed to open SQLite DB " + path + ": " + msg);
    }

    const char* createSql =
        "CREATE TABLE IF NOT EXISTS Trips ("
        "  id INTEGER PRIMARY KEY AUTOINCREMENT, "
        "  startedAtEpoch INTEGER, "
        "  endedAtEpoch INTEGER, "
        "  started_at TEXT, "
        "  ended_at TEXT, "
        "  duration INTEGER, "
        "  start_station_id TEXT, "
        "  start_station_name TEXT, "
        "  start_station_latitude REAL, "
        "  start_station_longitude REAL, "
        "  end_station_id TEXT, "
        "  end_station_name TEXT, "
        "  end_station_latitude REAL, "
        "  end_station_longitude REAL"
        ");"
        "CREATE INDEX IF NOT EXISTS TripsByStart ON Trips (startedAtEpoch);";

    char* errMsg = nullptr;
    rc = sqlite3_exec(db, createSql, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK)
    {
        std::string msg = errMsg ? errMsg : "unknown error";
        if (errMsg) sqlite3_free(errMsg);
        sqlite3_close(db);
        throw std::runtime_error("Failed to create tables: " + msg);
    }

    const char* insertSql =
        "INSERT INTO Trips "
        "(startedAtEpoch, endedAtEpoch, started_at, ended_at, duration, "
        " start_station_id, start_station_name, start_station_latitude, start_station_longitude, "
        " end_station_id, end_station_name, end_station_latitude, end_station_longitude) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);";

    rc = sqlite3_prepare_v2(db, insertSql, -1, &insertStmt, nullptr);
    if (rc != SQLITE_OK)
    {
        std::string msg = sqlite3_errmsg(db);
        sqlite3_close(db);
        throw std::runtime_error("Failed to prepare insert statement: " + msg);
    }
}

SQLiteStore::~SQLiteStore()
{
    if (insertStmt) sqlite3_finalize(insertStmt);
    if (db) sqlite3_close(db);
}

void SQLiteStore::insert(Trip const& t)
{
    insertInternal(t);
}

void SQLiteStore::insertInternal(Trip const& t)
{
    sqlite3_reset(insertStmt);

    std::string startedAt = formatUtc(t.startedAt);
    std::string endedAt   = formatUtc(t.endedAt);

    sqlite3_bind_int64(insertStmt, 1, static_cast<sqlite3_int64>(t.startedAt));
    sqlite3_bind_int64(insertStmt, 2, static_cast<sqlite3_int64>(t.endedAt));
    sqlite3_bind_text(insertStmt, 3, startedAt.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(insertStmt, 4, endedAt.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(insertStmt, 5, static_cast<sqlite3_int64>(t.durationSeconds));
    sqlite3_bind_text(insertStmt, 6, t.startStation.id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(insertStmt, 7, t.startStation.name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_double(insertStmt, 8, t.startStation.lat);
    sqlite3_bind_double(insertStmt, 9, t.startStation.lon);
    sqlite3_bind_text(insertStmt, 10, t.endStation.id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(insertStmt, 11, t.endStation.name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_double(insertStmt, 12, t.endStation.lat);
    sqlite3_bind_double(insertStmt, 13, t.endStation.lon);

    int rc = sqlite3_step(insertStmt);
    if (rc != SQLITE_DONE)
    {
        std::cerr << "SQLite insert failed: " << sqlite3_errmsg(db) << "\n";
    }
}

void SQLiteStore::insertMany(std::vector<Trip> const& trips)
{
    if (trips.empty())
        return;

    if (sqlite3_exec(db, "BEGIN TRANSACTION;", nullptr, nullptr, nullptr) != SQLITE_OK)
        std::cerr << "SQLite begin failed: " << sqlite3_errmsg(db) << "\n";

    for (Trip const& t : trips)
        insertInternal(t);

    if (sqlite3_exec(db, "COMMIT;", nullptr, nullptr, nullptr) != SQLITE_OK)
        std::cerr << "SQLite commit failed: " << sqlite3_errmsg(db) << "\n";
}

std::vector<Trip> SQLiteStore::getTrips()
{
    std::vector<Trip> results;
    const char* sql =
        "SELECT startedAtEpoch, endedAtEpoch, duration, "
        "  start_station_id, start_station_name, start_station_latitude, start_station_longitude, "
        "  end_station_id, end_station_name, end_station_latitude, end_station_longitude "
        "FROM Trips "
        "ORDER BY startedAtEpoch ASC, id ASC;";

    sqlite3_stmt* stmt = nullptr;

    int rc = sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK)
    {
        std::cerr << "Failed to prepare getTrips: "
                  << sqlite3_errmsg(db) << "\n";
        return results;
    }

    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW)
    {
        Trip t;
        t.startedAt       = sqlite3_column_int64(stmt, 0);
        t.endedAt         = sqlite3_column_int64(stmt, 1);
        t.durationSeconds = sqlite3_column_int64(stmt, 2);

        t.startStation.id   = columnText(stmt, 3);
        t.startStation.name = columnText(stmt, 4);
        t.startStation.lat  = sqlite3_column_double(stmt, 5);
        t.startStation.lon  = sqlite3_column_double(stmt, 6);

        t.endStation.id   = columnText(stmt, 7);
        t.endStation.name = columnText(stmt, 8);
        t.endStation.lat  = sqlite3_column_double(stmt, 9);
        t.endStation.lon  = sqlite3_column_double(stmt, 10);

        results.push_back(std::move(t));
    }

    if (rc != SQLITE_DONE)
    {
        std::cerr << "Error stepping getTrips: "
                  << sqlite3_errmsg(db) << "\n";
    }

    sqlite3_finalize(stmt);
    return results;
}

int SQLiteStore::countTrips()
{
    sqlite3_stmt* stmt = nullptr;
    int result = -1;

    if (sqlite3_prepare_v2(db, "SELECT count(*) FROM Trips", -1, &stmt, nullptr) == SQLITE_OK)
    {
        if (sqlite3_step(stmt) == SQLITE_ROW)
            result = sqlite3_column_int(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return result;
}
