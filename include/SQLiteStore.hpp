#pragma once
#include <string>
#include <vector>
#include "sqlite3.h"
#include "Types.hpp"

class SQLiteStore
{
private:
    sqlite3* db;
    sqlite3_stmt* insertStmt;

    void insertInternal(Trip const& t);

public:
    // Throws std::runtime_error if the database cannot be opened or prepared.
    SQLiteStore(std::string const& path);
    ~SQLiteStore();

    SQLiteStore(SQLiteStore const&) = delete;
    SQLiteStore& operator=(SQLiteStore const&) = delete;

    void insert(Trip const& t);
    void insertMany(std::vector<Trip> const& trips);
    std::vector<Trip> getTrips();
    int countTrips();
};
