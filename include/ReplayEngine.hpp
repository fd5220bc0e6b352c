#pragma once

#include <string>
#include <fstream>
#include <vector>
#include <cstdint>
#include "Types.hpp"

class SQLiteStore;
class FleetTracker;

// Session files (recordings/session-<epoch>.rec) are a sequence of [u64 fetch time][u32 size][body] chunks.
// The first chunk is station_information, every later one free_bike_status.
class ReplayEngine
{
public:
    // Returns the replayed trip log ordered by start time.
    static std::vector<Trip> run(std::string const& filename, SQLiteStore& db, bool realtime);

    // Logs and returns false when the chunk did not reach the file.
    static bool writeChunk(std::ofstream& file, std::uint64_t timestamp, std::string const& data);

    // One file per recording session, so each starts with its own stations.
    static std::string sessionFileName(std::uint64_t startedAt);

private:
    static bool readChunk(std::ifstream& file, std::uint64_t& timestamp, std::string& data);
    static void syncRealtime(std::uint64_t timestamp, std::uint64_t& replayStart, std::uint64_t realStart);
    static void processChunk(std::string const& data, std::uint64_t timestamp, FleetTracker& tracker, SQLiteStore& db);
};
