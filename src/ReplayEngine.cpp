#include "ReplayEngine.hpp"
#include <iostream>
#include <stdexcept>
#include <thread>
#include <chrono>
#include <ctime>
#include "FleetTracker.hpp"
#include "Parser.hpp"
#include "SQLiteStore.hpp"
#include "StationIndex.hpp"

bool ReplayEngine::writeChunk(std::ofstream& file, std::uint64_t timestamp, std::string const& data)
{
    std::uint32_t size = static_cast<std::uint32_t>(data.size());
    file.write(reinterpret_cast<const char*>(&timestamp), sizeof(timestamp));
    file.write(reinterpret_cast<const char*>(&size), sizeof(size));
    file.write(data.data(), size);
    file.flush();

    if (!file.good())
    {
        std::cerr << "[RECORD] Failed to write chunk (T=" << timestamp << ", "
                  << size << " bytes), recording is incomplete." << std::endl;
        return false;
    }
    return true;
}

std::string ReplayEngine::sessionFileName(std::uint64_t startedAt)
{
    return "recordings/session-" + std::to_string(startedAt) + ".rec";
}

bool ReplayEngine::readChunk(std::ifstream& file, std::uint64_t& timestamp, std::string& data)
{
    std::uint32_t size = 0;
    file.read(reinterpret_cast<char*>(&timestamp), sizeof(timestamp));
    file.read(reinterpret_cast<char*>(&size), sizeof(size));

    if (file.eof() || !file.good())
        return false;

    data.assign(size, '\0');
    file.read(&data[0], size);

    if (static_cast<std::uint32_t>(file.gcount()) != size)
    {
        std::cerr << "[REPLAY] Truncated chunk at T=" << timestamp << ", stopping." << std::endl;
        return false;
    }
    return true;
}

void ReplayEngine::syncRealtime(std::uint64_t timestamp, std::uint64_t& replayStart, std::uint64_t realStart)
{
    if (replayStart == 0)
    {
        replayStart = timestamp;
    }

    std::uint64_t recordingDelta = timestamp - replayStart;
    std::uint64_t realDelta      = static_cast<std::uint64_t>(std::time(nullptr)) - realStart;

    if (recordingDelta > realDelta)
    {
        std::uint64_t waitSeconds = recordingDelta - realDelta;
        if (waitSeconds > 1)
        {
            std::cout << "[REPLAY] Syncing... sleeping for "
                      << waitSeconds << "s" << std::endl;
        }
        std::this_thread::sleep_for(std::chrono::seconds(waitSeconds));
    }
}

void ReplayEngine::processChunk(std::string const& data, std::uint64_t timestamp, FleetTracker& tracker, SQLiteStore& db)
{
    auto payload = Parser::parseBikeStatus(data);
    if (!payload)
    {
        std::cerr << "[REPLAY] Skipping undecodable chunk (Recorded T=" << timestamp << ")" << std::endl;
        return;
    }

    if (tracker.isStale(*payload))
        return;

    auto trips = tracker.ingest(*payload);
    db.insertMany(trips);

    std::cout << "[REPLAY] Snapshot " << payload->lastUpdated
              << " (Recorded T=" << timestamp << "): "
              << tracker.fleet().size() << " bikes tracked, "
              << trips.size() << " new trips." << std::endl;
}

std::vector<Trip> ReplayEngine::run(std::string const& filename, SQLiteStore& db, bool realtime)
{
    std::ifstream file(filename, std::ios::binary);
    if (!file.is_open())
        throw std::runtime_error("Failed to open replay file: " + filename);

    std::uint64_t timestamp = 0;
    std::string data;
    if (!readChunk(file, timestamp, data))
        throw std::runtime_error("Replay file has no station information chunk: " + filename);

    StationIndex stations(Parser::parseStations(data));
    FleetTracker tracker(stations);

    std::cout << ">>> STARTING REPLAY MODE (" << (realtime ? "1:1 SPEED" : "FAST") << ") <<<" << std::endl;

    std::uint64_t replayStart = 0;
    std::uint64_t realStart   = static_cast<std::uint64_t>(std::time(nullptr));

    while (file.peek() != EOF)
    {
        if (!readChunk(file, timestamp, data))
            break;

        if (realtime)
            syncRealtime(timestamp, replayStart, realStart);

        processChunk(data, timestamp, tracker, db);
    }

    std::cout << ">>> REPLAY COMPLETE: " << tracker.trips().size() << " trips <<<" << std::endl;
    return tracker.trips().sortedByStart();
}
