#include <string>
#include <iostream>
#include <fstream>
#include <filesystem>
#include <future>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <ctime>
#include <stdexcept>
#include <vector>
#include <utility>
#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_future.hpp>
#include "ConfigurationManager.hpp"
#include "FleetTracker.hpp"
#include "GbfsClient.hpp"
#include "Parser.hpp"
#include "ReplayEngine.hpp"
#include "SQLiteStore.hpp"
#include "StationIndex.hpp"
#include "TimeFormat.hpp"
#include "TripExporter.hpp"
#include "Types.hpp"

boost::asio::awaitable<void> runPollingLoop(GbfsClient& client, boost::asio::io_context& io, FleetTracker& tracker, SQLiteStore& db, ConfigurationManager const& config, std::ofstream* recFile)
{
    boost::asio::steady_timer timer(io);
    FeedEndpoint const& feed = config.getFreeBikeStatus();

    for (;;)
    {
        // one extra second absorbs feed publication delays and clock skew
        std::chrono::seconds wait(1);

        try
        {
            std::string data = co_await client.fetch(feed.target);

            if (recFile && recFile->is_open() && !ReplayEngine::writeChunk(*recFile, static_cast<std::uint64_t>(std::time(nullptr)), data))
            {
                std::cerr << "[Poll] Recording stopped." << std::endl;
                recFile->close();
            }

            auto payload = Parser::parseBikeStatus(data);
            if (!payload)
            {
                std::cerr << "[Poll] Could not load " << feed.name << ", retrying in 1 second..." << std::endl;
            }
            else if (!tracker.isStale(*payload))
            {
                std::vector<Trip> trips = tracker.ingest(*payload);
                db.insertMany(trips);

                std::cout << "[Poll] updated " << config.getCity() << " at " << formatUtc(payload->lastUpdated)
                          << ": " << tracker.fleet().size() << " bikes tracked, "
                          << trips.size() << " new trips (" << tracker.trips().size() << " total)." << std::endl;
            }

            if (auto last = tracker.lastUpdatedAt())
            {
                std::int64_t expiresAt = *last + tracker.lastTtl();
                std::int64_t now = static_cast<std::int64_t>(std::time(nullptr));
                if (expiresAt > now)
                    wait += std::chrono::seconds(expiresAt - now);
            }
        }
        catch (std::exception const& e)
        {
            std::cerr << "Error fetching " << feed.name << ": " << e.what() << ", retrying in 1 second..." << std::endl;
        }

        timer.expires_after(wait);
        co_await timer.async_wait(boost::asio::use_awaitable);
    }
}

std::string fetchOnce(boost::asio::io_context& io, GbfsClient& client, std::string const& target)
{
    std::future<std::string> body = boost::asio::co_spawn(io, client.fetch(target), boost::asio::use_future);
    io.run();
    io.restart();
    return body.get();
}

void parseCommandLineArgs(int argc, char* argv[], bool& recordMode, bool& replayMode, bool& fastReplay, std::string& replayFile)
{
    recordMode = false;
    replayMode = false;
    fastReplay = false;
    replayFile.clear();

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];

        if (arg == "--record")
        {
            recordMode = true;
        }
        else if (arg == "--replay" && i + 1 < argc)
        {
            replayMode = true;
            replayFile = argv[++i];
        }
        else if (arg == "--fast")
        {
            fastReplay = true;
        }
        else
        {
            std::cerr << "Warning: ignoring unknown or malformed argument: " << arg << "\n";
        }
    }
}

int main(int argc, char* argv[])
{
    try
    {
        bool recordMode = false;
        bool replayMode = false;
        bool fastReplay = false;
        std::string replayFile;

        parseCommandLineArgs(argc, argv, recordMode, replayMode, fastReplay, replayFile);

        ConfigurationManager config;
        SQLiteStore db(config.getDatabasePath());

        if (replayMode)
        {
            std::vector<Trip> trips = ReplayEngine::run(replayFile, db, !fastReplay);
            TripExporter::writeJson(config.getExportPath(), trips);
            std::cout << "[System] Wrote " << trips.size() << " trips to " << config.getExportPath() << std::endl;
            return 0;
        }

        boost::asio::io_context io;
        GbfsClient client(io, config.getHost(), config.getPort());

        std::cout << "[System] Loading stations for " << config.getCity() << "..." << std::endl;
        std::string stationData = fetchOnce(io, client, config.getStationInformation().target);
        StationIndex stations(Parser::parseStations(stationData));
        FleetTracker tracker(stations);

        std::ofstream recFile;
        if (recordMode)
        {
            std::uint64_t startedAt = static_cast<std::uint64_t>(std::time(nullptr));
            std::string recPath = ReplayEngine::sessionFileName(startedAt);

            std::filesystem::create_directories("recordings");
            recFile.open(recPath, std::ios::binary | std::ios::trunc);
            if (!recFile.is_open())
                throw std::runtime_error("Could not open " + recPath);

            if (!ReplayEngine::writeChunk(recFile, startedAt, stationData))
                throw std::runtime_error("Could not write station information to " + recPath);
            std::cout << "[System] Recording activated. Saving to " << recPath << std::endl;
        }

        std::cout << "System Initialized.\n";

        boost::asio::signal_set signals(io, SIGINT, SIGTERM);
        signals.async_wait([&io](boost::system::error_code const& ec, int signo)
        {
            if (ec)
                return;
            std::cout << "\n[System] Caught signal " << signo << ", shutting down..." << std::endl;
            io.stop();
        });

        boost::asio::co_spawn(io, runPollingLoop(client, io, tracker, db, config, recordMode ? &recFile : nullptr),
            [](std::exception_ptr e)
            {
                if (e) std::rethrow_exception(e);
            });

        io.run();

        std::vector<Trip> trips = tracker.trips().sortedByStart();
        TripExporter::writeJson(config.getExportPath(), trips);
        std::cout << "[System] Wrote " << trips.size() << " trips to " << config.getExportPath() << std::endl;
    }
    catch (const std::exception& e)
    {
        std::cerr << "Main Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
