#include <gtest/gtest.h>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include "ReplayEngine.hpp"
#include "SQLiteStore.hpp"

namespace {

const char* STATIONS = R"({"last_updated": 1700000000, "ttl": 60, "data": {"stations": [
    {"station_id": "S1", "name": "Station One", "lat": 0.0, "lon": 0.0},
    {"station_id": "S2", "name": "Station Two", "lat": 0.0, "lon": 0.002}
]}})";

std::string bikeStatus(std::int64_t lastUpdated, double lon) {
    return "{\"last_updated\": " + std::to_string(lastUpdated) +
           ", \"ttl\": 60, \"data\": {\"bikes\": [{\"bike_id\": \"b1\", \"lat\": 0.0, \"lon\": " +
           std::to_string(lon) + ", \"is_disabled\": 0}]}}";
}

}

class ReplayEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = (std::filesystem::temp_directory_path() / "fleettrips_replay_test.rec").string();
        std::remove(path_.c_str());
    }

    void TearDown() override {
        std::remove(path_.c_str());
    }

    void record(std::vector<std::string> const& chunks) {
        std::ofstream out(path_, std::ios::binary);
        std::uint64_t t = 1700000000;
        for (auto const& c : chunks) {
            ASSERT_TRUE(ReplayEngine::writeChunk(out, t, c));
            t += 30;
        }
    }

    std::string path_;
};

TEST_F(ReplayEngineTest, ReplaysRecordedSession) {
    record({
        STATIONS,
        bikeStatus(1000, 0.0),
        bikeStatus(1000, 0.0),          // duplicate poll
        "<html>gateway timeout</html>", // undecodable poll
        bikeStatus(1300, 0.00205),
        bikeStatus(1400, 0.00205),
        bikeStatus(2000, 0.0),
    });

    SQLiteStore db(":memory:");
    auto trips = ReplayEngine::run(path_, db, false);

    ASSERT_EQ(trips.size(), 2u);
    EXPECT_EQ(trips[0].startStation.id, "S1");
    EXPECT_EQ(trips[0].endStation.id, "S2");
    EXPECT_EQ(trips[0].durationSeconds, 300);
    EXPECT_EQ(trips[1].startStation.id, "S2");
    EXPECT_EQ(trips[1].endStation.id, "S1");
    EXPECT_EQ(trips[1].startedAt, 1400);
    EXPECT_EQ(db.countTrips(), 2);
}

TEST_F(ReplayEngineTest, MissingFileThrows) {
    SQLiteStore db(":memory:");
    EXPECT_THROW(ReplayEngine::run(path_, db, false), std::runtime_error);
}

TEST_F(ReplayEngineTest, BadStationChunkThrows) {
    record({"not json", bikeStatus(1000, 0.0)});
    SQLiteStore db(":memory:");
    EXPECT_THROW(ReplayEngine::run(path_, db, false), std::runtime_error);
}

TEST_F(ReplayEngineTest, WriteFailureIsReported) {
    std::ofstream closed;
    EXPECT_FALSE(ReplayEngine::writeChunk(closed, 1700000000, STATIONS));
}

TEST(ReplaySessionTest, EachSessionGetsItsOwnFile) {
    EXPECT_EQ(ReplayEngine::sessionFileName(1700000000), "recordings/session-1700000000.rec");
    EXPECT_NE(ReplayEngine::sessionFileName(1700000000), ReplayEngine::sessionFileName(1700000030));
}
