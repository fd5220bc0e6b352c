#include <gtest/gtest.h>
#include <stdexcept>
#include "Geo.hpp"
#include "StationIndex.hpp"

namespace {

std::vector<Station> berlinStations() {
    return {
        {"101", "Alexanderplatz", 52.5219, 13.4132},
        {"102", "Brandenburger Tor", 52.5163, 13.3777},
        {"103", "Potsdamer Platz", 52.5096, 13.3759},
        {"104", "Warschauer Str", 52.5058, 13.4493},
    };
}

}

TEST(StationIndexTest, EmptyListIsFatal) {
    EXPECT_THROW(StationIndex(std::vector<Station>{}), std::runtime_error);
}

TEST(StationIndexTest, SortsByLongitude) {
    StationIndex index(berlinStations());
    ASSERT_EQ(index.size(), 4u);

    auto const& sorted = index.sorted();
    for (std::size_t i = 1; i < sorted.size(); ++i) {
        EXPECT_LE(sorted[i - 1].lon, sorted[i].lon);
    }
    EXPECT_EQ(sorted.front().id, "103");
    EXPECT_EQ(sorted.back().id, "104");
}

TEST(StationIndexTest, ExactPositionMatchesStation) {
    StationIndex index(berlinStations());
    Station s = index.nearest(52.5163, 13.3777);
    EXPECT_EQ(s.id, "102");
    EXPECT_EQ(s.name, "Brandenburger Tor");
    EXPECT_DOUBLE_EQ(s.lat, 52.5163);
    EXPECT_DOUBLE_EQ(s.lon, 13.3777);
}

TEST(StationIndexTest, MatchesLeftAndRightNeighbours) {
    StationIndex index(std::vector<Station>{{"1", "West", 0.0, 0.0}, {"2", "East", 0.0, 0.002}});

    // just east of West, the station is the left neighbour
    EXPECT_EQ(index.nearest(0.0, 0.00005).id, "1");
    // just west of East, the station is the right neighbour
    EXPECT_EQ(index.nearest(0.0, 0.00195).id, "2");
    // outside both ends of the sorted array
    EXPECT_EQ(index.nearest(0.0, -0.00005).id, "1");
    EXPECT_EQ(index.nearest(0.0, 0.00205).id, "2");
}

TEST(StationIndexTest, PrefersCloserNeighbour) {
    StationIndex index(std::vector<Station>{{"1", "Left", 0.0, 0.0}, {"2", "Right", 0.0, 0.00012}});
    // 4.4 m to Left, 8.9 m to Right
    EXPECT_EQ(index.nearest(0.0, 0.00004).id, "1");
    // 8.9 m to Left, 4.4 m to Right
    EXPECT_EQ(index.nearest(0.0, 0.00008).id, "2");
}

TEST(StationIndexTest, SharedLongitudeCandidatesAreAllConsidered) {
    StationIndex index(std::vector<Station>{
        {"a", "North", 0.001, 0.0},
        {"b", "Center", 0.0, 0.0},
        {"c", "South", -0.001, 0.0},
        {"d", "Far east", 0.0, 0.01},
    });
    EXPECT_EQ(index.nearest(0.00002, 0.0).id, "b");
    EXPECT_EQ(index.nearest(-0.00098, 0.0).id, "c");
}

TEST(StationIndexTest, MatchRadiusIsTenMeters) {
    StationIndex index(std::vector<Station>{{"1", "Only", 0.0, 0.0}});

    // 0.00008 deg is 8.9 m, 0.0001 deg is 11.1 m
    EXPECT_EQ(index.nearest(0.0, 0.00008).id, "1");
    EXPECT_EQ(index.nearest(0.0, 0.0001).id, StationIndex::FLEX_PARKING_ID);
}

TEST(StationIndexTest, FarPointYieldsFlexParkingAtQueryPoint) {
    // nearest station roughly 500 m east
    StationIndex index(std::vector<Station>{{"1", "Somewhere", 10.0, 10.00457}, {"2", "Elsewhere", 11.0, 12.0}});
    ASSERT_GT(Geo::distanceMeters(10.0, 10.0, 10.0, 10.00457), 490.0);

    Station s = index.nearest(10.0, 10.0);
    EXPECT_EQ(s.id, "0");
    EXPECT_EQ(s.name, "Flex parking");
    EXPECT_DOUBLE_EQ(s.lat, 10.0);
    EXPECT_DOUBLE_EQ(s.lon, 10.0);
}

TEST(StationIndexTest, OnlyLongitudeNeighboursAreSearched) {
    // "Hidden" is 5.5 m from the query but not adjacent in longitude order
    StationIndex index(std::vector<Station>{
        {"hidden", "Hidden", 0.0, 0.0},
        {"mid", "Mid", 1.0, 0.00001},
        {"far", "Far", 1.0, 0.0001},
    });
    ASSERT_LT(Geo::distanceMeters(0.0, 0.00005, 0.0, 0.0), 10.0);

    Station s = index.nearest(0.0, 0.00005);
    EXPECT_EQ(s.id, StationIndex::FLEX_PARKING_ID);
}

TEST(StationIndexTest, PointOverloadUsesObservationPosition) {
    StationIndex index(berlinStations());
    VehicleObservation v{"bike", 52.52191, 13.41321, 0, true};
    EXPECT_EQ(index.nearest(v).id, "101");
}
