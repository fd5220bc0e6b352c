#pragma once
#include <vector>
#include <cstddef>
#include <cstdint>
#include "Types.hpp"

// Append-only, kept in detection order.
class TripLog
{
private:
    std::vector<Trip> trips;

public:
    static Trip makeTrip(Station const& start, Station const& end, std::int64_t startedAt, std::int64_t endedAt);

    void append(Trip const& trip);
    void appendMany(std::vector<Trip> const& batch);

    std::vector<Trip> const& entries() const noexcept;
    std::size_t size() const noexcept;

    // Copy ordered by start time, ties keep detection order.
    std::vector<Trip> sortedByStart() const;
};
