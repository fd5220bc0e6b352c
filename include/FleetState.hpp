#pragma once
#include <string>
#include <unordered_map>
#include <cstddef>
#include "Types.hpp"

// Last known at-rest observation per vehicle id.
class FleetState
{
private:
    std::unordered_map<std::string, VehicleObservation> vehicles;

public:
    VehicleObservation* find(std::string const& vehicleId);
    VehicleObservation const* find(std::string const& vehicleId) const;
    bool contains(std::string const& vehicleId) const;

    void track(VehicleObservation const& observation);

    std::size_t size() const noexcept;
};
