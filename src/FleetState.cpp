#include "FleetState.hpp"

VehicleObservation* FleetState::find(std::string const& vehicleId)
{
    auto it = vehicles.find(vehicleId);
    if (it != vehicles.end())
        return &it->second;
    return nullptr;
}

VehicleObservation const* FleetState::find(std::string const& vehicleId) const
{
    auto it = vehicles.find(vehicleId);
    if (it != vehicles.end())
        return &it->second;
    return nullptr;
}

bool FleetState::contains(std::string const& vehicleId) const
{
    return vehicles.count(vehicleId) > 0;
}

void FleetState::track(VehicleObservation const& observation)
{
    vehicles[observation.id] = observation;
}

std::size_t FleetState::size() const noexcept
{
    return vehicles.size();
}
