#include <cstdlib>
#include <stdexcept>
#include "ConfigurationManager.hpp"

std::string ConfigurationManager::fromEnv(const char* name, std::string const& fallback)
{
    const char* value = std::getenv(name);
    if (!value || *value == '\0') return fallback;
    return value;
}

std::string ConfigurationManager::targetFromEnv(const char* name, std::string const& fallback)
{
    std::string target = fromEnv(name, fallback);
    if (target.front() != '/')
        throw std::runtime_error(std::string(name) + " must be an absolute request path, got: " + target);
    return target;
}

ConfigurationManager::ConfigurationManager()
{
    city = fromEnv("FLEET_CITY", DEFAULT_CITY);
    host = fromEnv("FLEET_GBFS_HOST", DEFAULT_HOST);
    port = fromEnv("FLEET_GBFS_PORT", DEFAULT_PORT);

    stationInformation = {"station_information", targetFromEnv("FLEET_STATION_INFO_PATH", DEFAULT_STATION_INFO)};
    freeBikeStatus     = {"free_bike_status",    targetFromEnv("FLEET_BIKE_STATUS_PATH",  DEFAULT_BIKE_STATUS)};

    databasePath = fromEnv("FLEET_DB_PATH", "fleetTrips.db");
    exportPath   = fromEnv("FLEET_EXPORT_PATH", "data.json");
}

std::string const& ConfigurationManager::getCity() const noexcept { return city; }
std::string const& ConfigurationManager::getHost() const noexcept { return host; }
std::string const& ConfigurationManager::getPort() const noexcept { return port; }
FeedEndpoint const& ConfigurationManager::getStationInformation() const noexcept { return stationInformation; }
FeedEndpoint const& ConfigurationManager::getFreeBikeStatus() const noexcept { return freeBikeStatus; }
std::string const& ConfigurationManager::getDatabasePath() const noexcept { return databasePath; }
std::string const& ConfigurationManager::getExportPath() const noexcept { return exportPath; }
