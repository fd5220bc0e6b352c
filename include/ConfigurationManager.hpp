#pragma once
#include <string>

struct FeedEndpoint
{
    std::string name;
    std::string target;
};

class ConfigurationManager
{
private:
    std::string city;
    std::string host;
    std::string port;
    FeedEndpoint stationInformation;
    FeedEndpoint freeBikeStatus;
    std::string databasePath;
    std::string exportPath;

    static std::string fromEnv(const char* name, std::string const& fallback);
    static std::string targetFromEnv(const char* name, std::string const& fallback);

public:
    // Berlin nextbike, overridable through FLEET_* environment variables.
    static inline const std::string DEFAULT_CITY         = "Berlin";
    static inline const std::string DEFAULT_HOST         = "gbfs.nextbike.net";
    static inline const std::string DEFAULT_PORT         = "443";
    static inline const std::string DEFAULT_STATION_INFO = "/maps/gbfs/v1/nextbike_bn/de/station_information.json";
    static inline const std::string DEFAULT_BIKE_STATUS  = "/maps/gbfs/v1/nextbike_bn/de/free_bike_status.json";

    ConfigurationManager();

    [[nodiscard]] std::string const& getCity() const noexcept;
    [[nodiscard]] std::string const& getHost() const noexcept;
    [[nodiscard]] std::string const& getPort() const noexcept;
    [[nodiscard]] FeedEndpoint const& getStationInformation() const noexcept;
    [[nodiscard]] FeedEndpoint const& getFreeBikeStatus() const noexcept;
    [[nodiscard]] std::string const& getDatabasePath() const noexcept;
    [[nodiscard]] std::string const& getExportPath() const noexcept;
};
