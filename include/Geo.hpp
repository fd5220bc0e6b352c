#pragma once

class Geo
{
public:
    static constexpr double EARTH_RADIUS_METERS = 6371000.0;

    // Equirectangular approximation, only meaningful over short distances.
    static double distanceMeters(double lat1, double lon1, double lat2, double lon2);

    template <typename A, typename B>
    static double distance(A const& a, B const& b)
    {
        return distanceMeters(a.lat, a.lon, b.lat, b.lon);
    }

private:
    static double toRadians(double degrees);
};
