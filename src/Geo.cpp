#include <cmath>
#include "Geo.hpp"

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

double Geo::distanceMeters(double lat1, double lon1, double lat2, double lon2)
{
    double phi1 = toRadians(lat1);
    double phi2 = toRadians(lat2);
    double dLat = phi2 - phi1;
    double dLon = toRadians(lon2 - lon1);
    double meanLat = (phi1 + phi2) / 2.0;

    double x = std::cos(meanLat) * dLon;
    return EARTH_RADIUS_METERS * std::sqrt(dLat * dLat + x * x);
}

double Geo::toRadians(double degrees)
{
    return degrees * M_PI / 180.0;
}
