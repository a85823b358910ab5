/**
 * @file Projector.cpp
 * @brief Local tangent-plane projection
 */

#include "Projector.hpp"
#include <cmath>
#include <numbers>

namespace osmprint {

Point3D Projector::project(double lat, double lon, double center_lat, double center_lon) {
    const double lat_radians = lat * std::numbers::pi / 180.0;
    const double x = -(lon - center_lon) * kMetersPerDegreeLon * std::cos(lat_radians);
    const double z = -(lat - center_lat) * kMetersPerDegreeLat;
    return Point3D(x, 0.0, z);
}

} // namespace osmprint
