/**
 * @file Projector.hpp
 * @brief Local tangent-plane projection of geographic coordinates
 *
 * Equirectangular approximation around the region center, valid for areas of
 * a few kilometers. Both planar axes are negated relative to the raw
 * coordinate differences to match the preview's viewing convention.
 */

#pragma once

#include "osmprint.hpp"

namespace osmprint {

/// Meters per degree of longitude at the equator
constexpr double kMetersPerDegreeLon = 111320.0;
/// Meters per degree of latitude
constexpr double kMetersPerDegreeLat = 110574.0;

/**
 * @brief Maps (lat, lon) to planar (x, 0, z) meters around a fixed center
 */
class Projector {
public:
    Projector(double center_lat, double center_lon)
        : center_lat_(center_lat), center_lon_(center_lon) {}

    explicit Projector(const GeoBounds& bounds)
        : Projector(bounds.center_lat(), bounds.center_lon()) {}

    /**
     * @brief Project a coordinate relative to this projector's center
     */
    Point3D project(double lat, double lon) const {
        return project(lat, lon, center_lat_, center_lon_);
    }

    /**
     * @brief Project a coordinate relative to an explicit center
     *
     * x = -(lon - center_lon) * 111320 * cos(lat), z = -(lat - center_lat) * 110574.
     * The cosine uses the point's own latitude. y is always 0.
     */
    static Point3D project(double lat, double lon, double center_lat, double center_lon);

    double center_lat() const { return center_lat_; }
    double center_lon() const { return center_lon_; }

private:
    double center_lat_;
    double center_lon_;
};

} // namespace osmprint
