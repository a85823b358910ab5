/**
 * @file BoundaryClipper.hpp
 * @brief Clipping of projected features against the rectangular region
 *
 * Closed rings are clipped with Sutherland-Hodgman and open polylines with
 * Cohen-Sutherland. Both work on the (x, z) plane against the same window.
 */

#pragma once

#include "osmprint.hpp"
#include "Projector.hpp"
#include "Logger.hpp"
#include <array>
#include <optional>
#include <utility>
#include <vector>

namespace osmprint {

using Polyline = std::vector<Point3D>;

/**
 * @brief Projected region rectangle stored as a closed counter-clockwise loop
 *
 * loop()[0] is the (min x, min z) corner and loop()[2] the (max x, max z)
 * corner. Width and depth are always strictly positive.
 */
class BoundaryWindow {
public:
    /**
     * @brief Build from two opposite projected corners in any order
     * @throws GeometryError if the rectangle has zero or non-finite extent
     */
    BoundaryWindow(const Point3D& corner_a, const Point3D& corner_b);

    /**
     * @brief Project the south-west and north-east corners of a region
     * @throws GeometryError if the projected rectangle is empty
     */
    static BoundaryWindow from_bounds(const GeoBounds& bounds, const Projector& projector);

    const std::array<Point3D, 4>& loop() const { return loop_; }

    double min_x() const { return loop_[0].x(); }
    double min_z() const { return loop_[0].z(); }
    double max_x() const { return loop_[2].x(); }
    double max_z() const { return loop_[2].z(); }

    double width() const { return max_x() - min_x(); }
    double depth() const { return max_z() - min_z(); }
    Point3D center() const { return Point3D((min_x() + max_x()) / 2.0, 0.0, (min_z() + max_z()) / 2.0); }

    /// Inclusive containment test on the (x, z) plane
    bool contains(const Point3D& p) const {
        return p.x() >= min_x() && p.x() <= max_x() && p.z() >= min_z() && p.z() <= max_z();
    }

private:
    std::array<Point3D, 4> loop_;
};

/**
 * @brief Polygon and polyline clipping against a BoundaryWindow
 */
class BoundaryClipper {
public:
    // Cohen-Sutherland region codes
    static constexpr int INSIDE = 0;
    static constexpr int LEFT = 1;    // x < min x
    static constexpr int RIGHT = 2;   // x > max x
    static constexpr int BOTTOM = 4;  // z < min z
    static constexpr int TOP = 8;     // z > max z

    explicit BoundaryClipper(const BoundaryWindow& window);

    /**
     * @brief Sutherland-Hodgman clip of a closed ring
     *
     * The subject is treated as closed (last vertex connects to the first).
     * A result with fewer than 3 points means the ring lies outside the
     * window; callers must skip it.
     */
    Polyline clip_polygon(const Polyline& subject) const;

    /**
     * @brief Cohen-Sutherland clip of an open polyline
     *
     * Each segment is clipped independently. Accepted segments that continue
     * from the previous output point are merged; a rejected or disconnected
     * segment starts a new sub-polyline.
     */
    std::vector<Polyline> clip_polyline(const Polyline& points) const;

    /**
     * @brief Clip one segment
     * @return The clipped endpoints, or nullopt if the segment is outside
     */
    std::optional<std::pair<Point3D, Point3D>> clip_segment(Point3D p1, Point3D p2) const;

    /// Region code of a point
    int compute_outcode(const Point3D& p) const;

    const BoundaryWindow& window() const { return window_; }

private:
    const BoundaryWindow& window_;
    Logger logger_;

    static bool is_inside(const Point3D& p, const Point3D& edge_start, const Point3D& edge_end);
    static Point3D intersection(const Point3D& s, const Point3D& e,
                                const Point3D& edge_start, const Point3D& edge_end);
};

} // namespace osmprint
