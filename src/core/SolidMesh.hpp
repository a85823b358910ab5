/**
 * @file SolidMesh.hpp
 * @brief Non-indexed triangle mesh for solid pieces
 *
 * Positions are stored as a flat triangle soup: every three consecutive
 * positions form one triangle and no vertex is shared between triangles.
 * Coordinates are in preview space (x, z planar meters, y vertical display
 * units). Triangles are wound counter-clockwise seen from outside, with the
 * normal computed as (b - a) x (c - a).
 */

#pragma once

#include "osmprint.hpp"
#include "Logger.hpp"
#include <array>
#include <utility>
#include <vector>

namespace osmprint {

/**
 * @brief Axis-aligned bounds of a mesh
 */
struct MeshBounds {
    Point3D min;
    Point3D max;
    bool valid = false;

    double height() const { return max.y() - min.y(); }
};

/**
 * @brief Triangle soup with primitive builders
 */
class SolidMesh {
public:
    SolidMesh();

    SolidMesh(SolidMesh&& other) noexcept
        : positions_(std::move(other.positions_)), logger_("SolidMesh") {}

    SolidMesh& operator=(SolidMesh&& other) noexcept {
        if (this != &other) {
            positions_ = std::move(other.positions_);
        }
        return *this;
    }

    SolidMesh(const SolidMesh&) = delete;
    SolidMesh& operator=(const SolidMesh&) = delete;

    void add_triangle(const Point3D& a, const Point3D& b, const Point3D& c);

    /**
     * @brief Extrude a closed (x, z) ring between two heights
     *
     * Produces top and bottom caps (CGAL convex partition) and side
     * walls. The ring may be in either orientation and must not repeat its
     * first vertex at the end.
     *
     * @return false if the ring has fewer than 3 vertices or no area
     */
    bool add_extruded_polygon(const std::vector<Point3D>& ring, double bottom_y, double top_y);

    /**
     * @brief Add a box centered at `center`, turned about the vertical axis
     * so its local +X axis follows the horizontal part of `direction`
     *
     * @param length Extent along the direction
     * @param height Vertical extent
     * @param width Horizontal extent across the direction
     */
    void add_oriented_box(const Point3D& center, const Eigen::Vector3d& direction,
                          double length, double height, double width);

    /**
     * @brief Add an axis-aligned box spanning [min, max]
     */
    void add_box(const Point3D& min, const Point3D& max);

    /**
     * @brief Add a flat upward-facing rectangle at height y
     */
    void add_plane(double min_x, double min_z, double max_x, double max_z, double y);

    const std::vector<Point3D>& positions() const { return positions_; }
    size_t vertex_count() const { return positions_.size(); }
    size_t triangle_count() const { return positions_.size() / 3; }
    bool empty() const { return positions_.empty(); }

    MeshBounds compute_bounds() const;

    /**
     * @brief Triangulate a simple or self-intersecting ring in the (x, z) plane
     *
     * Self-intersecting rings are repaired (even-odd rule) first; each simple
     * piece is split into convex parts and fanned.
     *
     * @return Triangles with y = 0, counter-clockwise in (x, z)
     */
    std::vector<std::array<Point3D, 3>> triangulate_ring(const std::vector<Point3D>& ring) const;

    /// Twice the signed (x, z) area; positive for counter-clockwise rings
    static double signed_area2(const std::vector<Point3D>& ring);

private:
    std::vector<Point3D> positions_;
    Logger logger_;

    void add_quad(const Eigen::Vector3d& a, const Eigen::Vector3d& b,
                  const Eigen::Vector3d& c, const Eigen::Vector3d& d);
};

} // namespace osmprint
