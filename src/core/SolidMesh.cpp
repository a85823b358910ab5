/**
 * @file SolidMesh.cpp
 * @brief Triangle soup construction: extrusions, boxes and planes
 */

#include "SolidMesh.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <list>

// CGAL includes for robust polygon triangulation
#include <CGAL/Exact_predicates_inexact_constructions_kernel.h>
#include <CGAL/Polygon_2.h>
#include <CGAL/partition_2.h>
#include <CGAL/Polygon_repair/repair.h>
#include <CGAL/Multipolygon_with_holes_2.h>

namespace osmprint {

namespace {

// Rings with less doubled area than this (m^2) cannot be extruded
constexpr double kMinRingArea2 = 1e-12;

} // namespace

SolidMesh::SolidMesh() : logger_("SolidMesh") {}

void SolidMesh::add_triangle(const Point3D& a, const Point3D& b, const Point3D& c) {
    positions_.push_back(a);
    positions_.push_back(b);
    positions_.push_back(c);
}

void SolidMesh::add_quad(const Eigen::Vector3d& a, const Eigen::Vector3d& b,
                         const Eigen::Vector3d& c, const Eigen::Vector3d& d) {
    add_triangle(Point3D::from_eigen(a), Point3D::from_eigen(b), Point3D::from_eigen(c));
    add_triangle(Point3D::from_eigen(a), Point3D::from_eigen(c), Point3D::from_eigen(d));
}

double SolidMesh::signed_area2(const std::vector<Point3D>& ring) {
    if (ring.empty()) return 0.0;

    // Relative to the first vertex to keep large projected coordinates from cancelling
    const Point3D& origin = ring.front();
    double area2 = 0.0;
    for (size_t i = 0; i < ring.size(); ++i) {
        const Point3D& p = ring[i];
        const Point3D& q = ring[(i + 1) % ring.size()];
        area2 += (p.x() - origin.x()) * (q.z() - origin.z()) - (q.x() - origin.x()) * (p.z() - origin.z());
    }
    return area2;
}

MeshBounds SolidMesh::compute_bounds() const {
    MeshBounds bounds;
    if (positions_.empty()) {
        return bounds;
    }

    double min_x = std::numeric_limits<double>::max(), max_x = std::numeric_limits<double>::lowest();
    double min_y = std::numeric_limits<double>::max(), max_y = std::numeric_limits<double>::lowest();
    double min_z = std::numeric_limits<double>::max(), max_z = std::numeric_limits<double>::lowest();
    for (const auto& p : positions_) {
        min_x = std::min(min_x, p.x()); max_x = std::max(max_x, p.x());
        min_y = std::min(min_y, p.y()); max_y = std::max(max_y, p.y());
        min_z = std::min(min_z, p.z()); max_z = std::max(max_z, p.z());
    }
    bounds.min = Point3D(min_x, min_y, min_z);
    bounds.max = Point3D(max_x, max_y, max_z);
    bounds.valid = true;
    return bounds;
}

// ============================================================================
// Polygon Triangulation
// ============================================================================

std::vector<std::array<Point3D, 3>> SolidMesh::triangulate_ring(const std::vector<Point3D>& ring) const {
    std::vector<std::array<Point3D, 3>> triangles;
    if (ring.size() < 3) return triangles;

    // std::list container is required by the partition algorithms
    using K = CGAL::Exact_predicates_inexact_constructions_kernel;
    using Point_2 = K::Point_2;
    using Polygon_2 = CGAL::Polygon_2<K, std::list<Point_2>>;
    using Polygon_list = std::list<Polygon_2>;
    using Multipolygon_2 = CGAL::Multipolygon_with_holes_2<K, std::list<Point_2>>;

    Polygon_2 polygon;
    for (const auto& v : ring) {
        polygon.push_back(Point_2(v.x(), v.z()));
    }

    // orientation() requires a simple polygon, so repair first when needed
    std::vector<Polygon_2> simple_polygons;
    if (!polygon.is_simple()) {
        logger_.debug("Repairing self-intersecting ring with " + std::to_string(ring.size()) + " vertices");
        Multipolygon_2 repaired = CGAL::Polygon_repair::repair(polygon, CGAL::Polygon_repair::Even_odd_rule());

        for (const auto& poly_with_holes : repaired.polygons_with_holes()) {
            Polygon_2 outer = poly_with_holes.outer_boundary();
            if (outer.orientation() == CGAL::CLOCKWISE) {
                outer.reverse_orientation();
            }
            simple_polygons.push_back(outer);
            if (poly_with_holes.number_of_holes() > 0) {
                logger_.warning("Repaired footprint has " + std::to_string(poly_with_holes.number_of_holes()) +
                                " holes; filling them");
            }
        }
    } else {
        if (polygon.orientation() == CGAL::CLOCKWISE) {
            polygon.reverse_orientation();
        }
        simple_polygons.push_back(polygon);
    }

    for (const auto& simple_poly : simple_polygons) {
        Polygon_list convex_parts;
        CGAL::approx_convex_partition_2(simple_poly.vertices_begin(),
                                        simple_poly.vertices_end(),
                                        std::back_inserter(convex_parts));

        // Fans are valid on convex, counter-clockwise parts
        for (const auto& part : convex_parts) {
            if (part.size() < 3) continue;
            std::vector<Point3D> pts;
            pts.reserve(part.size());
            for (auto vit = part.vertices_begin(); vit != part.vertices_end(); ++vit) {
                pts.emplace_back(CGAL::to_double(vit->x()), 0.0, CGAL::to_double(vit->y()));
            }
            for (size_t i = 1; i + 1 < pts.size(); ++i) {
                triangles.push_back({pts[0], pts[i], pts[i + 1]});
            }
        }
    }

    return triangles;
}

// ============================================================================
// Primitive Builders
// ============================================================================

bool SolidMesh::add_extruded_polygon(const std::vector<Point3D>& ring, double bottom_y, double top_y) {
    if (ring.size() < 3) {
        logger_.debug("Ring must have at least 3 vertices for extrusion");
        return false;
    }

    const double area2 = signed_area2(ring);
    if (std::abs(area2) < kMinRingArea2) {
        logger_.debug("Ring has no area, extrusion skipped");
        return false;
    }

    std::vector<Point3D> ccw_ring = ring;
    if (area2 < 0.0) {
        std::reverse(ccw_ring.begin(), ccw_ring.end());
    }

    const auto cap_triangles = triangulate_ring(ccw_ring);
    if (cap_triangles.empty()) {
        logger_.debug("Ring triangulation produced no triangles");
        return false;
    }

    // Caps: counter-clockwise in (x, z) faces -y, so the top cap is reversed
    for (const auto& tri : cap_triangles) {
        add_triangle(Point3D(tri[0].x(), top_y, tri[0].z()),
                     Point3D(tri[2].x(), top_y, tri[2].z()),
                     Point3D(tri[1].x(), top_y, tri[1].z()));
        add_triangle(Point3D(tri[0].x(), bottom_y, tri[0].z()),
                     Point3D(tri[1].x(), bottom_y, tri[1].z()),
                     Point3D(tri[2].x(), bottom_y, tri[2].z()));
    }

    // Side walls, one quad per boundary edge
    for (size_t i = 0; i < ccw_ring.size(); ++i) {
        const Point3D& current = ccw_ring[i];
        const Point3D& next = ccw_ring[(i + 1) % ccw_ring.size()];

        Point3D bottom_current(current.x(), bottom_y, current.z());
        Point3D top_current(current.x(), top_y, current.z());
        Point3D bottom_next(next.x(), bottom_y, next.z());
        Point3D top_next(next.x(), top_y, next.z());

        add_triangle(bottom_current, top_current, top_next);
        add_triangle(bottom_current, top_next, bottom_next);
    }

    logger_.trace("Extruded ring: " + std::to_string(ccw_ring.size()) + " vertices, " +
                  std::to_string(cap_triangles.size()) + " cap triangles");
    return true;
}

void SolidMesh::add_oriented_box(const Point3D& center, const Eigen::Vector3d& direction,
                                 double length, double height, double width) {
    // Yaw about +Y that takes local +X onto the horizontal direction
    double yaw = 0.0;
    if (std::hypot(direction.x(), direction.z()) > 0.0) {
        yaw = std::atan2(-direction.z(), direction.x());
    }
    const Eigen::Quaterniond rotation(Eigen::AngleAxisd(yaw, Eigen::Vector3d::UnitY()));

    Eigen::Affine3d placement = Eigen::Translation3d(center.to_eigen()) * rotation;

    const Eigen::Vector3d half(length / 2.0, height / 2.0, width / 2.0);
    auto corner = [&](int ix, int iy, int iz) {
        Eigen::Vector3d local(ix ? half.x() : -half.x(), iy ? half.y() : -half.y(), iz ? half.z() : -half.z());
        return Eigen::Vector3d(placement * local);
    };

    add_quad(corner(0, 0, 0), corner(0, 0, 1), corner(0, 1, 1), corner(0, 1, 0));  // -X
    add_quad(corner(1, 0, 0), corner(1, 1, 0), corner(1, 1, 1), corner(1, 0, 1));  // +X
    add_quad(corner(0, 0, 0), corner(1, 0, 0), corner(1, 0, 1), corner(0, 0, 1));  // -Y
    add_quad(corner(0, 1, 0), corner(0, 1, 1), corner(1, 1, 1), corner(1, 1, 0));  // +Y
    add_quad(corner(0, 0, 0), corner(0, 1, 0), corner(1, 1, 0), corner(1, 0, 0));  // -Z
    add_quad(corner(0, 0, 1), corner(1, 0, 1), corner(1, 1, 1), corner(0, 1, 1));  // +Z
}

void SolidMesh::add_box(const Point3D& min, const Point3D& max) {
    const Point3D center((min.x() + max.x()) / 2.0, (min.y() + max.y()) / 2.0, (min.z() + max.z()) / 2.0);
    add_oriented_box(center, Eigen::Vector3d::UnitX(),
                     max.x() - min.x(), max.y() - min.y(), max.z() - min.z());
}

void SolidMesh::add_plane(double min_x, double min_z, double max_x, double max_z, double y) {
    add_quad(Eigen::Vector3d(min_x, y, min_z), Eigen::Vector3d(min_x, y, max_z),
             Eigen::Vector3d(max_x, y, max_z), Eigen::Vector3d(max_x, y, min_z));
}

} // namespace osmprint
