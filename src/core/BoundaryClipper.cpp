/**
 * @file BoundaryClipper.cpp
 * @brief Sutherland-Hodgman and Cohen-Sutherland clipping
 */

#include "BoundaryClipper.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>
#include <iomanip>

namespace osmprint {

// ============================================================================
// BoundaryWindow
// ============================================================================

BoundaryWindow::BoundaryWindow(const Point3D& corner_a, const Point3D& corner_b) {
    const double x0 = std::min(corner_a.x(), corner_b.x());
    const double x1 = std::max(corner_a.x(), corner_b.x());
    const double z0 = std::min(corner_a.z(), corner_b.z());
    const double z1 = std::max(corner_a.z(), corner_b.z());

    if (!std::isfinite(x0) || !std::isfinite(x1) || !std::isfinite(z0) || !std::isfinite(z1)) {
        throw GeometryError("Boundary window has non-finite corners");
    }
    if (!(x1 - x0 > 0.0) || !(z1 - z0 > 0.0)) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(3)
            << "Boundary window is empty (width " << (x1 - x0) << "m, depth " << (z1 - z0) << "m)";
        throw GeometryError(oss.str());
    }

    // Counter-clockwise in the (x, z) plane so the interior is left of every edge
    loop_ = {Point3D(x0, 0.0, z0), Point3D(x1, 0.0, z0), Point3D(x1, 0.0, z1), Point3D(x0, 0.0, z1)};
}

BoundaryWindow BoundaryWindow::from_bounds(const GeoBounds& bounds, const Projector& projector) {
    const Point3D south_west = projector.project(bounds.south, bounds.west);
    const Point3D north_east = projector.project(bounds.north, bounds.east);
    return BoundaryWindow(south_west, north_east);
}

// ============================================================================
// BoundaryClipper
// ============================================================================

BoundaryClipper::BoundaryClipper(const BoundaryWindow& window)
    : window_(window), logger_("BoundaryClipper") {}

bool BoundaryClipper::is_inside(const Point3D& p, const Point3D& edge_start, const Point3D& edge_end) {
    return (edge_end.x() - edge_start.x()) * (p.z() - edge_start.z()) >
           (edge_end.z() - edge_start.z()) * (p.x() - edge_start.x());
}

Point3D BoundaryClipper::intersection(const Point3D& s, const Point3D& e,
                                      const Point3D& edge_start, const Point3D& edge_end) {
    const double dc_x = edge_start.x() - edge_end.x();
    const double dc_z = edge_start.z() - edge_end.z();
    const double dp_x = s.x() - e.x();
    const double dp_z = s.z() - e.z();
    const double n1 = edge_start.x() * edge_end.z() - edge_start.z() * edge_end.x();
    const double n2 = s.x() * e.z() - s.z() * e.x();
    const double n3 = 1.0 / (dc_x * dp_z - dc_z * dp_x);
    return Point3D((n1 * dp_x - n2 * dc_x) * n3, s.y(), (n1 * dp_z - n2 * dc_z) * n3);
}

Polyline BoundaryClipper::clip_polygon(const Polyline& subject) const {
    const auto& clip_loop = window_.loop();
    Polyline output = subject;

    for (size_t i = 0; i < clip_loop.size(); ++i) {
        const Point3D& edge_start = clip_loop[i];
        const Point3D& edge_end = clip_loop[(i + 1) % clip_loop.size()];

        const Polyline input = std::move(output);
        output.clear();
        if (input.empty()) {
            break;
        }

        Point3D s = input.back();
        for (const Point3D& e : input) {
            const bool s_inside = is_inside(s, edge_start, edge_end);
            const bool e_inside = is_inside(e, edge_start, edge_end);

            if (e_inside) {
                if (!s_inside) {
                    output.push_back(intersection(s, e, edge_start, edge_end));
                }
                output.push_back(e);
            } else if (s_inside) {
                output.push_back(intersection(s, e, edge_start, edge_end));
            }
            s = e;
        }
    }

    logger_.trace("Polygon clip: " + std::to_string(subject.size()) + " -> " +
                  std::to_string(output.size()) + " vertices");
    return output;
}

int BoundaryClipper::compute_outcode(const Point3D& p) const {
    int code = INSIDE;
    if (p.x() < window_.min_x()) code |= LEFT;
    else if (p.x() > window_.max_x()) code |= RIGHT;
    if (p.z() < window_.min_z()) code |= BOTTOM;
    else if (p.z() > window_.max_z()) code |= TOP;
    return code;
}

std::optional<std::pair<Point3D, Point3D>> BoundaryClipper::clip_segment(Point3D p1, Point3D p2) const {
    int code1 = compute_outcode(p1);
    int code2 = compute_outcode(p2);

    while (true) {
        if ((code1 | code2) == 0) {
            return std::make_pair(p1, p2);
        }
        if ((code1 & code2) != 0) {
            return std::nullopt;
        }

        const int code_out = code1 != 0 ? code1 : code2;
        double x = 0.0;
        double z = 0.0;

        if (code_out & TOP) {
            x = p1.x() + (p2.x() - p1.x()) * (window_.max_z() - p1.z()) / (p2.z() - p1.z());
            z = window_.max_z();
        } else if (code_out & BOTTOM) {
            x = p1.x() + (p2.x() - p1.x()) * (window_.min_z() - p1.z()) / (p2.z() - p1.z());
            z = window_.min_z();
        } else if (code_out & RIGHT) {
            z = p1.z() + (p2.z() - p1.z()) * (window_.max_x() - p1.x()) / (p2.x() - p1.x());
            x = window_.max_x();
        } else {
            z = p1.z() + (p2.z() - p1.z()) * (window_.min_x() - p1.x()) / (p2.x() - p1.x());
            x = window_.min_x();
        }

        if (code_out == code1) {
            p1 = Point3D(x, p1.y(), z);
            code1 = compute_outcode(p1);
        } else {
            p2 = Point3D(x, p2.y(), z);
            code2 = compute_outcode(p2);
        }
    }
}

std::vector<Polyline> BoundaryClipper::clip_polyline(const Polyline& points) const {
    std::vector<Polyline> clipped_lines;
    Polyline current_line;

    for (size_t i = 0; i + 1 < points.size(); ++i) {
        auto segment = clip_segment(points[i], points[i + 1]);

        if (segment) {
            if (!current_line.empty() && current_line.back() != segment->first) {
                clipped_lines.push_back(std::move(current_line));
                current_line.clear();
            }
            if (current_line.empty()) {
                current_line.push_back(segment->first);
            }
            current_line.push_back(segment->second);
        } else if (!current_line.empty()) {
            clipped_lines.push_back(std::move(current_line));
            current_line.clear();
        }
    }

    if (!current_line.empty()) {
        clipped_lines.push_back(std::move(current_line));
    }

    logger_.trace("Polyline clip: " + std::to_string(points.size()) + " points -> " +
                  std::to_string(clipped_lines.size()) + " sub-polylines");
    return clipped_lines;
}

} // namespace osmprint
