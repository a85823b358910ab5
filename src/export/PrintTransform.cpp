/**
 * @file PrintTransform.cpp
 * @brief Implementation of the preview to print space mapping
 */

#include "PrintTransform.hpp"
#include <cmath>
#include <utility>

namespace osmprint {

PrintTransform::PrintTransform(const Point3D& window_center, double horizontal_scale)
    : center_(window_center), horizontal_scale_(horizontal_scale) {
    if (!std::isfinite(horizontal_scale_) || horizontal_scale_ <= 0.0) {
        throw ExportError("Invalid horizontal scale " + std::to_string(horizontal_scale_));
    }
}

PrintTransform PrintTransform::for_model(const SolidModel& model) {
    if (!model.window) {
        throw ExportError("Model has no boundary window");
    }
    return PrintTransform(model.window->center(), model.plan.horizontal_scale);
}

Eigen::Matrix3d PrintTransform::axis_map() const {
    // Rows produce (X, Y, Z) from preview (x, y, z)
    Eigen::Matrix3d m = Eigen::Matrix3d::Zero();
    m(0, 0) = -1.0 / horizontal_scale_;
    m(1, 2) = -1.0 / horizontal_scale_;
    m(2, 1) = 1.0;
    return m;
}

Point3D PrintTransform::map_planar(const Point3D& p) const {
    return Point3D(-(p.x() - center_.x()) / horizontal_scale_,
                   -(p.z() - center_.z()) / horizontal_scale_,
                   0.0);
}

std::vector<Point3D> PrintTransform::map_mesh(const SolidMesh& mesh, double base_mm, double height_mm) const {
    const auto& positions = mesh.positions();
    if (positions.empty()) {
        throw ExportError("Geometry has no positions");
    }
    if (positions.size() % 3 != 0) {
        throw ExportError("Geometry position count " + std::to_string(positions.size()) +
                          " is not a multiple of 3");
    }

    const MeshBounds bounds = mesh.compute_bounds();
    const double y_min = bounds.min.y();
    const double y_range = bounds.height();
    const bool flat = !(y_range > 0.0);

    std::vector<Point3D> result;
    result.reserve(positions.size());
    for (const auto& p : positions) {
        const Point3D planar = map_planar(p);
        const double z = flat ? base_mm + height_mm
                              : base_mm + (p.y() - y_min) / y_range * height_mm;
        result.emplace_back(planar.x(), planar.y(), z);
    }

    if (reverses_winding()) {
        for (size_t i = 0; i + 2 < result.size(); i += 3) {
            std::swap(result[i + 1], result[i + 2]);
        }
    }
    return result;
}

} // namespace osmprint
