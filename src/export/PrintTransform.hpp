/**
 * @file PrintTransform.hpp
 * @brief Mapping from preview space to print space
 *
 * Print space is millimeters with Z up and east/north positive. The planar
 * axes come from the window center and the horizontal scale; the vertical
 * axis comes from each piece's canonical band, so the display exaggeration
 * used for preview never reaches an exported file.
 */

#pragma once

#include "osmprint.hpp"
#include "../core/ModelBuilder.hpp"
#include "../core/SolidMesh.hpp"
#include <vector>

namespace osmprint {

class PrintTransform {
public:
    /**
     * @param window_center Projected center of the region window
     * @param horizontal_scale Meters of terrain per millimeter of print
     * @throws ExportError if the scale is not positive and finite
     */
    PrintTransform(const Point3D& window_center, double horizontal_scale);

    /// Transform for a finished model (window center and planned scale)
    static PrintTransform for_model(const SolidModel& model);

    /**
     * @brief Print-space triangle soup of one mesh placed in a canonical band
     *
     * Z spans [base_mm, base_mm + height_mm]; a flat mesh lands at
     * base_mm + height_mm. Winding is reversed when the axis map is a
     * reflection so normals stay outward.
     *
     * @throws ExportError if the mesh is empty or not a whole number of triangles
     */
    std::vector<Point3D> map_mesh(const SolidMesh& mesh, double base_mm, double height_mm) const;

    /// Print-space X, Y of a preview point
    Point3D map_planar(const Point3D& p) const;

    /// Linear part of the preview to print axis map with unit vertical gain
    Eigen::Matrix3d axis_map() const;

    /// True when the axis map reverses orientation
    bool reverses_winding() const { return axis_map().determinant() < 0.0; }

    double horizontal_scale() const { return horizontal_scale_; }

private:
    Point3D center_;
    double horizontal_scale_;
};

} // namespace osmprint
