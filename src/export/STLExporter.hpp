/**
 * @file STLExporter.hpp
 * @brief Single-solid STL export of the print-space model
 */

#pragma once

#include "osmprint.hpp"
#include "PrintTransform.hpp"
#include "../core/Logger.hpp"
#include "../core/ModelBuilder.hpp"
#include <fstream>
#include <string>
#include <vector>

namespace osmprint {

/**
 * @brief Writes every piece of a SolidModel into one STL solid
 *
 * Coordinates are the same millimeter print space the 3MF export uses.
 * Materials are dropped; STL carries geometry only.
 */
class STLExporter {
public:
    struct Options {
        bool binary_format = true;
        std::string solid_name = "osm_model";
    };

    STLExporter();
    explicit STLExporter(const Options& options);

    /**
     * @brief Print-space triangle soup of all pieces, in piece order
     * @throws ExportError on empty or malformed geometry or a dangling handle
     */
    std::vector<Point3D> collect_triangles(const SolidModel& model) const;

    /**
     * @brief Write the model; nothing is written if it is invalid
     * @throws ExportError on invalid geometry or when the file cannot be written
     */
    void write_file(const SolidModel& model, const std::string& filename) const;

    /// Unit normal of a triangle from its winding
    static Point3D facet_normal(const Point3D& a, const Point3D& b, const Point3D& c);

    static std::string file_name(const std::string& base_name) { return base_name + ".stl"; }

private:
    Options options_;
    Logger logger_;

    void write_ascii_stl(const std::vector<Point3D>& triangles, std::ofstream& file) const;
    void write_binary_stl(const std::vector<Point3D>& triangles, std::ofstream& file) const;
};

} // namespace osmprint
