/**
 * @file STLExporter.cpp
 * @brief Implementation of binary and ASCII STL export
 */

#include "STLExporter.hpp"
#include <algorithm>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <iomanip>

namespace osmprint {

STLExporter::STLExporter() : STLExporter(Options()) {}

STLExporter::STLExporter(const Options& options)
    : options_(options), logger_("STLExporter") {}

Point3D STLExporter::facet_normal(const Point3D& a, const Point3D& b, const Point3D& c) {
    Eigen::Vector3d normal = (b.to_eigen() - a.to_eigen()).cross(c.to_eigen() - a.to_eigen());
    const double length = normal.norm();
    if (length > 1e-12) {
        normal /= length;
    }
    return Point3D::from_eigen(normal);
}

std::vector<Point3D> STLExporter::collect_triangles(const SolidModel& model) const {
    const PrintTransform transform = PrintTransform::for_model(model);

    std::vector<Point3D> triangles;
    for (size_t i = 0; i < model.pieces.size(); ++i) {
        const SolidPiece& piece = model.pieces[i];
        const SolidMesh* mesh = model.find_mesh(piece.mesh);
        if (!mesh) {
            throw ExportError("Piece " + std::to_string(i) + " references missing mesh " +
                              std::to_string(piece.mesh));
        }
        auto mapped = transform.map_mesh(*mesh, piece.canonical_base_mm, piece.canonical_height_mm);
        triangles.insert(triangles.end(), mapped.begin(), mapped.end());
    }

    if (triangles.empty()) {
        throw ExportError("Model has no pieces to export");
    }
    return triangles;
}

void STLExporter::write_file(const SolidModel& model, const std::string& filename) const {
    const auto triangles = collect_triangles(model);

    std::ofstream file(filename, options_.binary_format ? std::ios::binary : std::ios::out);
    if (!file.is_open()) {
        throw ExportError("Cannot open file for writing: " + filename);
    }

    if (options_.binary_format) {
        write_binary_stl(triangles, file);
    } else {
        write_ascii_stl(triangles, file);
    }

    file.close();
    if (!file) {
        throw ExportError("Failed to write " + filename);
    }

    logger_.info("Wrote " + filename + " (" + std::to_string(triangles.size() / 3) + " triangles, " +
                 (options_.binary_format ? "binary" : "ASCII") + ")");
}

void STLExporter::write_ascii_stl(const std::vector<Point3D>& triangles, std::ofstream& file) const {
    file << std::fixed << std::setprecision(6);
    file << "solid " << options_.solid_name << "\n";

    for (size_t i = 0; i + 2 < triangles.size(); i += 3) {
        const Point3D normal = facet_normal(triangles[i], triangles[i + 1], triangles[i + 2]);

        file << "  facet normal " << normal.x() << " " << normal.y() << " " << normal.z() << "\n";
        file << "    outer loop\n";
        for (size_t j = 0; j < 3; ++j) {
            const Point3D& v = triangles[i + j];
            file << "      vertex " << v.x() << " " << v.y() << " " << v.z() << "\n";
        }
        file << "    endloop\n";
        file << "  endfacet\n";
    }

    file << "endsolid " << options_.solid_name << "\n";
}

void STLExporter::write_binary_stl(const std::vector<Point3D>& triangles, std::ofstream& file) const {
    // Write 80-byte header
    char header[80] = {0};
    const std::string header_text = "Binary STL - OSMPrint " + options_.solid_name;
    std::strncpy(header, header_text.c_str(), std::min(header_text.length(), size_t(79)));
    file.write(header, 80);

    uint32_t triangle_count = static_cast<uint32_t>(triangles.size() / 3);
    file.write(reinterpret_cast<const char*>(&triangle_count), sizeof(uint32_t));

    for (size_t i = 0; i + 2 < triangles.size(); i += 3) {
        const Point3D n = facet_normal(triangles[i], triangles[i + 1], triangles[i + 2]);
        float normal[3] = {static_cast<float>(n.x()), static_cast<float>(n.y()), static_cast<float>(n.z())};
        file.write(reinterpret_cast<const char*>(normal), 12);

        for (size_t j = 0; j < 3; ++j) {
            const Point3D& v = triangles[i + j];
            float vertex_coords[3] = {static_cast<float>(v.x()), static_cast<float>(v.y()), static_cast<float>(v.z())};
            file.write(reinterpret_cast<const char*>(vertex_coords), 12);
        }

        // Write attribute byte count (always 0)
        uint16_t attribute_count = 0;
        file.write(reinterpret_cast<const char*>(&attribute_count), 2);
    }
}

} // namespace osmprint
