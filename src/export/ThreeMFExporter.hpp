/**
 * @file ThreeMFExporter.hpp
 * @brief 3MF model document export for multi-material printing
 *
 * Builds a deduplicated export document from a SolidModel and serializes it
 * as 3MF core model XML. Materials are interned by material handle and
 * geometries by (mesh handle, canonical band); every piece becomes one
 * component of a single assembly placed by one build item.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "osmprint.hpp"
#include "PrintTransform.hpp"
#include "../core/Logger.hpp"
#include "../core/ModelBuilder.hpp"
#include <string>
#include <vector>

namespace osmprint {

/// MIME type of a 3MF model part
constexpr const char* kThreeMFModelMimeType = "application/vnd.ms-package.3dmanufacturing-3dmodel+xml";

constexpr const char* kThreeMFCoreNamespace = "http://schemas.microsoft.com/3dmanufacturing/core/2015/02";
constexpr const char* kThreeMFMaterialNamespace = "http://schemas.microsoft.com/3dmanufacturing/material/2015/02";

/**
 * @brief Material entry of the export document
 */
struct ExportMaterial {
    MaterialHandle handle = 0;
    std::string name;
    Color color;
};

/**
 * @brief One mesh object: a mesh placed in a canonical band, in print space
 */
struct ExportGeometry {
    int object_id = 0;
    MeshHandle mesh = 0;
    double base_mm = 0.0;
    double height_mm = 0.0;
    size_t material_index = 0;          // index into ExportDocument::materials
    std::vector<Point3D> positions;     // triangle soup in millimeters

    size_t triangle_count() const { return positions.size() / 3; }
};

/**
 * @brief Complete, validated content of one 3MF model part
 */
struct ExportDocument {
    std::string title;
    bool vertex_colors = false;

    int base_materials_id = 0;
    int color_group_id = 0;             // 0 when vertex colors are off
    int assembly_id = 0;

    std::vector<ExportMaterial> materials;
    std::vector<ExportGeometry> geometries;
    std::vector<int> components;        // object id per piece, in piece order

    Eigen::Affine3d placement = Eigen::Affine3d::Identity();

    size_t triangle_count() const;
};

/**
 * @brief Writes a SolidModel as a 3MF model document
 */
class ThreeMFExporter {
public:
    struct Options {
        std::string title = "osm_model";
        bool vertex_colors = false;     // Add an m:colorgroup and per-vertex colors
        Eigen::Affine3d placement = Eigen::Affine3d::Identity();
    };

    ThreeMFExporter();
    explicit ThreeMFExporter(const Options& options);

    /**
     * @brief Intern materials and geometries and map them to print space
     * @throws ExportError on empty or malformed geometry or a dangling handle
     */
    ExportDocument build_document(const SolidModel& model) const;

    /**
     * @brief Serialize a document as 3MF core model XML
     */
    std::string to_xml(const ExportDocument& document) const;

    /**
     * @brief build_document() followed by to_xml()
     */
    std::string export_model(const SolidModel& model) const;

    /**
     * @brief Export to a file; nothing is written if the model is invalid
     * @throws ExportError on invalid geometry or when the file cannot be written
     */
    void write_file(const SolidModel& model, const std::string& filename) const;

    /// "<base_name>.3mf"
    static std::string file_name(const std::string& base_name);

    /// 3MF transform attribute: m00 m01 m02 m10 m11 m12 m20 m21 m22 m30 m31 m32
    static std::string format_transform(const Eigen::Affine3d& placement);

    const Options& options() const { return options_; }

private:
    Options options_;
    Logger logger_;

    static std::string xml_escape(const std::string& text);
};

} // namespace osmprint
