/**
 * @file ThreeMFExporter.cpp
 * @brief Implementation of 3MF model document export
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "ThreeMFExporter.hpp"
#include "version.h"
#include <fstream>
#include <iomanip>
#include <map>
#include <sstream>
#include <tuple>

namespace osmprint {

size_t ExportDocument::triangle_count() const {
    size_t total = 0;
    for (const auto& geometry : geometries) {
        total += geometry.triangle_count();
    }
    return total;
}

ThreeMFExporter::ThreeMFExporter() : ThreeMFExporter(Options()) {}

ThreeMFExporter::ThreeMFExporter(const Options& options)
    : options_(options), logger_("ThreeMFExporter") {}

std::string ThreeMFExporter::file_name(const std::string& base_name) {
    return base_name + ".3mf";
}

std::string ThreeMFExporter::xml_escape(const std::string& text) {
    std::string escaped;
    escaped.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': escaped += "&amp;"; break;
            case '<': escaped += "&lt;"; break;
            case '>': escaped += "&gt;"; break;
            case '"': escaped += "&quot;"; break;
            case '\'': escaped += "&apos;"; break;
            default: escaped += c; break;
        }
    }
    return escaped;
}

std::string ThreeMFExporter::format_transform(const Eigen::Affine3d& placement) {
    const Eigen::Matrix3d linear = placement.linear();
    const Eigen::Vector3d translation = placement.translation();

    // 3MF uses row vectors: each matrix row is the image of one axis
    std::ostringstream oss;
    oss << std::setprecision(9);
    for (int column = 0; column < 3; ++column) {
        for (int row = 0; row < 3; ++row) {
            oss << linear(row, column) << " ";
        }
    }
    oss << translation.x() << " " << translation.y() << " " << translation.z();
    return oss.str();
}

// ============================================================================
// Document Construction
// ============================================================================

ExportDocument ThreeMFExporter::build_document(const SolidModel& model) const {
    ExportDocument document;
    document.title = options_.title;
    document.vertex_colors = options_.vertex_colors;
    document.placement = options_.placement;

    const PrintTransform transform = PrintTransform::for_model(model);

    std::map<MaterialHandle, size_t> material_index;
    std::map<std::tuple<MeshHandle, double, double>, size_t> geometry_index;

    for (size_t i = 0; i < model.pieces.size(); ++i) {
        const SolidPiece& piece = model.pieces[i];

        const Material* material = model.find_material(piece.material);
        if (!material) {
            throw ExportError("Piece " + std::to_string(i) + " references missing material " +
                              std::to_string(piece.material));
        }
        const SolidMesh* mesh = model.find_mesh(piece.mesh);
        if (!mesh) {
            throw ExportError("Piece " + std::to_string(i) + " references missing mesh " +
                              std::to_string(piece.mesh));
        }

        auto material_it = material_index.find(piece.material);
        if (material_it == material_index.end()) {
            document.materials.push_back({piece.material, material->name, material->color});
            material_it = material_index.emplace(piece.material, document.materials.size() - 1).first;
        }

        const auto key = std::make_tuple(piece.mesh, piece.canonical_base_mm, piece.canonical_height_mm);
        auto geometry_it = geometry_index.find(key);
        if (geometry_it == geometry_index.end()) {
            ExportGeometry geometry;
            geometry.mesh = piece.mesh;
            geometry.base_mm = piece.canonical_base_mm;
            geometry.height_mm = piece.canonical_height_mm;
            geometry.material_index = material_it->second;
            try {
                geometry.positions = transform.map_mesh(*mesh, piece.canonical_base_mm, piece.canonical_height_mm);
            } catch (const ExportError& e) {
                throw ExportError("Piece " + std::to_string(i) + " (" + layer_kind_name(piece.layer) +
                                  ", source " + std::to_string(piece.source_id) + "): " + e.what());
            }
            document.geometries.push_back(std::move(geometry));
            geometry_it = geometry_index.emplace(key, document.geometries.size() - 1).first;
        }
        document.components.push_back(static_cast<int>(geometry_it->second));
    }

    if (document.geometries.empty()) {
        throw ExportError("Model has no pieces to export");
    }

    // Resource ids start at 1: materials, optional color group, objects, assembly
    int next_id = 1;
    document.base_materials_id = next_id++;
    if (document.vertex_colors) {
        document.color_group_id = next_id++;
    }
    for (auto& geometry : document.geometries) {
        geometry.object_id = next_id++;
    }
    for (auto& component : document.components) {
        component = document.geometries[static_cast<size_t>(component)].object_id;
    }
    document.assembly_id = next_id++;

    logger_.detailed("3MF document: " + std::to_string(document.materials.size()) + " materials, " +
                     std::to_string(document.geometries.size()) + " objects, " +
                     std::to_string(document.components.size()) + " components, " +
                     std::to_string(document.triangle_count()) + " triangles");
    return document;
}

// ============================================================================
// XML Serialization
// ============================================================================

std::string ThreeMFExporter::to_xml(const ExportDocument& document) const {
    std::ostringstream xml;
    xml << std::setprecision(9);

    xml << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
    xml << "<model unit=\"millimeter\" xml:lang=\"en-US\" xmlns=\"" << kThreeMFCoreNamespace << "\"";
    if (document.vertex_colors) {
        xml << " xmlns:m=\"" << kThreeMFMaterialNamespace << "\"";
    }
    xml << ">\n";
    xml << "  <metadata name=\"Application\">OSMPrint " << OSMPRINT_VERSION_STRING << "</metadata>\n";
    xml << "  <metadata name=\"Title\">" << xml_escape(document.title) << "</metadata>\n";
    xml << "  <resources>\n";

    xml << "    <basematerials id=\"" << document.base_materials_id << "\">\n";
    for (const auto& material : document.materials) {
        xml << "      <base name=\"" << xml_escape(material.name)
            << "\" displaycolor=\"" << material.color.to_hex_string() << "\"/>\n";
    }
    xml << "    </basematerials>\n";

    if (document.vertex_colors) {
        xml << "    <m:colorgroup id=\"" << document.color_group_id << "\">\n";
        for (const auto& material : document.materials) {
            xml << "      <m:color color=\"" << material.color.to_hex_string() << "\"/>\n";
        }
        xml << "    </m:colorgroup>\n";
    }

    for (const auto& geometry : document.geometries) {
        xml << "    <object id=\"" << geometry.object_id << "\" type=\"model\" pid=\""
            << document.base_materials_id << "\" pindex=\"" << geometry.material_index << "\">\n";
        xml << "      <mesh>\n";
        xml << "        <vertices>\n";
        for (const auto& p : geometry.positions) {
            xml << "          <vertex x=\"" << p.x() << "\" y=\"" << p.y() << "\" z=\"" << p.z() << "\"/>\n";
        }
        xml << "        </vertices>\n";
        xml << "        <triangles>\n";
        for (size_t i = 0; i + 2 < geometry.positions.size(); i += 3) {
            xml << "          <triangle v1=\"" << i << "\" v2=\"" << i + 1 << "\" v3=\"" << i + 2 << "\"";
            if (document.vertex_colors) {
                xml << " pid=\"" << document.color_group_id << "\" p1=\"" << geometry.material_index
                    << "\" p2=\"" << geometry.material_index << "\" p3=\"" << geometry.material_index << "\"";
            }
            xml << "/>\n";
        }
        xml << "        </triangles>\n";
        xml << "      </mesh>\n";
        xml << "    </object>\n";
    }

    xml << "    <object id=\"" << document.assembly_id << "\" type=\"model\">\n";
    xml << "      <components>\n";
    for (int object_id : document.components) {
        xml << "        <component objectid=\"" << object_id << "\"/>\n";
    }
    xml << "      </components>\n";
    xml << "    </object>\n";

    xml << "  </resources>\n";
    xml << "  <build>\n";
    xml << "    <item objectid=\"" << document.assembly_id << "\" transform=\""
        << format_transform(document.placement) << "\"/>\n";
    xml << "  </build>\n";
    xml << "</model>\n";

    return xml.str();
}

std::string ThreeMFExporter::export_model(const SolidModel& model) const {
    return to_xml(build_document(model));
}

void ThreeMFExporter::write_file(const SolidModel& model, const std::string& filename) const {
    // Build the whole document before touching the file system
    const std::string xml = export_model(model);

    std::ofstream file(filename, std::ios::binary);
    if (!file.is_open()) {
        throw ExportError("Cannot open file for writing: " + filename);
    }
    file << xml;
    file.close();
    if (!file) {
        throw ExportError("Failed to write " + filename);
    }

    logger_.info("Wrote " + filename + " (" + std::to_string(xml.size()) + " bytes, " + kThreeMFModelMimeType + ")");
}

} // namespace osmprint
