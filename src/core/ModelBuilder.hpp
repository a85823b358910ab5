/**
 * @file ModelBuilder.hpp
 * @brief Assembles classified features into a layered solid model
 *
 * The model is flat: meshes and materials live in arenas addressed by
 * integer handles and every emitted primitive is a SolidPiece carrying its
 * canonical millimeter band. Preview coordinates are meters horizontally and
 * display units (mm x display_vertical_scale) vertically.
 */

#pragma once

#include "osmprint.hpp"
#include "BoundaryClipper.hpp"
#include "FeatureClassifier.hpp"
#include "Logger.hpp"
#include "OsmDataLoader.hpp"
#include "Projector.hpp"
#include "ScalingCalculator.hpp"
#include "SolidMesh.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace osmprint {

using MeshHandle = std::uint32_t;
using MaterialHandle = std::uint32_t;

enum class LayerKind {
    BASE,
    WATER,
    GRASS,
    ROAD,
    BUILDING
};

const char* layer_kind_name(LayerKind kind);

/// Layer policy constants (millimeters)
constexpr double kBaseHeightMm = 0.6;
constexpr double kWaterOffsetMm = 0.6;
constexpr double kWaterHeightMm = 0.1;
constexpr double kGrassOffsetMm = 0.8;
constexpr double kParkHeightMm = 0.2;
constexpr double kSandHeightMm = 0.1;
constexpr double kRoadOffsetMm = 1.1;
constexpr double kRoadHeightMm = 0.2;
constexpr double kRoadWidthMm = 1.0;
constexpr double kBuildingOffsetMm = kBaseHeightMm;

/// Road segments this short (meters) are not extruded
constexpr double kMinRoadSegmentM = 0.1;

/**
 * @brief Fixed properties of one print layer
 */
struct Layer {
    LayerKind kind = LayerKind::BASE;
    std::string name;
    Color color;
    double height_mm = 0.0;   // nominal; buildings vary per piece
    double offset_mm = 0.0;   // bottom of the layer above the print bed
};

/**
 * @brief Named print material
 */
struct Material {
    std::string name;
    Color color;
};

/**
 * @brief One emitted primitive
 *
 * canonical_base_mm and canonical_height_mm fix the piece's vertical band in
 * print space regardless of how the preview was exaggerated.
 */
struct SolidPiece {
    MeshHandle mesh = 0;
    MaterialHandle material = 0;
    LayerKind layer = LayerKind::BASE;
    double canonical_base_mm = 0.0;
    double canonical_height_mm = 0.0;
    ElementId source_id = 0;  // 0 for region-wide pieces
};

/**
 * @brief Counters for every feature emitted or skipped during a build
 */
struct BuildStatistics {
    size_t buildings = 0;
    size_t roads = 0;
    size_t road_segments = 0;
    size_t parks = 0;
    size_t sand_areas = 0;
    size_t water_features = 0;
    size_t ignored = 0;

    size_t missing_geometry = 0;           // fewer than 2 resolved nodes
    size_t relations_without_geometry = 0;
    size_t polygons_clipped_out = 0;
    size_t polylines_clipped_out = 0;
    size_t short_segments_skipped = 0;
    size_t dangling_node_refs = 0;
    size_t degenerate_rings = 0;           // clipped ring with no area

    size_t total_skipped() const {
        return missing_geometry + relations_without_geometry + polygons_clipped_out +
               polylines_clipped_out + degenerate_rings;
    }
};

/**
 * @brief The complete layered model
 */
struct SolidModel {
    std::vector<Layer> layers;
    std::vector<Material> materials;
    std::vector<SolidMesh> meshes;
    std::vector<SolidPiece> pieces;

    std::optional<BoundaryWindow> window;
    ScalePlan plan;
    BuildStatistics stats;

    const Layer* find_layer(LayerKind kind) const;
    const SolidMesh* find_mesh(MeshHandle handle) const;
    const Material* find_material(MaterialHandle handle) const;

    size_t piece_count(LayerKind kind) const;
    size_t triangle_count() const;
};

/**
 * @brief Builds a SolidModel from classified features
 */
class ModelBuilder {
public:
    ModelBuilder();

    /**
     * @brief Build the model for one region
     *
     * Emits the base slab and water plane over the whole window, then one
     * piece per surviving building, park and sand area and one per road
     * segment box. Features that cannot be built are counted in
     * BuildStatistics and skipped.
     */
    SolidModel build(const ClassificationResult& classification,
                     const OsmDataset& dataset,
                     const Projector& projector,
                     const BoundaryWindow& window,
                     const ScalePlan& plan);

    /**
     * @brief Drop a repeated closing point and consecutive duplicates
     */
    static std::vector<Point3D> remove_duplicate_points(const std::vector<Point3D>& points, bool closed);

    /// The five fixed layers, lowest first
    static std::vector<Layer> default_layers();

private:
    Logger logger_;

    std::vector<Point3D> resolve_points(const GeoElement& way, const OsmDataset& dataset,
                                        const Projector& projector, BuildStatistics& stats) const;

    MaterialHandle add_material(SolidModel& model, const std::string& name, const Color& color) const;
    MeshHandle add_mesh(SolidModel& model, SolidMesh mesh) const;

    void add_region_layers(SolidModel& model, const BoundaryWindow& window,
                           MaterialHandle base_material, MaterialHandle water_material) const;

    bool add_area_piece(SolidModel& model, const ClassifiedFeature& feature,
                        const std::vector<Point3D>& ring, const BoundaryClipper& clipper,
                        MaterialHandle material, LayerKind layer,
                        double base_mm, double height_mm) const;

    size_t add_road_pieces(SolidModel& model, const ClassifiedFeature& feature,
                           const std::vector<Point3D>& points, const BoundaryClipper& clipper,
                           MaterialHandle material) const;
};

} // namespace osmprint
