/**
 * @file ModelBuilder.cpp
 * @brief Implementation of layered model assembly
 */

#include "ModelBuilder.hpp"
#include <algorithm>
#include <cmath>
#include <utility>

namespace osmprint {

const char* layer_kind_name(LayerKind kind) {
    switch (kind) {
        case LayerKind::BASE: return "base";
        case LayerKind::WATER: return "water";
        case LayerKind::GRASS: return "grass";
        case LayerKind::ROAD: return "road";
        case LayerKind::BUILDING: return "building";
    }
    return "unknown";
}

// ============================================================================
// SolidModel
// ============================================================================

const Layer* SolidModel::find_layer(LayerKind kind) const {
    for (const auto& layer : layers) {
        if (layer.kind == kind) return &layer;
    }
    return nullptr;
}

const SolidMesh* SolidModel::find_mesh(MeshHandle handle) const {
    return handle < meshes.size() ? &meshes[handle] : nullptr;
}

const Material* SolidModel::find_material(MaterialHandle handle) const {
    return handle < materials.size() ? &materials[handle] : nullptr;
}

size_t SolidModel::piece_count(LayerKind kind) const {
    return static_cast<size_t>(std::count_if(pieces.begin(), pieces.end(),
                                             [kind](const SolidPiece& piece) { return piece.layer == kind; }));
}

size_t SolidModel::triangle_count() const {
    size_t total = 0;
    for (const auto& piece : pieces) {
        if (const SolidMesh* mesh = find_mesh(piece.mesh)) {
            total += mesh->triangle_count();
        }
    }
    return total;
}

// ============================================================================
// ModelBuilder
// ============================================================================

ModelBuilder::ModelBuilder() : logger_("ModelBuilder") {}

std::vector<Layer> ModelBuilder::default_layers() {
    return {
        {LayerKind::BASE, "base", Color::from_rgb(0xCCCCCC), kBaseHeightMm, 0.0},
        {LayerKind::WATER, "water", Color::from_rgb(0x2196F3), kWaterHeightMm, kWaterOffsetMm},
        {LayerKind::GRASS, "grass", Color::from_rgb(0x4CAF50), kParkHeightMm, kGrassOffsetMm},
        {LayerKind::ROAD, "road", Color::from_rgb(0x222222), kRoadHeightMm, kRoadOffsetMm},
        {LayerKind::BUILDING, "building", Color::from_rgb(0x888888), kMinPrintHeightMm, kBuildingOffsetMm},
    };
}

std::vector<Point3D> ModelBuilder::remove_duplicate_points(const std::vector<Point3D>& points, bool closed) {
    std::vector<Point3D> result;
    result.reserve(points.size());
    for (const auto& p : points) {
        if (result.empty() || result.back() != p) {
            result.push_back(p);
        }
    }
    if (closed) {
        while (result.size() > 1 && result.front() == result.back()) {
            result.pop_back();
        }
    }
    return result;
}

std::vector<Point3D> ModelBuilder::resolve_points(const GeoElement& way, const OsmDataset& dataset,
                                                  const Projector& projector, BuildStatistics& stats) const {
    std::vector<Point3D> points;
    points.reserve(way.node_refs.size());
    for (ElementId ref : way.node_refs) {
        const GeoElement* node = dataset.find_node(ref);
        if (!node) {
            stats.dangling_node_refs++;
            logger_.trace("Way " + std::to_string(way.id) + " references missing node " + std::to_string(ref));
            continue;
        }
        points.push_back(projector.project(node->lat, node->lon));
    }
    return points;
}

MaterialHandle ModelBuilder::add_material(SolidModel& model, const std::string& name, const Color& color) const {
    for (size_t i = 0; i < model.materials.size(); ++i) {
        if (model.materials[i].name == name) {
            return static_cast<MaterialHandle>(i);
        }
    }
    model.materials.push_back({name, color});
    return static_cast<MaterialHandle>(model.materials.size() - 1);
}

MeshHandle ModelBuilder::add_mesh(SolidModel& model, SolidMesh mesh) const {
    model.meshes.push_back(std::move(mesh));
    return static_cast<MeshHandle>(model.meshes.size() - 1);
}

void ModelBuilder::add_region_layers(SolidModel& model, const BoundaryWindow& window,
                                     MaterialHandle base_material, MaterialHandle water_material) const {
    const double dvs = model.plan.display_vertical_scale;

    SolidMesh base;
    base.add_box(Point3D(window.min_x(), 0.0, window.min_z()),
                 Point3D(window.max_x(), kBaseHeightMm * dvs, window.max_z()));
    model.pieces.push_back({add_mesh(model, std::move(base)), base_material, LayerKind::BASE,
                            0.0, kBaseHeightMm, 0});

    // Single flat plane at the top of the water band
    SolidMesh water;
    water.add_plane(window.min_x(), window.min_z(), window.max_x(), window.max_z(),
                    (kWaterOffsetMm + kWaterHeightMm) * dvs);
    model.pieces.push_back({add_mesh(model, std::move(water)), water_material, LayerKind::WATER,
                            kWaterOffsetMm, kWaterHeightMm, 0});
}

bool ModelBuilder::add_area_piece(SolidModel& model, const ClassifiedFeature& feature,
                                  const std::vector<Point3D>& ring, const BoundaryClipper& clipper,
                                  MaterialHandle material, LayerKind layer,
                                  double base_mm, double height_mm) const {
    const auto footprint = remove_duplicate_points(ring, true);
    if (footprint.size() < 3) {
        model.stats.missing_geometry++;
        logger_.debug(std::string(feature_category_name(feature.category)) + " " +
                      std::to_string(feature.element.id) + " has fewer than 3 distinct points");
        return false;
    }

    const auto clipped = remove_duplicate_points(clipper.clip_polygon(footprint), true);
    if (clipped.size() < 3) {
        model.stats.polygons_clipped_out++;
        logger_.trace(std::string(feature_category_name(feature.category)) + " " +
                      std::to_string(feature.element.id) + " lies outside the region");
        return false;
    }

    const double dvs = model.plan.display_vertical_scale;
    SolidMesh mesh;
    if (!mesh.add_extruded_polygon(clipped, base_mm * dvs, (base_mm + height_mm) * dvs)) {
        model.stats.degenerate_rings++;
        logger_.debug(std::string(feature_category_name(feature.category)) + " " +
                      std::to_string(feature.element.id) + " has no area after clipping");
        return false;
    }

    model.pieces.push_back({add_mesh(model, std::move(mesh)), material, layer,
                            base_mm, height_mm, feature.element.id});
    return true;
}

size_t ModelBuilder::add_road_pieces(SolidModel& model, const ClassifiedFeature& feature,
                                     const std::vector<Point3D>& points, const BoundaryClipper& clipper,
                                     MaterialHandle material) const {
    const auto path = remove_duplicate_points(points, false);
    const auto sub_polylines = path.size() >= 2 ? clipper.clip_polyline(path) : std::vector<Polyline>{};
    if (sub_polylines.empty()) {
        model.stats.polylines_clipped_out++;
        logger_.trace("Road " + std::to_string(feature.element.id) + " lies outside the region");
        return 0;
    }

    const double dvs = model.plan.display_vertical_scale;
    const double box_height = kRoadHeightMm * dvs;
    const double box_width = kRoadWidthMm * dvs;
    const double center_y = kRoadOffsetMm * dvs + box_height / 2.0;

    size_t pieces_added = 0;
    for (const auto& sub_polyline : sub_polylines) {
        for (size_t i = 0; i + 1 < sub_polyline.size(); ++i) {
            const Point3D& start = sub_polyline[i];
            const Point3D& end = sub_polyline[i + 1];

            const double length = planar_distance(start, end);
            if (length <= kMinRoadSegmentM) {
                model.stats.short_segments_skipped++;
                continue;
            }

            Eigen::Vector3d direction(end.x() - start.x(), 0.0, end.z() - start.z());
            direction.normalize();
            const Point3D midpoint((start.x() + end.x()) / 2.0, center_y, (start.z() + end.z()) / 2.0);

            // One piece per segment box
            SolidMesh mesh;
            mesh.add_oriented_box(midpoint, direction, length, box_height, box_width);
            model.pieces.push_back({add_mesh(model, std::move(mesh)), material, LayerKind::ROAD,
                                    kRoadOffsetMm, kRoadHeightMm, feature.element.id});
            model.stats.road_segments++;
            pieces_added++;
        }
    }
    return pieces_added;
}

SolidModel ModelBuilder::build(const ClassificationResult& classification,
                               const OsmDataset& dataset,
                               const Projector& projector,
                               const BoundaryWindow& window,
                               const ScalePlan& plan) {
    SolidModel model;
    model.layers = default_layers();
    model.window = window;
    model.plan = plan;

    const Layer& base_layer = *model.find_layer(LayerKind::BASE);
    const Layer& water_layer = *model.find_layer(LayerKind::WATER);
    const Layer& grass_layer = *model.find_layer(LayerKind::GRASS);
    const Layer& road_layer = *model.find_layer(LayerKind::ROAD);
    const Layer& building_layer = *model.find_layer(LayerKind::BUILDING);

    const MaterialHandle base_material = add_material(model, base_layer.name, base_layer.color);
    const MaterialHandle water_material = add_material(model, water_layer.name, water_layer.color);
    const MaterialHandle park_material = add_material(model, "park", grass_layer.color);
    const MaterialHandle sand_material = add_material(model, "sand", Color::from_rgb(0xF4E4BC));
    const MaterialHandle road_material = add_material(model, road_layer.name, road_layer.color);
    const MaterialHandle building_material = add_material(model, building_layer.name, building_layer.color);

    logger_.info("Building model for " + std::to_string(classification.features.size()) + " features");
    add_region_layers(model, window, base_material, water_material);

    const BoundaryClipper clipper(model.window.value());
    BuildStatistics& stats = model.stats;

    for (const auto& feature : classification.features) {
        const GeoElement& element = feature.element;

        if (feature.category == FeatureCategory::IGNORED) {
            stats.ignored++;
            continue;
        }
        if (feature.category == FeatureCategory::WATER) {
            stats.water_features++;
            continue;
        }
        if (element.kind == ElementKind::RELATION) {
            stats.relations_without_geometry++;
            logger_.debug("Relation " + std::to_string(element.id) + " (" +
                          feature_category_name(feature.category) + ") carries no geometry");
            continue;
        }

        const auto points = resolve_points(element, dataset, projector, stats);
        if (points.size() < 2) {
            stats.missing_geometry++;
            logger_.debug("Way " + std::to_string(element.id) + " resolved to " +
                          std::to_string(points.size()) + " points, skipping");
            continue;
        }

        switch (feature.category) {
            case FeatureCategory::BUILDING: {
                const double height_mm = ScalingCalculator::print_height_mm(feature.real_height_m,
                                                                            classification.stats);
                if (add_area_piece(model, feature, points, clipper, building_material,
                                   LayerKind::BUILDING, building_layer.offset_mm, height_mm)) {
                    stats.buildings++;
                    logger_.trace("Building " + std::to_string(element.id) + ": " +
                                  std::to_string(feature.real_height_m) + "m -> " +
                                  std::to_string(height_mm) + "mm");
                }
                break;
            }
            case FeatureCategory::HIGHWAY:
                if (add_road_pieces(model, feature, points, clipper, road_material) > 0) {
                    stats.roads++;
                }
                break;
            case FeatureCategory::PARK:
                if (add_area_piece(model, feature, points, clipper, park_material,
                                   LayerKind::GRASS, grass_layer.offset_mm, kParkHeightMm)) {
                    stats.parks++;
                }
                break;
            case FeatureCategory::SAND:
                if (add_area_piece(model, feature, points, clipper, sand_material,
                                   LayerKind::GRASS, grass_layer.offset_mm, kSandHeightMm)) {
                    stats.sand_areas++;
                }
                break;
            default:
                break;
        }
    }

    logger_.info("Model built: " + std::to_string(model.pieces.size()) + " pieces, " +
                 std::to_string(model.triangle_count()) + " triangles");
    logger_.detailed("  Buildings: " + std::to_string(stats.buildings) +
                     ", roads: " + std::to_string(stats.roads) +
                     " (" + std::to_string(stats.road_segments) + " segments)" +
                     ", parks: " + std::to_string(stats.parks) +
                     ", sand: " + std::to_string(stats.sand_areas) +
                     ", water features: " + std::to_string(stats.water_features));
    if (stats.total_skipped() > 0 || stats.dangling_node_refs > 0) {
        logger_.detailed("  Skipped: " + std::to_string(stats.missing_geometry) + " missing geometry, " +
                         std::to_string(stats.relations_without_geometry) + " relations, " +
                         std::to_string(stats.polygons_clipped_out) + " polygons and " +
                         std::to_string(stats.polylines_clipped_out) + " polylines outside, " +
                         std::to_string(stats.degenerate_rings) + " degenerate rings, " +
                         std::to_string(stats.short_segments_skipped) + " short segments, " +
                         std::to_string(stats.dangling_node_refs) + " dangling node refs");
    }

    return model;
}

} // namespace osmprint
