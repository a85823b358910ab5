/**
 * @file OsmDataLoader.cpp
 * @brief Overpass JSON parsing
 */

#include "OsmDataLoader.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <fstream>
#include <limits>
#include <sstream>

using json = nlohmann::json;

namespace osmprint {

const char* element_kind_name(ElementKind kind) {
    switch (kind) {
        case ElementKind::NODE: return "node";
        case ElementKind::WAY: return "way";
        case ElementKind::RELATION: return "relation";
    }
    return "unknown";
}

GeoElement GeoElement::node(ElementId id, double lat, double lon, TagMap tags) {
    GeoElement element;
    element.kind = ElementKind::NODE;
    element.id = id;
    element.lat = lat;
    element.lon = lon;
    element.tags = std::move(tags);
    return element;
}

GeoElement GeoElement::way(ElementId id, std::vector<ElementId> refs, TagMap tags) {
    GeoElement element;
    element.kind = ElementKind::WAY;
    element.id = id;
    element.node_refs = std::move(refs);
    element.tags = std::move(tags);
    return element;
}

GeoElement GeoElement::relation(ElementId id, TagMap tags) {
    GeoElement element;
    element.kind = ElementKind::RELATION;
    element.id = id;
    element.tags = std::move(tags);
    return element;
}

// ============================================================================
// OsmDataset
// ============================================================================

void OsmDataset::index_nodes() {
    node_index_.clear();
    for (size_t i = 0; i < elements.size(); ++i) {
        if (elements[i].kind == ElementKind::NODE) {
            node_index_[elements[i].id] = i;
        }
    }
}

const GeoElement* OsmDataset::find_node(ElementId id) const {
    auto it = node_index_.find(id);
    if (it == node_index_.end()) {
        return nullptr;
    }
    return &elements[it->second];
}

std::optional<GeoBounds> OsmDataset::node_extent() const {
    if (node_index_.empty()) {
        return std::nullopt;
    }

    GeoBounds extent(std::numeric_limits<double>::max(), std::numeric_limits<double>::max(),
                     std::numeric_limits<double>::lowest(), std::numeric_limits<double>::lowest());
    for (const auto& [id, index] : node_index_) {
        const auto& node = elements[index];
        extent.south = std::min(extent.south, node.lat);
        extent.north = std::max(extent.north, node.lat);
        extent.west = std::min(extent.west, node.lon);
        extent.east = std::max(extent.east, node.lon);
    }
    return extent;
}

// ============================================================================
// OsmDataLoader
// ============================================================================

OsmDataLoader::OsmDataLoader() : logger_("OsmDataLoader") {}

OsmDataset OsmDataLoader::load_file(const std::string& path) const {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw OsmDataError("Cannot open OSM data file: " + path);
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    logger_.detailed("Read " + std::to_string(buffer.str().size()) + " bytes from " + path);
    return parse(buffer.str());
}

OsmDataset OsmDataLoader::parse(const std::string& json_text) const {
    skipped_elements_ = 0;

    json document;
    try {
        document = json::parse(json_text);
    } catch (const json::parse_error& e) {
        throw OsmDataError("Malformed OSM JSON: " + std::string(e.what()));
    }

    if (!document.is_object() || !document.contains("elements") || !document["elements"].is_array()) {
        throw OsmDataError("OSM JSON has no \"elements\" array");
    }

    OsmDataset dataset;

    if (document.contains("bounds") && document["bounds"].is_object()) {
        const auto& b = document["bounds"];
        if (b.contains("minlat") && b.contains("minlon") && b.contains("maxlat") && b.contains("maxlon") &&
            b["minlat"].is_number() && b["minlon"].is_number() &&
            b["maxlat"].is_number() && b["maxlon"].is_number()) {
            dataset.bounds = GeoBounds(b["minlat"].get<double>(), b["minlon"].get<double>(),
                                       b["maxlat"].get<double>(), b["maxlon"].get<double>());
        }
    }

    const auto& elements = document["elements"];
    dataset.elements.reserve(elements.size());

    for (const auto& item : elements) {
        if (!item.is_object() || !item.contains("id") || !item["id"].is_number_integer()) {
            skipped_elements_++;
            continue;
        }

        GeoElement element;
        element.id = item["id"].get<ElementId>();

        if (!item.contains("type") || !item["type"].is_string()) {
            logger_.warning("Skipping element " + std::to_string(element.id) + " without a string type");
            skipped_elements_++;
            continue;
        }
        const std::string type = item["type"].get<std::string>();

        if (type == "node") {
            element.kind = ElementKind::NODE;
            if (!item.contains("lat") || !item.contains("lon") ||
                !item["lat"].is_number() || !item["lon"].is_number()) {
                logger_.debug("Node " + std::to_string(element.id) + " has no coordinates, skipped");
                skipped_elements_++;
                continue;
            }
            element.lat = item["lat"].get<double>();
            element.lon = item["lon"].get<double>();
        } else if (type == "way") {
            element.kind = ElementKind::WAY;
            if (item.contains("nodes") && item["nodes"].is_array()) {
                for (const auto& ref : item["nodes"]) {
                    if (ref.is_number_integer()) {
                        element.node_refs.push_back(ref.get<ElementId>());
                    }
                }
            }
        } else if (type == "relation") {
            element.kind = ElementKind::RELATION;
        } else {
            logger_.warning("Skipping element " + std::to_string(element.id) +
                            " of unknown type '" + type + "'");
            skipped_elements_++;
            continue;
        }

        if (item.contains("tags") && item["tags"].is_object()) {
            for (const auto& [key, value] : item["tags"].items()) {
                element.tags[key] = value.is_string() ? value.get<std::string>() : value.dump();
            }
        }

        dataset.elements.push_back(std::move(element));
    }

    dataset.index_nodes();

    logger_.info("Loaded " + std::to_string(dataset.elements.size()) + " elements (" +
                 std::to_string(dataset.node_count()) + " nodes)");
    if (skipped_elements_ > 0) {
        logger_.warning("Skipped " + std::to_string(skipped_elements_) + " unusable elements");
    }

    return dataset;
}

} // namespace osmprint
