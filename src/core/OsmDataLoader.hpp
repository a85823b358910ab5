/**
 * @file OsmDataLoader.hpp
 * @brief Reads Overpass API JSON output into geographic elements
 */

#pragma once

#include "osmprint.hpp"
#include "Logger.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace osmprint {

using ElementId = std::int64_t;
using TagMap = std::map<std::string, std::string>;

enum class ElementKind {
    NODE,
    WAY,
    RELATION
};

const char* element_kind_name(ElementKind kind);

/**
 * @brief Raw input element as delivered by the data provider
 */
struct GeoElement {
    ElementKind kind = ElementKind::NODE;
    ElementId id = 0;
    TagMap tags;
    std::vector<ElementId> node_refs;  // ways only
    double lat = 0.0;                  // nodes only
    double lon = 0.0;                  // nodes only

    bool has_tag(const std::string& key) const { return tags.find(key) != tags.end(); }

    /// Tag value or empty string
    std::string tag(const std::string& key) const {
        auto it = tags.find(key);
        return it != tags.end() ? it->second : std::string();
    }

    static GeoElement node(ElementId id, double lat, double lon, TagMap tags = {});
    static GeoElement way(ElementId id, std::vector<ElementId> refs, TagMap tags = {});
    static GeoElement relation(ElementId id, TagMap tags = {});
};

/**
 * @brief Loaded element set with node lookup
 */
struct OsmDataset {
    std::vector<GeoElement> elements;
    std::optional<GeoBounds> bounds;  // from an Overpass "bounds" object, if present

    /// Rebuild the id -> node index after elements change
    void index_nodes();

    const GeoElement* find_node(ElementId id) const;

    /// Bounding rectangle of all nodes, if there are any
    std::optional<GeoBounds> node_extent() const;

    size_t node_count() const { return node_index_.size(); }

private:
    std::unordered_map<ElementId, size_t> node_index_;
};

/**
 * @brief Parses Overpass JSON ({"elements": [...]})
 *
 * Tolerates elements without tags, non-string tag values and unknown element
 * types. Malformed documents raise OsmDataError.
 */
class OsmDataLoader {
public:
    OsmDataLoader();

    /**
     * @brief Read and parse a file
     * @throws OsmDataError if the file cannot be read or parsed
     */
    OsmDataset load_file(const std::string& path) const;

    /**
     * @brief Parse a JSON document held in memory
     * @throws OsmDataError on malformed JSON or a missing "elements" array
     */
    OsmDataset parse(const std::string& json_text) const;

    size_t skipped_elements() const { return skipped_elements_; }

private:
    Logger logger_;
    mutable size_t skipped_elements_ = 0;
};

} // namespace osmprint
