/**
 * @file FeatureClassifier.hpp
 * @brief Feature categorization and building height estimation
 */

#pragma once

#include "osmprint.hpp"
#include "OsmDataLoader.hpp"
#include "Logger.hpp"
#include <limits>
#include <optional>
#include <string>
#include <vector>

namespace osmprint {

enum class FeatureCategory {
    BUILDING,
    HIGHWAY,
    PARK,
    WATER,
    SAND,
    IGNORED
};

const char* feature_category_name(FeatureCategory category);

/// Meters per building level when only building:levels is tagged
constexpr double kMetersPerLevel = 3.0;
/// Height used when a building carries no usable height information
constexpr double kDefaultBuildingHeightM = 5.0;

/**
 * @brief Element annotated with its category (and height for buildings)
 */
struct ClassifiedFeature {
    GeoElement element;
    FeatureCategory category = FeatureCategory::IGNORED;
    double real_height_m = 0.0;  // buildings only
};

/**
 * @brief Building height range used to normalize print heights
 *
 * min starts at +infinity and max at 0; with no qualifying building the
 * range stays empty and every building maps to the minimum print height.
 */
struct HeightStats {
    double min_building_height_m = std::numeric_limits<double>::infinity();
    double max_building_height_m = 0.0;
    size_t qualifying_buildings = 0;

    void add(double height_m);

    /// True when at least two distinct heights were observed
    bool has_range() const {
        return std::isfinite(min_building_height_m) && max_building_height_m > min_building_height_m;
    }
};

/**
 * @brief Output of classification
 */
struct ClassificationResult {
    std::vector<ClassifiedFeature> features;
    HeightStats stats;

    size_t count(FeatureCategory category) const;
};

/**
 * @brief Groups raw elements by category and estimates building heights
 */
class FeatureClassifier {
public:
    FeatureClassifier();

    /**
     * @brief Classify every element; nodes are always IGNORED
     *
     * Precedence: building, highway, sand, park, water.
     */
    ClassificationResult classify(const std::vector<GeoElement>& elements) const;

    /**
     * @brief Category of a single element
     */
    static FeatureCategory categorize(const GeoElement& element);

    /**
     * @brief Building height in meters: height tag, then levels x 3, then 5
     */
    static double estimate_building_height(const GeoElement& element);

    /**
     * @brief Parse a leading float from a tag value ("12", "12.5 m")
     * @return nullopt when no number can be read or it is not finite
     */
    static std::optional<double> parse_numeric_tag(const std::string& value);

private:
    Logger logger_;
};

} // namespace osmprint
