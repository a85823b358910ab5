/**
 * @file FeatureClassifier.cpp
 * @brief Feature categorization and building height estimation
 */

#include "FeatureClassifier.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>
#include <iomanip>

namespace osmprint {

const char* feature_category_name(FeatureCategory category) {
    switch (category) {
        case FeatureCategory::BUILDING: return "building";
        case FeatureCategory::HIGHWAY: return "highway";
        case FeatureCategory::PARK: return "park";
        case FeatureCategory::WATER: return "water";
        case FeatureCategory::SAND: return "sand";
        case FeatureCategory::IGNORED: return "ignored";
    }
    return "unknown";
}

void HeightStats::add(double height_m) {
    if (!(height_m > 0.0)) return;
    min_building_height_m = std::min(min_building_height_m, height_m);
    max_building_height_m = std::max(max_building_height_m, height_m);
    qualifying_buildings++;
}

size_t ClassificationResult::count(FeatureCategory category) const {
    return static_cast<size_t>(std::count_if(features.begin(), features.end(),
        [category](const ClassifiedFeature& f) { return f.category == category; }));
}

FeatureClassifier::FeatureClassifier() : logger_("FeatureClassifier") {}

ClassificationResult FeatureClassifier::classify(const std::vector<GeoElement>& elements) const {
    ClassificationResult result;
    result.features.reserve(elements.size());

    for (const auto& element : elements) {
        ClassifiedFeature feature;
        feature.element = element;
        feature.category = categorize(element);

        if (feature.category == FeatureCategory::BUILDING) {
            feature.real_height_m = estimate_building_height(element);
            result.stats.add(feature.real_height_m);
            logger_.trace("Building " + std::to_string(element.id) + " height " +
                          std::to_string(feature.real_height_m) + "m");
        }

        result.features.push_back(std::move(feature));
    }

    std::ostringstream summary;
    summary << "Classified " << elements.size() << " elements: "
            << result.count(FeatureCategory::BUILDING) << " buildings, "
            << result.count(FeatureCategory::HIGHWAY) << " highways, "
            << result.count(FeatureCategory::PARK) << " parks, "
            << result.count(FeatureCategory::SAND) << " sand, "
            << result.count(FeatureCategory::WATER) << " water";
    logger_.info(summary.str());

    if (result.stats.qualifying_buildings > 0) {
        std::ostringstream range;
        range << std::fixed << std::setprecision(1)
              << "Building height range: " << result.stats.min_building_height_m
              << "m to " << result.stats.max_building_height_m << "m";
        logger_.detailed(range.str());
    } else {
        logger_.detailed("No building with positive height; print heights use the minimum");
    }

    return result;
}

FeatureCategory FeatureClassifier::categorize(const GeoElement& element) {
    if (element.kind == ElementKind::NODE) {
        return FeatureCategory::IGNORED;
    }

    if (!element.tag("building").empty()) {
        return FeatureCategory::BUILDING;
    }

    if (element.kind == ElementKind::WAY && element.has_tag("highway")) {
        return FeatureCategory::HIGHWAY;
    }

    const std::string natural = element.tag("natural");
    if (natural == "sand") {
        return FeatureCategory::SAND;
    }
    if (element.tag("leisure") == "park") {
        return FeatureCategory::PARK;
    }
    if (natural == "water") {
        return FeatureCategory::WATER;
    }

    return FeatureCategory::IGNORED;
}

double FeatureClassifier::estimate_building_height(const GeoElement& element) {
    if (auto height = parse_numeric_tag(element.tag("height"))) {
        return *height;
    }
    if (auto levels = parse_numeric_tag(element.tag("building:levels"))) {
        return *levels * kMetersPerLevel;
    }
    return kDefaultBuildingHeightM;
}

std::optional<double> FeatureClassifier::parse_numeric_tag(const std::string& value) {
    if (value.empty()) {
        return std::nullopt;
    }

    try {
        size_t consumed = 0;
        double parsed = std::stod(value, &consumed);
        if (consumed == 0 || !std::isfinite(parsed)) {
            return std::nullopt;
        }
        return parsed;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

} // namespace osmprint
