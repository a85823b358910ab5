/**
 * @file ScalingCalculator.cpp
 * @brief Implementation of scale planning
 */

#include "ScalingCalculator.hpp"
#include <sstream>
#include <iomanip>
#include <cmath>
#include <algorithm>

namespace osmprint {

ScalingCalculator::ScalingCalculator() : logger_("ScalingCalculator") {}

ScalePlan ScalingCalculator::plan(double width_m, double depth_m, double target_size_mm) const {
    if (!std::isfinite(target_size_mm) || target_size_mm <= 0.0) {
        throw GeometryError("Target model size must be positive, got " + std::to_string(target_size_mm));
    }
    if (!std::isfinite(width_m) || !std::isfinite(depth_m) || width_m <= 0.0 || depth_m <= 0.0) {
        throw GeometryError("Cannot scale an empty region (" + std::to_string(width_m) + "m x " +
                            std::to_string(depth_m) + "m)");
    }

    ScalePlan result;
    result.extent_m = std::max(width_m, depth_m);
    result.target_size_mm = target_size_mm;
    result.horizontal_scale = result.extent_m / target_size_mm;
    result.display_vertical_scale = result.extent_m / kDisplayScaleDivisor;

    std::ostringstream explanation;
    explanation << std::fixed << std::setprecision(2);
    explanation << "Fitting " << result.extent_m << "m extent to " << target_size_mm << "mm\n";
    explanation << "  Region: " << width_m << "m x " << depth_m << "m\n";
    explanation << "  Horizontal scale: " << result.extent_m << "m / " << target_size_mm
                << "mm = " << std::setprecision(4) << result.horizontal_scale << " m/mm\n";
    explanation << "  Ratio: 1:" << std::setprecision(0) << result.horizontal_scale * 1000.0 << "\n";
    explanation << "  Preview vertical scale: " << std::setprecision(3)
                << result.display_vertical_scale << " units/mm";
    result.explanation = explanation.str();

    logger_.detailed(result.explanation);
    return result;
}

double ScalingCalculator::print_height_mm(double real_height_m, const HeightStats& stats) {
    if (!stats.has_range()) {
        return kMinPrintHeightMm;
    }

    const double height_ratio = (real_height_m - stats.min_building_height_m) /
                                (stats.max_building_height_m - stats.min_building_height_m);
    const double print_height = kMinPrintHeightMm + height_ratio * (kMaxPrintHeightMm - kMinPrintHeightMm);
    return std::clamp(print_height, kMinPrintHeightMm, kMaxPrintHeightMm);
}

} // namespace osmprint
