/**
 * @file ScalingCalculator.hpp
 * @brief Horizontal print scale and building height normalization
 */

#pragma once

#include "osmprint.hpp"
#include "FeatureClassifier.hpp"
#include "Logger.hpp"
#include <string>

namespace osmprint {

/// Bounds of the normalized building print height
constexpr double kMinPrintHeightMm = 0.8;
constexpr double kMaxPrintHeightMm = 8.0;

/// Preview exaggeration divisor: display units per mm = extent / 50
constexpr double kDisplayScaleDivisor = 50.0;

/**
 * @brief Result of scale planning
 */
struct ScalePlan {
    double horizontal_scale = 1.0;        // meters of terrain per mm of print
    double display_vertical_scale = 1.0;  // preview units per mm; never used for export
    double target_size_mm = 0.0;
    double extent_m = 0.0;                // max(width, depth)
    std::string explanation;

    /// Print millimeters per terrain meter
    double mm_per_meter() const { return 1.0 / horizontal_scale; }
};

/**
 * @brief Computes the scale plan and maps real heights to print heights
 */
class ScalingCalculator {
public:
    ScalingCalculator();

    /**
     * @brief Plan scales for a window of the given size
     * @param width_m Window width in meters
     * @param depth_m Window depth in meters
     * @param target_size_mm Print size of the longest horizontal side
     * @throws GeometryError on non-positive or non-finite inputs
     */
    ScalePlan plan(double width_m, double depth_m, double target_size_mm) const;

    /**
     * @brief Map a building's real height to its print height in mm
     *
     * Linear in the observed height range, clamped to
     * [kMinPrintHeightMm, kMaxPrintHeightMm]. Returns exactly the minimum
     * when the range is empty or degenerate.
     */
    static double print_height_mm(double real_height_m, const HeightStats& stats);

private:
    Logger logger_;
};

} // namespace osmprint
