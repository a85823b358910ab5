/**
 * @file osmprint.hpp
 * @brief Main header for OSMPrint
 *
 * Turns tagged OpenStreetMap features inside a rectangular region into a
 * layered, printable solid model and writes it as a 3MF document.
 */

#pragma once

#include <memory>
#include <vector>
#include <string>
#include <array>
#include <optional>
#include <stdexcept>
#include <chrono>
#include <cstdint>
#include <cmath>
#include <cstdio>

// Linear algebra
#include <Eigen/Dense>
#include <Eigen/Geometry>

namespace osmprint {

// Forward declarations
struct OsmDataset;
struct SolidModel;
struct ScalePlan;

// ============================================================================
// Geometry Types
// ============================================================================

/**
 * @brief 3D point with x, y, z coordinates
 *
 * In preview space x and z are planar meters and y is the vertical axis.
 */
struct Point3D {
    double x_, y_, z_;

    Point3D() : x_(0), y_(0), z_(0) {}
    Point3D(double x, double y, double z) : x_(x), y_(y), z_(z) {}

    double x() const { return x_; }
    double y() const { return y_; }
    double z() const { return z_; }

    Eigen::Vector3d to_eigen() const { return Eigen::Vector3d(x_, y_, z_); }
    static Point3D from_eigen(const Eigen::Vector3d& v) { return Point3D(v.x(), v.y(), v.z()); }

    bool operator==(const Point3D& other) const {
        return x_ == other.x_ && y_ == other.y_ && z_ == other.z_;
    }
    bool operator!=(const Point3D& other) const { return !(*this == other); }
};

/**
 * @brief Planar distance between two projected points (ignores y)
 */
inline double planar_distance(const Point3D& a, const Point3D& b) {
    return std::hypot(b.x() - a.x(), b.z() - a.z());
}

/**
 * @brief 8-bit RGBA color
 */
struct Color {
    std::uint8_t r = 0, g = 0, b = 0, a = 255;

    Color() = default;
    Color(std::uint8_t red, std::uint8_t green, std::uint8_t blue, std::uint8_t alpha = 255)
        : r(red), g(green), b(blue), a(alpha) {}

    /// Build from a 0xRRGGBB literal
    static Color from_rgb(std::uint32_t rgb) {
        return Color(static_cast<std::uint8_t>((rgb >> 16) & 0xFF),
                     static_cast<std::uint8_t>((rgb >> 8) & 0xFF),
                     static_cast<std::uint8_t>(rgb & 0xFF));
    }

    /// "#RRGGBB", with an "AA" suffix when not fully opaque
    std::string to_hex_string() const {
        char buffer[10];
        if (a < 255) {
            std::snprintf(buffer, sizeof(buffer), "#%02X%02X%02X%02X", r, g, b, a);
        } else {
            std::snprintf(buffer, sizeof(buffer), "#%02X%02X%02X", r, g, b);
        }
        return buffer;
    }

    std::uint32_t packed() const {
        return (static_cast<std::uint32_t>(r) << 24) | (static_cast<std::uint32_t>(g) << 16) |
               (static_cast<std::uint32_t>(b) << 8) | a;
    }

    bool operator==(const Color& other) const { return packed() == other.packed(); }
};

/**
 * @brief Geographic rectangle in decimal degrees
 */
struct GeoBounds {
    double south = 0.0;
    double west = 0.0;
    double north = 0.0;
    double east = 0.0;

    GeoBounds() = default;
    GeoBounds(double s, double w, double n, double e) : south(s), west(w), north(n), east(e) {}

    double center_lat() const { return (south + north) / 2.0; }
    double center_lon() const { return (west + east) / 2.0; }
};

// ============================================================================
// Errors
// ============================================================================

/**
 * @brief Fatal geometry problem (empty boundary window, invalid scale inputs)
 */
class GeometryError : public std::runtime_error {
public:
    explicit GeometryError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief Export call failed; no partial document is produced
 */
class ExportError : public std::runtime_error {
public:
    explicit ExportError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief Input feature data could not be read
 */
class OsmDataError : public std::runtime_error {
public:
    explicit OsmDataError(const std::string& message) : std::runtime_error(message) {}
};

// ============================================================================
// Configuration
// ============================================================================

/**
 * @brief Configuration for print model generation
 */
struct PrintConfig {
    // Region and input data
    std::optional<GeoBounds> bounds;
    std::string input_file;

    // Target size of the longest horizontal side of the print
    double target_size_mm = 200.0;

    // Output configuration
    std::string output_directory = "output";
    std::string base_name = "osm_model";
    std::vector<std::string> output_formats = {"3mf"};
    bool vertex_colors = false;   // Bake piece colors into a 3MF color group
    bool stl_binary = true;

    // Config file support
    std::optional<std::string> config_file;

    // Logging options
    int log_level = 3;  // 1=ERROR, 2=WARNING, 3=INFO, 4=DETAILED, 5=DEBUG, 6=TRACE
    std::optional<std::string> log_file;
};

/**
 * @brief Performance metrics for one pipeline run
 */
struct PerformanceMetrics {
    std::chrono::milliseconds data_loading_time{0};
    std::chrono::milliseconds classification_time{0};
    std::chrono::milliseconds model_building_time{0};
    std::chrono::milliseconds total_time{0};

    size_t elements_loaded = 0;
    size_t pieces_generated = 0;
    size_t triangles_generated = 0;
};

// ============================================================================
// Generator
// ============================================================================

/**
 * @brief Runs the projection, classification, clipping, scaling and model
 * building stages and holds the resulting model.
 *
 * Each successful run replaces the previous model wholesale.
 */
class ModelGenerator {
public:
    explicit ModelGenerator(const PrintConfig& config);
    ~ModelGenerator();

    // Main generation pipeline (reads config.input_file)
    bool generate_model();

    // Pipeline over an already loaded dataset
    bool generate_model(const OsmDataset& dataset);

    // Accessors
    bool has_model() const;
    const SolidModel& get_model() const;
    const PerformanceMetrics& get_metrics() const;

    // Configuration
    void update_config(const PrintConfig& config);
    const PrintConfig& get_config() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

/**
 * @brief Factory function for a generator over a region and input file
 */
std::unique_ptr<ModelGenerator> create_generator(
    const GeoBounds& bounds,
    const std::string& input_file,
    double target_size_mm = 200.0
);

/**
 * @brief Utility function for one-shot model generation and export
 */
bool generate_print_model(
    const GeoBounds& bounds,
    const std::string& input_file,
    const std::string& output_directory,
    const std::vector<std::string>& formats = {"3mf"}
);

} // namespace osmprint
