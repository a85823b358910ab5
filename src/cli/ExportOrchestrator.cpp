/**
 * @file ExportOrchestrator.cpp
 * @brief Implementation of export orchestration
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "ExportOrchestrator.hpp"
#include "../core/ModelBuilder.hpp"
#include "../export/ThreeMFExporter.hpp"
#include "../export/STLExporter.hpp"
#include <filesystem>

namespace osmprint {

ExportOrchestrator::ExportOrchestrator(const ModelGenerator& generator)
    : generator_(generator)
    , logger_("ExportOrchestrator")
{
    logger_.debug("Export orchestrator initialized");
}

ExportOrchestrator::~ExportOrchestrator() = default;

bool ExportOrchestrator::export_all_formats() {
    auto start_time = std::chrono::high_resolution_clock::now();
    exported_files_.clear();

    // Get configuration from generator
    const auto& config = generator_.get_config();

    if (!generator_.has_model()) {
        logger_.error("No model to export; generation has not succeeded");
        return false;
    }
    const SolidModel& model = generator_.get_model();

    // Create output directory
    std::error_code ec;
    std::filesystem::create_directories(config.output_directory, ec);
    if (ec) {
        logger_.error("Cannot create output directory " + config.output_directory + ": " + ec.message());
        return false;
    }

    const std::filesystem::path output_dir(config.output_directory);
    bool success = true;

    for (const auto& format : config.output_formats) {
        if (format == "3mf") {
            const auto path = (output_dir / ThreeMFExporter::file_name(config.base_name)).string();
            success &= export_3mf(model, config, path);
        } else if (format == "stl") {
            const auto path = (output_dir / STLExporter::file_name(config.base_name)).string();
            success &= export_stl(model, config, path);
        } else {
            logger_.error("Unsupported output format: " + format);
            success = false;
        }
    }

    export_time_ = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::high_resolution_clock::now() - start_time);

    if (success) {
        logger_.info("Exported " + std::to_string(exported_files_.size()) + " file(s) in " +
                     std::to_string(export_time_.count()) + "ms");
    }
    return success;
}

bool ExportOrchestrator::export_3mf(const SolidModel& model, const PrintConfig& config, const std::string& path) {
    ThreeMFExporter::Options options;
    options.title = config.base_name;
    options.vertex_colors = config.vertex_colors;

    logger_.debug("Exporting 3MF model to " + path);
    try {
        ThreeMFExporter exporter(options);
        exporter.write_file(model, path);
    } catch (const ExportError& e) {
        logger_.error("3MF export failed: " + std::string(e.what()));
        return false;
    }

    exported_files_.push_back(path);
    return true;
}

bool ExportOrchestrator::export_stl(const SolidModel& model, const PrintConfig& config, const std::string& path) {
    STLExporter::Options options;
    options.binary_format = config.stl_binary;
    options.solid_name = config.base_name;

    logger_.debug("Exporting STL model to " + path);
    try {
        STLExporter exporter(options);
        exporter.write_file(model, path);
    } catch (const ExportError& e) {
        logger_.error("STL export failed: " + std::string(e.what()));
        return false;
    }

    exported_files_.push_back(path);
    return true;
}

// ============================================================================
// One-shot generation and export
// ============================================================================

bool generate_print_model(
    const GeoBounds& bounds,
    const std::string& input_file,
    const std::string& output_directory,
    const std::vector<std::string>& formats) {

    PrintConfig config;
    config.bounds = bounds;
    config.input_file = input_file;
    config.output_directory = output_directory;
    config.output_formats = formats;

    ModelGenerator generator(config);
    if (!generator.generate_model()) {
        return false;
    }

    ExportOrchestrator orchestrator(generator);
    return orchestrator.export_all_formats();
}

} // namespace osmprint
