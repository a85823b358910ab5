/**
 * @file main.cpp
 * @brief Main entry point for OSMPrint
 *
 * Builds a layered, printable city model from OpenStreetMap features and
 * writes it as 3MF (and optionally STL).
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "osmprint.hpp"
#include "version.h"
#include "core/Logger.hpp"
#include "core/ModelBuilder.hpp"
#include "cli/CommandLineInterface.hpp"
#include "cli/ExportOrchestrator.hpp"
#include <iostream>
#include <chrono>

using namespace osmprint;

/**
 * @brief Print performance summary
 */
void print_performance_summary(const PerformanceMetrics& metrics, std::chrono::milliseconds export_time) {
    std::cout << "\n=== Performance Summary ===\n";
    std::cout << "Data loading: " << metrics.data_loading_time.count() << "ms\n";
    std::cout << "Classification: " << metrics.classification_time.count() << "ms\n";
    std::cout << "Model building: " << metrics.model_building_time.count() << "ms\n";
    std::cout << "Export time: " << export_time.count() << "ms\n";
    std::cout << "Elements loaded: " << metrics.elements_loaded << "\n";
    std::cout << "Pieces generated: " << metrics.pieces_generated << "\n";
    std::cout << "Triangles generated: " << metrics.triangles_generated << "\n";
    std::cout << "============================\n";
}

/**
 * @brief Print per-layer piece counts and skipped features
 */
void print_model_summary(const SolidModel& model) {
    std::cout << "\n=== Model Summary ===\n";
    for (const auto& layer : model.layers) {
        std::cout << layer.name << ": " << model.piece_count(layer.kind) << " piece(s)\n";
    }
    std::cout << "Skipped features: " << model.stats.total_skipped() << "\n";
    std::cout << "=====================\n";
}

/**
 * @brief Main entry point
 */
int main(int argc, char* argv[]) {
    auto start_time = std::chrono::high_resolution_clock::now();

    try {
        Logger::configureFromEnvironment();

        CommandLineInterface cli;
        if (!cli.parse_arguments(argc, argv)) {
            return cli.exit_code();  // Help, version, config creation or error
        }

        const PrintConfig& config = cli.get_config();
        if (!Logger::setGlobalLogFile(config.log_file)) {
            std::cerr << "Warning: could not open log file " << config.log_file.value_or("") << "\n";
        }

        // Print banner only if not silent
        if (config.log_level > 1) {
            std::cout << "OSMPrint v" << OSMPRINT_VERSION_STRING << "\n";
            std::cout << "Layered 3D-printable city models from OpenStreetMap data\n";
        }

        cli.print_config();

        if (cli.is_dry_run()) {
            if (config.log_level > 1) {
                std::cout << "Dry run mode - configuration validated successfully\n";
            }
            return 0;
        }

        ModelGenerator generator(config);
        if (!generator.generate_model()) {
            std::cerr << "Error: Model generation failed\n";
            return 1;
        }

        ExportOrchestrator exporter(generator);
        if (!exporter.export_all_formats()) {
            std::cerr << "Error: Model export failed\n";
            return 1;
        }

        auto total_duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::high_resolution_clock::now() - start_time);

        if (config.log_level >= 4) {
            print_model_summary(generator.get_model());
            print_performance_summary(generator.get_metrics(), exporter.export_time());
        }

        if (config.log_level > 1) {
            for (const auto& path : exporter.exported_files()) {
                std::cout << "Wrote " << path << "\n";
            }
            std::cout << "\nModel generation completed successfully in "
                      << total_duration.count() << "ms\n";
        }

        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
