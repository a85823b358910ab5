/**
 * @file ExportOrchestrator.hpp
 * @brief Orchestrates export operations for generated print models
 *
 * This class coordinates exporting the generated solid model to the
 * configured output formats. It separates export orchestration from model
 * generation so that OSMPrintCore does not depend on OSMPrintExport.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "osmprint.hpp"
#include "../core/Logger.hpp"
#include <chrono>
#include <string>
#include <vector>

namespace osmprint {

/**
 * @brief Orchestrates export of a generated model to 3MF and STL
 *
 * Responsibilities:
 * - Create the output directory and name the output files
 * - Dispatch each configured format to its exporter
 * - Report export errors without leaving partial files behind
 */
class ExportOrchestrator {
public:
    /**
     * @brief Constructor
     * @param generator Reference to the model generator (data source)
     */
    explicit ExportOrchestrator(const ModelGenerator& generator);

    /**
     * @brief Destructor
     */
    ~ExportOrchestrator();

    /**
     * @brief Export the model to all configured output formats
     * @return true if all exports succeeded, false if any failed
     */
    bool export_all_formats();

    /// Paths written by the last export_all_formats() call
    const std::vector<std::string>& exported_files() const { return exported_files_; }

    std::chrono::milliseconds export_time() const { return export_time_; }

private:
    const ModelGenerator& generator_;
    Logger logger_;
    std::vector<std::string> exported_files_;
    std::chrono::milliseconds export_time_{0};

    bool export_3mf(const SolidModel& model, const PrintConfig& config, const std::string& path);
    bool export_stl(const SolidModel& model, const PrintConfig& config, const std::string& path);

    // Disable copy/move since we hold a reference
    ExportOrchestrator(const ExportOrchestrator&) = delete;
    ExportOrchestrator& operator=(const ExportOrchestrator&) = delete;
    ExportOrchestrator(ExportOrchestrator&&) = delete;
    ExportOrchestrator& operator=(ExportOrchestrator&&) = delete;
};

} // namespace osmprint
