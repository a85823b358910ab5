/**
 * @file InputValidator.cpp
 * @brief Implementation of input validation
 */

#include "InputValidator.hpp"
#include <sstream>
#include <iomanip>
#include <cmath>
#include <algorithm>

namespace osmprint {

const std::vector<std::string>& supported_output_formats() {
    static const std::vector<std::string> formats = {"3mf", "stl"};
    return formats;
}

std::string ValidationResult::format_error_message() const {
    if (is_valid || conflicts.empty()) {
        return "";
    }

    std::ostringstream oss;
    oss << "\nERROR: Invalid or contradictory parameters detected:\n\n";

    for (size_t i = 0; i < conflicts.size(); ++i) {
        const auto& conflict = conflicts[i];

        oss << "Conflict " << (i + 1) << ": " << conflict.description << "\n";

        if (!conflict.involved_params.empty()) {
            oss << "  Involved parameters:\n";
            for (const auto& param : conflict.involved_params) {
                oss << "    " << param << "\n";
            }
        }

        if (!conflict.suggestions.empty()) {
            oss << "  Suggested solutions:\n";
            for (size_t j = 0; j < conflict.suggestions.size(); ++j) {
                oss << "    " << (j + 1) << ". " << conflict.suggestions[j] << "\n";
            }
        }

        if (i < conflicts.size() - 1) {
            oss << "\n";
        }
    }

    oss << "\nProgram terminated due to invalid inputs.\n";
    return oss.str();
}

ValidationResult InputValidator::validate(const PrintConfig& config, bool require_input_file) const {
    ValidationResult result;
    result.is_valid = true;

    auto add_conflict = [&result](std::optional<ParameterConflict> conflict) {
        if (conflict) {
            result.conflicts.push_back(std::move(*conflict));
            result.is_valid = false;
        }
    };

    add_conflict(check_target_size(config));
    add_conflict(check_bounds_range(config));
    add_conflict(check_bounds_order(config));
    add_conflict(check_output_formats(config));
    add_conflict(check_output_naming(config));
    if (require_input_file) {
        add_conflict(check_input_file(config));
    }

    return result;
}

std::optional<ParameterConflict> InputValidator::check_target_size(const PrintConfig& config) const {
    if (std::isfinite(config.target_size_mm) && config.target_size_mm > 0.0) {
        return std::nullopt;
    }

    ParameterConflict conflict;
    conflict.description = "Target print size must be a positive length";
    conflict.involved_params = {
        "--target-size " + std::to_string(config.target_size_mm) + "mm"
    };
    conflict.suggestions = {
        "Use --target-size 200 (default) or the size of your print bed in mm"
    };
    return conflict;
}

std::optional<ParameterConflict> InputValidator::check_bounds_range(const PrintConfig& config) const {
    if (!config.bounds) {
        return std::nullopt;
    }

    const GeoBounds& b = *config.bounds;
    std::vector<std::string> bad;
    auto check_lat = [&bad](const char* name, double value) {
        if (!std::isfinite(value) || value < -90.0 || value > 90.0) {
            bad.push_back(std::string("--") + name + " " + std::to_string(value) + " (latitude outside [-90, 90])");
        }
    };
    auto check_lon = [&bad](const char* name, double value) {
        if (!std::isfinite(value) || value < -180.0 || value > 180.0) {
            bad.push_back(std::string("--") + name + " " + std::to_string(value) + " (longitude outside [-180, 180])");
        }
    };
    check_lat("south", b.south);
    check_lat("north", b.north);
    check_lon("west", b.west);
    check_lon("east", b.east);

    if (bad.empty()) {
        return std::nullopt;
    }

    ParameterConflict conflict;
    conflict.description = "Region bounds are outside the valid coordinate range";
    conflict.involved_params = bad;
    conflict.suggestions = {
        "Give bounds in decimal degrees as --bounds south,west,north,east"
    };
    return conflict;
}

std::optional<ParameterConflict> InputValidator::check_bounds_order(const PrintConfig& config) const {
    if (!config.bounds) {
        return std::nullopt;
    }

    const GeoBounds& b = *config.bounds;
    if (b.south < b.north && b.west < b.east) {
        return std::nullopt;
    }

    ParameterConflict conflict;
    conflict.description = "Region bounds enclose no area";

    std::ostringstream values;
    values << std::fixed << std::setprecision(6);
    values << "--bounds " << b.south << "," << b.west << "," << b.north << "," << b.east;
    conflict.involved_params = {values.str()};

    if (b.south >= b.north) {
        conflict.suggestions.push_back("South (" + std::to_string(b.south) + ") must be below north (" +
                                       std::to_string(b.north) + "); swap the latitudes");
    }
    if (b.west >= b.east) {
        conflict.suggestions.push_back("West (" + std::to_string(b.west) + ") must be below east (" +
                                       std::to_string(b.east) + "); swap the longitudes");
    }
    return conflict;
}

std::optional<ParameterConflict> InputValidator::check_output_formats(const PrintConfig& config) const {
    const auto& supported = supported_output_formats();

    std::vector<std::string> unknown;
    for (const auto& format : config.output_formats) {
        if (std::find(supported.begin(), supported.end(), format) == supported.end()) {
            unknown.push_back("--output-formats " + format + " (unsupported)");
        }
    }

    if (config.output_formats.empty()) {
        ParameterConflict conflict;
        conflict.description = "No output format requested";
        conflict.involved_params = {"--output-formats (empty)"};
        conflict.suggestions = {"Use --output-formats 3mf or --output-formats 3mf,stl"};
        return conflict;
    }

    if (unknown.empty()) {
        return std::nullopt;
    }

    ParameterConflict conflict;
    conflict.description = "Unknown output format";
    conflict.involved_params = unknown;
    std::string list;
    for (const auto& format : supported) {
        if (!list.empty()) list += ", ";
        list += format;
    }
    conflict.suggestions = {"Supported formats: " + list};
    return conflict;
}

std::optional<ParameterConflict> InputValidator::check_output_naming(const PrintConfig& config) const {
    if (!config.base_name.empty() && config.base_name.find('/') == std::string::npos) {
        return std::nullopt;
    }

    ParameterConflict conflict;
    conflict.description = "Output base name must be a plain, non-empty file name";
    conflict.involved_params = {"--base-name '" + config.base_name + "'"};
    conflict.suggestions = {
        "Use --base-name osm_model and put directories in --output-dir"
    };
    return conflict;
}

std::optional<ParameterConflict> InputValidator::check_input_file(const PrintConfig& config) const {
    if (!config.input_file.empty()) {
        return std::nullopt;
    }

    ParameterConflict conflict;
    conflict.description = "No input feature file given";
    conflict.involved_params = {"--input (missing)"};
    conflict.suggestions = {
        "Use --input map.json with Overpass API JSON output",
        "Set \"input_file\" in the --config file"
    };
    return conflict;
}

} // namespace osmprint
