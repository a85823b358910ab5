/**
 * @file CommandLineInterface.cpp
 * @brief Command line interface implementation
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "CommandLineInterface.hpp"
#include "SimpleCommandLineParser.hpp"
#include "../core/InputValidator.hpp"
#include "../core/Logger.hpp"
#include "version.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <iostream>
#include <fstream>
#include <sstream>
#include <cstdlib>

using json = nlohmann::json;

namespace osmprint {

bool CommandLineInterface::parse_arguments(int argc, char* argv[]) {
    exit_code_ = 0;

    SimpleCommandLineParser parser("osm-print",
        "Generate layered, multi-material 3D print models from OpenStreetMap data\n"
        "\n"
        "Reads Overpass API JSON, classifies buildings, roads, parks, sand and\n"
        "water, and writes a 3MF model with one material per layer.\n");

    // Input and configuration
    parser.add_option("input", "i", "Overpass API JSON file");
    parser.add_option("config", "c", "Path to JSON configuration file");
    parser.add_option("create-config", "", "Create default configuration file at path");

    // Region options
    parser.add_option("bounds", "b", "Region bounds as south,west,north,east");
    parser.add_option("south", "", "Southern latitude");
    parser.add_option("west", "", "Western longitude");
    parser.add_option("north", "", "Northern latitude");
    parser.add_option("east", "", "Eastern longitude");

    // Scaling
    parser.add_option("target-size", "", "Print size of the longest horizontal side in mm", false, "200");

    // Output options
    parser.add_option("output-dir", "o", "Output directory", false, "output");
    parser.add_option("base-name", "", "Base name for output files", false, "osm_model");
    parser.add_option("output-formats", "f", "Output formats: 3mf,stl (comma-separated)", false, "3mf");
    parser.add_flag("vertex-colors", "", "Bake piece colors into a 3MF color group");
    parser.add_flag("no-vertex-colors", "", "Do not write vertex colors (default)");
    parser.add_flag("stl-ascii", "", "Write ASCII STL instead of binary");

    // Logging and utility options
    parser.add_flag("silent", "s", "Only report errors (same as --log-level 1)");
    parser.add_flag("verbose", "v", "Enable verbose logging (same as --log-level 6)");
    parser.add_option("log-level", "", "Logging level: 1=ERROR, 2=WARNING, 3=INFO (default), 4=DETAILED, 5=DEBUG, 6=TRACE\n"
                                       "                Supports facility-specific: \"3,ModelBuilder=6\" or \"ThreeMFExporter=5\"", false, "3");
    parser.add_option("log-file", "", "Log to file (append if exists)");
    parser.add_flag("dry-run", "", "Parse arguments and validate without processing");
    parser.add_flag("version", "", "Show version information");

    if (!parser.parse(argc, argv)) {
        exit_code_ = parser.help_requested() ? 0 : 1;
        return false;
    }

    // Handle version flag
    if (parser.get_flag("version")) {
        std::cout << "OSMPrint v" << OSMPRINT_VERSION_STRING << std::endl;
        std::cout << "Layered 3MF city models from OpenStreetMap features" << std::endl;
        std::cout << "Built with CGAL, Eigen, nlohmann/json" << std::endl;
        std::cout << "Copyright (c) 2025 Matthew Block" << std::endl;
        return false;
    }

    // Handle create-config flag
    if (auto config_path = parser.get("create-config")) {
        if (!create_default_config_file(config_path.value())) {
            std::cerr << "Failed to create configuration file: " << config_path.value() << std::endl;
            exit_code_ = 1;
            return false;
        }
        std::cout << "Created default configuration file: " << config_path.value() << std::endl;
        return false;
    }

    // Load configuration file if specified
    if (auto config_file = parser.get("config")) {
        if (!load_config_file(config_file.value())) {
            std::cerr << "Failed to load configuration file: " << config_file.value() << std::endl;
            exit_code_ = 1;
            return false;
        }
        config_.config_file = config_file.value();
    }

    if (!parse_all_options(parser)) {
        exit_code_ = 1;
        return false;
    }

    // Report every configuration problem at once
    InputValidator validator;
    auto validation_result = validator.validate(config_);
    if (validation_result.has_errors()) {
        std::cerr << validation_result.format_error_message();
        exit_code_ = 1;
        return false;
    }

    return true;
}

std::optional<GeoBounds> CommandLineInterface::parse_bounds(const std::string& bounds_str) {
    std::istringstream iss(bounds_str);
    std::string token;
    std::vector<double> coords;

    while (std::getline(iss, token, ',')) {
        try {
            size_t consumed = 0;
            double value = std::stod(token, &consumed);
            if (token.find_first_not_of(" \t", consumed) != std::string::npos) {
                return std::nullopt;
            }
            coords.push_back(value);
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }

    if (coords.size() != 4) {
        return std::nullopt;
    }

    // south,west,north,east
    return GeoBounds(coords[0], coords[1], coords[2], coords[3]);
}

bool CommandLineInterface::parse_region_options(const SimpleCommandLineParser& parser) {
    if (auto value = parser.get("bounds")) {
        auto bounds = parse_bounds(value.value());
        if (!bounds) {
            std::cerr << "Invalid --bounds '" << value.value() << "'. Use: south,west,north,east" << std::endl;
            return false;
        }
        config_.bounds = bounds;
    }

    auto south = parser.get_as<double>("south");
    auto west = parser.get_as<double>("west");
    auto north = parser.get_as<double>("north");
    auto east = parser.get_as<double>("east");
    const int given = static_cast<int>(south.has_value()) + static_cast<int>(west.has_value()) +
                      static_cast<int>(north.has_value()) + static_cast<int>(east.has_value());

    if (given == 4) {
        config_.bounds = GeoBounds(*south, *west, *north, *east);
    } else if (given > 0) {
        // Partial edges adjust bounds already known from --bounds or the config file
        if (!config_.bounds) {
            std::cerr << "Give all of --south, --west, --north and --east, or use --bounds" << std::endl;
            return false;
        }
        if (south) config_.bounds->south = *south;
        if (west) config_.bounds->west = *west;
        if (north) config_.bounds->north = *north;
        if (east) config_.bounds->east = *east;
    }
    return true;
}

bool CommandLineInterface::parse_all_options(const SimpleCommandLineParser& parser) {
    if (auto value = parser.get("input")) {
        config_.input_file = value.value();
    } else if (!parser.get_positional().empty()) {
        config_.input_file = parser.get_positional().front();
    }

    if (!parse_region_options(parser)) {
        return false;
    }

    if (auto value = parser.get("target-size")) {
        auto size = parser.get_as<double>("target-size");
        if (!size) {
            std::cerr << "Invalid --target-size '" << value.value() << "'" << std::endl;
            return false;
        }
        config_.target_size_mm = size.value();
    }

    // Output options
    if (auto value = parser.get("base-name")) config_.base_name = value.value();
    if (auto value = parser.get("output-dir")) {
        std::string path = value.value();
        // Remove trailing slash if present for consistency
        if (path.size() > 1 && path.back() == '/') {
            path.pop_back();
        }
        config_.output_directory = path;
    }
    if (auto value = parser.get("output-formats")) {
        config_.output_formats = parse_formats(value.value());
    }

    parse_boolean_option(parser, "vertex-colors", "no-vertex-colors", config_.vertex_colors);
    if (parser.get_flag("stl-ascii")) config_.stl_binary = false;

    parse_logging_options(parser);

    // Utility flags
    dry_run_ = parser.get_flag("dry-run");
    return true;
}

void CommandLineInterface::parse_logging_options(const SimpleCommandLineParser& parser) {
    // Logging options with priority: CLI > ENV > config file > defaults
    auto default_level_of = [](const std::string& log_config) -> std::optional<int> {
        std::string first_part = log_config.substr(0, log_config.find(','));
        if (first_part.find('=') != std::string::npos) {
            return std::nullopt;
        }
        try {
            return std::clamp(std::stoi(first_part), 1, 6);
        } catch (const std::exception&) {
            return std::nullopt;
        }
    };

    // 1. Environment (facility overrides were applied by Logger::configureFromEnvironment)
    if (const char* env_log_level = std::getenv("OSMPRINT_LOG_LEVEL")) {
        if (auto level = default_level_of(env_log_level)) {
            config_.log_level = *level;
        }
    }

    // 2. CLI arguments override environment
    if (auto value = parser.get("log-level")) {
        Logger::parseLogConfig(value.value());
        if (auto level = default_level_of(value.value())) {
            config_.log_level = *level;
        }
    }

    // 3. Flags override everything
    if (parser.get_flag("silent")) {
        config_.log_level = 1;
    }
    if (parser.get_flag("verbose")) {
        config_.log_level = 6;
    }
    Logger::setDefaultLevel(static_cast<LogLevel>(config_.log_level));

    // 4. Log file configuration
    if (const char* env_log_file = std::getenv("OSMPRINT_LOG_FILE")) {
        config_.log_file = std::string(env_log_file);
    }
    if (auto value = parser.get("log-file")) {
        config_.log_file = value.value();  // CLI overrides environment
    }
}

void CommandLineInterface::parse_boolean_option(const SimpleCommandLineParser& parser,
                                               const std::string& positive_flag,
                                               const std::string& negative_flag,
                                               bool& config_value) {
    if (parser.get_flag(positive_flag)) {
        config_value = true;
    } else if (parser.get_flag(negative_flag)) {
        config_value = false;
    }
    // If neither is specified, keep default value
}

bool CommandLineInterface::create_default_config_file(const std::string& filename) {
    const PrintConfig defaults;

    json config;
    config["input_file"] = "map.json";
    config["south"] = nullptr;
    config["west"] = nullptr;
    config["north"] = nullptr;
    config["east"] = nullptr;
    config["target_size_mm"] = defaults.target_size_mm;
    config["output_dir"] = defaults.output_directory;
    config["base_name"] = defaults.base_name;
    config["output_formats"] = defaults.output_formats;
    config["vertex_colors"] = defaults.vertex_colors;
    config["stl_binary"] = defaults.stl_binary;
    config["log_level"] = defaults.log_level;
    config["log_file"] = nullptr;

    std::ofstream file(filename);
    if (!file.is_open()) {
        return false;
    }
    file << config.dump(2) << "\n";
    return static_cast<bool>(file);
}

bool CommandLineInterface::load_config_file(const std::string& filename) {
    try {
        std::ifstream file(filename);
        if (!file.is_open()) {
            std::cerr << "Error: Could not open config file: " << filename << std::endl;
            return false;
        }

        json config;
        file >> config;

        if (!config.is_object()) {
            std::cerr << "Error: Config file must contain a JSON object: " << filename << std::endl;
            return false;
        }

        auto number_or_null = [&config](const std::string& key) -> std::optional<double> {
            if (!config.contains(key) || config[key].is_null()) return std::nullopt;
            return config[key].get<double>();
        };

        // Region: "bounds" as "s,w,n,e" or [s, w, n, e], or separate edges
        if (config.contains("bounds") && !config["bounds"].is_null()) {
            const auto& bounds = config["bounds"];
            if (bounds.is_string()) {
                auto parsed = parse_bounds(bounds.get<std::string>());
                if (!parsed) {
                    std::cerr << "Error: Invalid \"bounds\" in config file: " << bounds.get<std::string>() << std::endl;
                    return false;
                }
                config_.bounds = parsed;
            } else if (bounds.is_array() && bounds.size() == 4) {
                config_.bounds = GeoBounds(bounds[0].get<double>(), bounds[1].get<double>(),
                                           bounds[2].get<double>(), bounds[3].get<double>());
            } else {
                std::cerr << "Error: \"bounds\" must be \"south,west,north,east\" or a 4-element array" << std::endl;
                return false;
            }
        }
        auto south = number_or_null("south");
        auto west = number_or_null("west");
        auto north = number_or_null("north");
        auto east = number_or_null("east");
        if (south && west && north && east) {
            config_.bounds = GeoBounds(*south, *west, *north, *east);
        }

        if (config.contains("input_file") && config["input_file"].is_string())
            config_.input_file = config["input_file"];
        if (auto value = number_or_null("target_size_mm")) config_.target_size_mm = *value;

        if (config.contains("base_name")) config_.base_name = config["base_name"];
        if (config.contains("output_dir")) config_.output_directory = config["output_dir"];

        // Output formats
        if (config.contains("output_formats")) {
            const auto& formats = config["output_formats"];
            if (formats.is_string()) {
                config_.output_formats = parse_formats(formats.get<std::string>());
            } else {
                config_.output_formats.clear();
                for (const auto& format : formats) {
                    auto parsed = parse_formats(format.get<std::string>());
                    config_.output_formats.insert(config_.output_formats.end(), parsed.begin(), parsed.end());
                }
            }
        }

        // Boolean parameters
        if (config.contains("vertex_colors")) config_.vertex_colors = config["vertex_colors"];
        if (config.contains("stl_binary")) config_.stl_binary = config["stl_binary"];

        // Logging
        if (config.contains("log_level") && config["log_level"].is_number())
            config_.log_level = std::clamp(config["log_level"].get<int>(), 1, 6);
        if (config.contains("log_file") && config["log_file"].is_string())
            config_.log_file = config["log_file"].get<std::string>();

        return true;

    } catch (const json::exception& e) {
        std::cerr << "Error parsing JSON config file: " << e.what() << std::endl;
        return false;
    }
}

std::vector<std::string> CommandLineInterface::parse_formats(const std::string& formats_str) {
    std::vector<std::string> formats;
    std::istringstream iss(formats_str);
    std::string format;

    while (std::getline(iss, format, ',')) {
        // Trim whitespace
        format.erase(0, format.find_first_not_of(" \t"));
        format.erase(format.find_last_not_of(" \t") + 1);
        std::transform(format.begin(), format.end(), format.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (!format.empty() && std::find(formats.begin(), formats.end(), format) == formats.end()) {
            formats.push_back(format);
        }
    }

    return formats;
}

void CommandLineInterface::print_config() const {
    if (config_.log_level < 4) return;  // Only print at DETAILED level or higher

    std::cout << "\n=== Configuration ===\n";
    std::cout << "Input: " << config_.input_file << "\n";
    if (config_.bounds) {
        std::cout << "Bounds: " << config_.bounds->south << "," << config_.bounds->west
                  << " to " << config_.bounds->north << "," << config_.bounds->east << "\n";
    } else {
        std::cout << "Bounds: from input data\n";
    }
    std::cout << "Target size: " << config_.target_size_mm << "mm\n";
    std::cout << "Output directory: " << config_.output_directory << "\n";
    std::cout << "Base name: " << config_.base_name << "\n";
    std::cout << "Formats: ";
    for (size_t i = 0; i < config_.output_formats.size(); ++i) {
        if (i > 0) std::cout << ", ";
        std::cout << config_.output_formats[i];
    }
    std::cout << "\nVertex colors: " << (config_.vertex_colors ? "yes" : "no") << "\n";
    std::cout << "STL encoding: " << (config_.stl_binary ? "binary" : "ASCII") << "\n";
    std::cout << "===================\n\n";
}

} // namespace osmprint
