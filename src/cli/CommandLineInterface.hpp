/**
 * @file CommandLineInterface.hpp
 * @brief Command line interface for the OSM print model generator
 */

#pragma once

#include "osmprint.hpp"
#include "SimpleCommandLineParser.hpp"
#include <string>
#include <vector>

namespace osmprint {

/**
 * @brief Command line interface for parsing arguments and configuring the generator
 *
 * Precedence: defaults, then the --config file, then command line options.
 */
class CommandLineInterface {
public:
    CommandLineInterface() = default;

    /**
     * @brief Parse command line arguments
     * @param argc Argument count
     * @param argv Argument vector
     * @return true if the generator should run, false if it should exit
     *         (help, version, config creation, or an error; see exit_code())
     */
    bool parse_arguments(int argc, char* argv[]);

    /**
     * @brief Get the parsed configuration
     * @return PrintConfig object
     */
    const PrintConfig& get_config() const { return config_; }

    /**
     * @brief Check if this is a dry run
     * @return true if dry run mode is enabled
     */
    bool is_dry_run() const { return dry_run_; }

    /// Process exit code when parse_arguments() returned false
    int exit_code() const { return exit_code_; }

    /**
     * @brief Print the current configuration
     */
    void print_config() const;

    /**
     * @brief Write a JSON configuration file with every setting at its default
     */
    static bool create_default_config_file(const std::string& filename);

    /**
     * @brief Apply a JSON configuration file on top of the current settings
     */
    bool load_config_file(const std::string& filename);

    /**
     * @brief Parse "south,west,north,east" in decimal degrees
     */
    static std::optional<GeoBounds> parse_bounds(const std::string& bounds_str);

    /**
     * @brief Split a comma-separated format list, trimming and lowercasing
     */
    static std::vector<std::string> parse_formats(const std::string& formats_str);

private:
    PrintConfig config_;
    bool dry_run_ = false;
    int exit_code_ = 0;

    // Main parsing method
    bool parse_all_options(const SimpleCommandLineParser& parser);

    // Region bounds from --bounds or --south/--west/--north/--east
    bool parse_region_options(const SimpleCommandLineParser& parser);

    // Logging options: environment first, then command line
    void parse_logging_options(const SimpleCommandLineParser& parser);

    // Boolean option parsing with --no- variants
    void parse_boolean_option(const SimpleCommandLineParser& parser,
                             const std::string& positive_flag,
                             const std::string& negative_flag,
                             bool& config_value);
};

} // namespace osmprint
