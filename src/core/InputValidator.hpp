/**
 * @file InputValidator.hpp
 * @brief Input validation for contradictory parameters
 *
 * Validates user inputs for contradictions and provides clear error messages
 * with suggested solutions when conflicts are detected. All conflicts are
 * collected before reporting.
 */

#pragma once

#include "osmprint.hpp"
#include <string>
#include <vector>
#include <optional>

namespace osmprint {

/**
 * @brief Represents a parameter conflict detected in user inputs
 */
struct ParameterConflict {
    std::string description;           // Description of the conflict
    std::vector<std::string> involved_params;  // Parameters involved
    std::vector<std::string> suggestions;      // Suggested resolutions
};

/**
 * @brief Result of input validation
 */
struct ValidationResult {
    bool is_valid;
    std::vector<ParameterConflict> conflicts;

    ValidationResult() : is_valid(true) {}

    bool has_errors() const { return !is_valid; }

    std::string format_error_message() const;
};

/**
 * @brief Output formats the exporters understand
 */
const std::vector<std::string>& supported_output_formats();

/**
 * @brief Validates user inputs for contradictions and conflicts
 */
class InputValidator {
public:
    InputValidator() = default;

    /**
     * @brief Validate all configuration parameters
     * @param config Configuration to validate
     * @param require_input_file Also require config.input_file to be set
     * @return Validation result with any conflicts found
     */
    ValidationResult validate(const PrintConfig& config, bool require_input_file = true) const;

private:
    /**
     * @brief Target print size must be a positive finite length
     */
    std::optional<ParameterConflict> check_target_size(const PrintConfig& config) const;

    /**
     * @brief Latitudes within [-90, 90], longitudes within [-180, 180]
     */
    std::optional<ParameterConflict> check_bounds_range(const PrintConfig& config) const;

    /**
     * @brief South below north and west below east
     */
    std::optional<ParameterConflict> check_bounds_order(const PrintConfig& config) const;

    std::optional<ParameterConflict> check_output_formats(const PrintConfig& config) const;

    std::optional<ParameterConflict> check_output_naming(const PrintConfig& config) const;

    std::optional<ParameterConflict> check_input_file(const PrintConfig& config) const;
};

} // namespace osmprint
