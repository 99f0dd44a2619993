#ifndef RBRIDGE_CONFIG_PARSER_HPP
#define RBRIDGE_CONFIG_PARSER_HPP

#include "predictor_interface.hpp"
#include "types.hpp"
#include <string>
#include <vector>

namespace rbridge {

/**
 * @brief Builds predictor parameters from a flat string map
 *
 * Recognized keys: code_dir, target_type, positive_class_label,
 * negative_class_label, class_labels (comma separated), r_script_dir,
 * predictor_id. Values have environment references expanded.
 *
 * @param config Flat configuration
 * @return Parsed parameters
 * @throws ConfigurationError If a required key is missing or a value is invalid
 */
PredictorParams parse_predictor_params(const ConfigMap& config);

/**
 * @brief Parses predictor parameters from a JSON file
 *
 * Relative code_dir and r_script_dir values are resolved against the
 * directory containing the file.
 *
 * @param file_path Path to the JSON configuration file
 * @return Parsed parameters
 * @throws ConfigParseError if file cannot be read or JSON is invalid
 * @throws ConfigurationError if configuration is invalid
 */
PredictorParams parse_predictor_params_from_file(const std::string& file_path);

/**
 * @brief Parses predictor parameters from a JSON string
 *
 * class_labels may be a JSON array or a comma separated string.
 *
 * @param json_string JSON configuration as string
 * @return Parsed parameters
 * @throws ConfigParseError if JSON is invalid
 * @throws ConfigurationError if configuration is invalid
 */
PredictorParams parse_predictor_params_from_string(const std::string& json_string);

/**
 * @brief Splits a comma separated label list, trimming whitespace around each label
 */
std::vector<std::string> split_label_list(const std::string& value);

/**
 * @brief Expands environment variable references in a string
 *
 * Supports syntax: ${VAR_NAME} or $VAR_NAME
 *
 * @param value String potentially containing variable references
 * @return String with variables expanded
 */
std::string expand_environment_variables(const std::string& value);

/**
 * @brief Resolves file paths relative to config file directory
 *
 * If path is relative, makes it relative to the directory containing the config file.
 * Absolute paths are returned unchanged.
 *
 * @param path File path to resolve
 * @param config_file_path Path to the configuration file
 * @return Resolved path
 */
std::string resolve_relative_path(const std::string& path, const std::string& config_file_path);

} // namespace rbridge

#endif // RBRIDGE_CONFIG_PARSER_HPP
