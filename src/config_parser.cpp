#include "config_parser.hpp"
#include <nlohmann/json.hpp>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace rbridge {

namespace {

std::string trim(const std::string& value) {
    size_t begin = 0;
    size_t end = value.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(value[begin]))) {
        begin++;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(value[end - 1]))) {
        end--;
    }
    return value.substr(begin, end - begin);
}

std::optional<std::string> optional_value(const ConfigMap& config, const std::string& key) {
    auto it = config.find(key);
    if (it == config.end()) {
        return std::nullopt;
    }
    std::string value = expand_environment_variables(it->second);
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

void validate_predictor_params(const PredictorParams& params) {
    if (params.code_dir.empty()) {
        throw ConfigurationError("Missing required field: code_dir");
    }

    if (params.target_type == TargetType::BINARY) {
        if (params.positive_class_label.has_value() != params.negative_class_label.has_value()) {
            throw ConfigurationError(
                "Binary target requires both positive_class_label and negative_class_label");
        }
    }

    if (params.class_labels && params.class_labels->empty()) {
        throw ConfigurationError("class_labels must not be empty when provided");
    }
}

} // namespace

std::string expand_environment_variables(const std::string& value) {
    std::string result = value;
    size_t pos = 0;

    while ((pos = result.find('$', pos)) != std::string::npos) {
        size_t start = pos;
        pos++; // Skip '$'

        // Check for ${VAR} syntax
        bool braces = false;
        if (pos < result.size() && result[pos] == '{') {
            braces = true;
            pos++; // Skip '{'
        }

        // Extract variable name
        size_t name_start = pos;
        while (pos < result.size() &&
               (std::isalnum(static_cast<unsigned char>(result[pos])) || result[pos] == '_')) {
            pos++;
        }
        std::string var_name = result.substr(name_start, pos - name_start);

        if (var_name.empty()) {
            // Lone '$' is kept literally
            pos = start + 1;
            continue;
        }

        if (braces && pos < result.size() && result[pos] == '}') {
            pos++; // Skip '}'
        }

        const char* env_value = std::getenv(var_name.c_str());
        std::string replacement = env_value ? env_value : "";

        result.replace(start, pos - start, replacement);
        pos = start + replacement.size();
    }

    return result;
}

std::string resolve_relative_path(const std::string& path, const std::string& config_file_path) {
    fs::path p(path);

    if (p.is_absolute()) {
        return path;
    }

    // Get directory containing config file
    fs::path config_dir = fs::path(config_file_path).parent_path();

    // Resolve relative to config directory
    fs::path resolved = config_dir / p;
    return resolved.string();
}

std::vector<std::string> split_label_list(const std::string& value) {
    std::vector<std::string> labels;
    std::istringstream stream(value);
    std::string item;
    while (std::getline(stream, item, ',')) {
        std::string label = trim(item);
        if (!label.empty()) {
            labels.push_back(label);
        }
    }
    return labels;
}

PredictorParams parse_predictor_params(const ConfigMap& config) {
    PredictorParams params;

    auto code_dir = optional_value(config, "code_dir");
    if (!code_dir) {
        throw ConfigurationError("Missing required field: code_dir");
    }
    params.code_dir = *code_dir;

    auto target_type = optional_value(config, "target_type");
    if (!target_type) {
        throw ConfigurationError("Missing required field: target_type");
    }
    params.target_type = string_to_target_type(*target_type);

    params.positive_class_label = optional_value(config, "positive_class_label");
    params.negative_class_label = optional_value(config, "negative_class_label");

    if (auto labels = optional_value(config, "class_labels")) {
        params.class_labels = split_label_list(*labels);
    }

    if (auto script_dir = optional_value(config, "r_script_dir")) {
        params.r_script_dir = *script_dir;
    }

    if (auto predictor_id = optional_value(config, "predictor_id")) {
        params.predictor_id = *predictor_id;
    }

    validate_predictor_params(params);
    return params;
}

PredictorParams parse_predictor_params_from_string(const std::string& json_string) {
    ConfigMap flat;

    try {
        json j = json::parse(json_string);

        if (!j.is_object()) {
            throw ConfigParseError("Configuration must be a JSON object");
        }

        for (auto it = j.begin(); it != j.end(); ++it) {
            if (it.key() == "class_labels" && it.value().is_array()) {
                // Re-joined below after validation of each entry
                continue;
            }
            if (it.value().is_null()) {
                continue;
            }
            flat[it.key()] = it.value().is_string()
                ? it.value().get<std::string>()
                : it.value().dump();
        }

        PredictorParams params = parse_predictor_params(flat);

        if (j.contains("class_labels") && j["class_labels"].is_array()) {
            std::vector<std::string> labels;
            for (const auto& label : j["class_labels"]) {
                labels.push_back(expand_environment_variables(
                    label.is_string() ? label.get<std::string>() : label.dump()));
            }
            params.class_labels = labels;
            validate_predictor_params(params);
        }

        return params;

    } catch (const json::parse_error& e) {
        throw ConfigParseError(std::string("JSON parse error: ") + e.what());
    } catch (const json::type_error& e) {
        throw ConfigParseError(std::string("JSON type error: ") + e.what());
    }
}

PredictorParams parse_predictor_params_from_file(const std::string& file_path) {
    // Read file
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw ConfigParseError("Failed to open config file: " + file_path);
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();

    PredictorParams params = parse_predictor_params_from_string(buffer.str());

    // Resolve relative paths
    params.code_dir = resolve_relative_path(params.code_dir, file_path);
    if (!params.r_script_dir.empty()) {
        params.r_script_dir = resolve_relative_path(params.r_script_dir, file_path);
    }

    return params;
}

} // namespace rbridge
