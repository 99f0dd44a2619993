/**
 * @file types.cpp
 * @brief String conversions for target types and payload formats
 */

#include "types.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cctype>

namespace rbridge {

namespace {

std::string normalize_mimetype(const std::string& mimetype) {
    std::string base = mimetype.substr(0, mimetype.find(';'));
    base.erase(std::remove_if(base.begin(), base.end(),
                              [](unsigned char c) { return std::isspace(c); }),
               base.end());
    std::transform(base.begin(), base.end(), base.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return base;
}

} // namespace

std::string target_type_to_string(TargetType type) {
    switch (type) {
        case TargetType::REGRESSION: return "regression";
        case TargetType::BINARY: return "binary";
        case TargetType::MULTICLASS: return "multiclass";
        case TargetType::ANOMALY: return "anomaly";
        case TargetType::UNSTRUCTURED: return "unstructured";
        case TargetType::TRANSFORM: return "transform";
        default: return "unknown";
    }
}

TargetType string_to_target_type(const std::string& value) {
    if (value == "regression") return TargetType::REGRESSION;
    if (value == "binary") return TargetType::BINARY;
    if (value == "multiclass") return TargetType::MULTICLASS;
    if (value == "anomaly") return TargetType::ANOMALY;
    if (value == "unstructured") return TargetType::UNSTRUCTURED;
    if (value == "transform") return TargetType::TRANSFORM;
    throw ConfigurationError("Unknown target type: '" + value + "'");
}

std::string payload_format_to_string(PayloadFormat format) {
    switch (format) {
        case PayloadFormat::CSV: return "csv";
        case PayloadFormat::MTX: return "mtx";
        default: return "unknown";
    }
}

bool mimetype_to_payload_format(const std::string& mimetype, PayloadFormat& format) {
    std::string base = normalize_mimetype(mimetype);
    if (base == "text/csv") {
        format = PayloadFormat::CSV;
        return true;
    }
    if (base == "text/mtx") {
        format = PayloadFormat::MTX;
        return true;
    }
    return false;
}

bool SupportedPayloadFormats::is_mimetype_supported(const std::string& mimetype) const {
    PayloadFormat format;
    if (!mimetype_to_payload_format(mimetype, format)) {
        return false;
    }
    return contains(format);
}

} // namespace rbridge
