/**
 * @file types.hpp
 * @brief Host-side value types shared by the codec, the runtime handle and the predictor
 */

#ifndef RBRIDGE_TYPES_HPP
#define RBRIDGE_TYPES_HPP

#include <cstdint>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <variant>
#include <vector>

#include <Eigen/SparseCore>
#include <arrow/type_fwd.h>

namespace rbridge {

/// Column name used when R returns a bare numeric vector (regression-style output)
constexpr const char* kPredictionColumn = "Predictions";

/// Column names marking a transform output as a sparse triplet frame
constexpr const char* kSparseRowColumn = "__DR__i";
constexpr const char* kSparseColColumn = "__DR__j";
constexpr const char* kSparseValueColumn = "__DR__x";

using Bytes = std::vector<uint8_t>;

/**
 * @brief Scalar value crossing the boundary in unstructured mode
 *
 * monostate is the host null; Bytes maps to an R raw vector and std::string to
 * a one-element R character vector.
 */
using HostValue = std::variant<std::monostate, Bytes, std::string>;

using HostMap = std::map<std::string, HostValue>;

/// Ordered, named, nullable columns
using TabularFrame = std::shared_ptr<arrow::Table>;

using TabularColumn = std::shared_ptr<arrow::ChunkedArray>;

using SparseMatrix = Eigen::SparseMatrix<double>;

/// Flat string configuration, as handed over by the serving layer
using ConfigMap = std::map<std::string, std::string>;

inline bool is_null(const HostValue& value) {
    return std::holds_alternative<std::monostate>(value);
}

/**
 * @brief Model target types understood by the R entry points
 */
enum class TargetType {
    REGRESSION,
    BINARY,
    MULTICLASS,
    ANOMALY,
    UNSTRUCTURED,
    TRANSFORM
};

/**
 * @brief Convert target type to the identifier passed to R
 */
std::string target_type_to_string(TargetType type);

/**
 * @brief Parse target type identifier
 * @throws ConfigurationError If the identifier is unknown
 */
TargetType string_to_target_type(const std::string& value);

/**
 * @brief Input payload formats the R side can read
 */
enum class PayloadFormat {
    CSV,
    MTX
};

std::string payload_format_to_string(PayloadFormat format);

/**
 * @brief Set of payload formats with MIME type lookup
 */
class SupportedPayloadFormats {
public:
    SupportedPayloadFormats() = default;

    void add(PayloadFormat format) { formats_.insert(format); }

    bool contains(PayloadFormat format) const {
        return formats_.count(format) > 0;
    }

    /**
     * @brief Check whether a request MIME type maps to a supported format
     *
     * Parameters after ';' (e.g. "; charset=utf8") are ignored.
     */
    bool is_mimetype_supported(const std::string& mimetype) const;

    size_t size() const { return formats_.size(); }

    std::set<PayloadFormat>::const_iterator begin() const { return formats_.begin(); }
    std::set<PayloadFormat>::const_iterator end() const { return formats_.end(); }

    bool operator==(const SupportedPayloadFormats& other) const {
        return formats_ == other.formats_;
    }

private:
    std::set<PayloadFormat> formats_;
};

/**
 * @brief Map a MIME type to a payload format
 *
 * @return true and sets @p format if the MIME type is recognized
 */
bool mimetype_to_payload_format(const std::string& mimetype, PayloadFormat& format);

} // namespace rbridge

#endif // RBRIDGE_TYPES_HPP
