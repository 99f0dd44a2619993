/**
 * @file predictor_interface.hpp
 * @brief Host-facing predictor interface
 *
 * This is the surface the serving framework consumes. A predictor is
 * configured once and then services structured predictions, unstructured
 * predictions and transforms, possibly from several threads.
 *
 * Lifecycle:
 *   1. configure(params) - start the R session, check hooks, load the model
 *   2. predict_structured / predict_unstructured / transform - any number of times
 *   3. destruction - releases the model and the session
 */

#ifndef RBRIDGE_PREDICTOR_INTERFACE_HPP
#define RBRIDGE_PREDICTOR_INTERFACE_HPP

#include "errors.hpp"
#include "types.hpp"

#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace rbridge {

/**
 * @brief Predictor configuration
 */
struct PredictorParams {
    std::string code_dir;                                   ///< Directory holding the model artifact and custom.R
    TargetType target_type;                                 ///< Model target type
    std::optional<std::string> positive_class_label;        ///< Binary positive label
    std::optional<std::string> negative_class_label;        ///< Binary negative label
    std::optional<std::vector<std::string>> class_labels;   ///< Full label set (multiclass)
    std::string r_script_dir;                               ///< Directory with common.R and score.R (empty: built-in default)
    std::string predictor_id;                               ///< Identifier used in log events

    PredictorParams()
        : target_type(TargetType::REGRESSION), predictor_id("rbridge") {}

    PredictorParams(const std::string& code_dir_, TargetType target_type_)
        : code_dir(code_dir_), target_type(target_type_), predictor_id("rbridge") {}
};

/**
 * @brief Predictor lifecycle state
 */
enum class PredictorState {
    UNCONFIGURED,   ///< Created, configure() not called yet
    CONFIGURING,    ///< configure() in progress
    CONFIGURED,     ///< Model loaded, servicing requests
    FAILED          ///< configure() failed; the predictor is unusable
};

inline std::string state_to_string(PredictorState state) {
    switch (state) {
        case PredictorState::UNCONFIGURED: return "UNCONFIGURED";
        case PredictorState::CONFIGURING: return "CONFIGURING";
        case PredictorState::CONFIGURED: return "CONFIGURED";
        case PredictorState::FAILED: return "FAILED";
        default: return "UNKNOWN";
    }
}

/// Unstructured request body: raw bytes or text
using UnstructuredData = std::variant<Bytes, std::string>;

/**
 * @brief Result of an unstructured prediction
 */
struct UnstructuredResult {
    HostValue payload;                  ///< Bytes, text or null
    std::optional<HostMap> metadata;    ///< Response metadata, absent if R returned NULL
};

/// Transform features: a dense frame, or a sparse matrix rebuilt from triplets
using TransformFeatures = std::variant<TabularFrame, SparseMatrix>;

/// Transform target: none, a frame, or a single column
using TransformTarget = std::variant<std::monostate, TabularFrame, TabularColumn>;

/**
 * @brief Result of a transform
 */
struct TransformResult {
    TransformFeatures features;
    TransformTarget target;

    bool is_sparse() const { return std::holds_alternative<SparseMatrix>(features); }
    bool has_target() const { return !std::holds_alternative<std::monostate>(target); }
};

/**
 * @brief Abstract predictor
 */
class IPredictor {
public:
    virtual ~IPredictor() = default;

    /**
     * @brief Configure the predictor and load the model
     *
     * @throws ConfigurationError If a required hook is missing or params are invalid
     * @throws ForeignExecutionError If R fails during init or model load
     * @throws PredictorStateError If called more than once
     */
    virtual void configure(const PredictorParams& params) = 0;

    /**
     * @brief Score a structured payload (CSV, MTX, ...)
     *
     * @param binary_data Request body
     * @param mimetype Request MIME type, if known
     * @return Predictions; regression outputs come back as a single "Predictions" column
     *
     * @throws InvalidPredictionShape If R does not return a frame or numeric vector
     * @throws ForeignExecutionError If R signals an error
     */
    virtual TabularFrame predict_structured(
        const Bytes& binary_data,
        const std::optional<std::string>& mimetype = std::nullopt
    ) = 0;

    /**
     * @brief Score an arbitrary payload
     *
     * @param data Request body as bytes or text
     * @param query Request query parameters
     * @param extra Additional keyword arguments (mimetype, charset, ...); null values are dropped
     *
     * @throws UnexpectedResultType If R does not return list(payload, metadata)
     * @throws ForeignExecutionError If R signals an error
     */
    virtual UnstructuredResult predict_unstructured(
        const UnstructuredData& data,
        const std::optional<HostMap>& query = std::nullopt,
        const HostMap& extra = {}
    ) = 0;

    /**
     * @brief Run the transform hook
     *
     * @throws InvalidTransformOutput If R does not return list(features, target)
     * @throws ForeignExecutionError If R signals an error
     */
    virtual TransformResult transform(
        const Bytes& binary_data,
        const std::optional<Bytes>& target_binary_data = std::nullopt,
        const std::optional<std::string>& mimetype = std::nullopt
    ) = 0;

    /// Whether the model code defines a read_input_data hook
    virtual bool has_read_input_data_hook() = 0;

    virtual SupportedPayloadFormats supported_payload_formats() const = 0;

    virtual bool is_configured() const = 0;
};

} // namespace rbridge

#endif // RBRIDGE_PREDICTOR_INTERFACE_HPP
