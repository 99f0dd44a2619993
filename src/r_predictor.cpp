/**
 * @file r_predictor.cpp
 * @brief Implementation of RPredictor
 */

#include "r_predictor.hpp"
#include "logger.hpp"

#include <arrow/api.h>

#include <cmath>
#include <limits>
#include <stdexcept>

namespace rbridge {

namespace {

std::string describe(const ForeignResult& result) {
    if (auto list = std::get_if<ForeignList>(&result)) {
        return "list of length " + std::to_string(list->size());
    }
    return result_type_name(result);
}

std::vector<double> numeric_column(const TabularFrame& frame, const char* name) {
    auto column = frame->GetColumnByName(name);
    if (!column) {
        throw InvalidTransformOutput("sparse triplet frame", "frame without column " + std::string(name));
    }

    std::vector<double> values;
    values.reserve(static_cast<size_t>(column->length()));

    for (const auto& chunk : column->chunks()) {
        if (chunk->null_count() > 0) {
            throw InvalidTransformOutput("numeric column", "column with NA",
                                         "Sparse column '" + std::string(name) + "' contains NA.");
        }
        switch (chunk->type_id()) {
            case arrow::Type::DOUBLE: {
                auto array = std::static_pointer_cast<arrow::DoubleArray>(chunk);
                for (int64_t i = 0; i < array->length(); ++i) {
                    values.push_back(array->Value(i));
                }
                break;
            }
            case arrow::Type::INT32: {
                auto array = std::static_pointer_cast<arrow::Int32Array>(chunk);
                for (int64_t i = 0; i < array->length(); ++i) {
                    values.push_back(static_cast<double>(array->Value(i)));
                }
                break;
            }
            default:
                throw InvalidTransformOutput("numeric column", chunk->type()->ToString(),
                                             "Sparse column '" + std::string(name) + "' is not numeric.");
        }
    }
    return values;
}

// Eigen's default StorageIndex is int
Eigen::Index to_index(double value, const char* what) {
    if (!std::isfinite(value) || value != std::floor(value)) {
        throw InvalidTransformOutput("integer " + std::string(what), std::to_string(value));
    }
    if (std::fabs(value) > static_cast<double>(std::numeric_limits<int>::max())) {
        throw InvalidTransformOutput(std::string(what) + " within int range", std::to_string(value));
    }
    return static_cast<Eigen::Index>(value);
}

} // namespace

// ============================================================================
// Sparse reconstruction
// ============================================================================

bool is_triplet_frame(const TabularFrame& frame) {
    if (!frame) {
        return false;
    }
    const std::vector<std::string> names = frame->ColumnNames();
    return names.size() == 3 &&
           names[0] == kSparseRowColumn &&
           names[1] == kSparseColColumn &&
           names[2] == kSparseValueColumn;
}

SparseMatrix triplet_frame_to_sparse(const TabularFrame& frame) {
    if (!frame || frame->num_rows() < 1) {
        throw InvalidTransformOutput("sparse triplet frame with a shape row", "empty frame");
    }

    const std::vector<double> rows = numeric_column(frame, kSparseRowColumn);
    const std::vector<double> cols = numeric_column(frame, kSparseColColumn);
    const std::vector<double> values = numeric_column(frame, kSparseValueColumn);

    // Last row carries the shape
    const Eigen::Index num_rows = to_index(rows.back(), "row count");
    const Eigen::Index num_cols = to_index(cols.back(), "column count");
    if (num_rows < 0 || num_cols < 0) {
        throw InvalidTransformOutput("non-negative shape",
                                     "(" + std::to_string(num_rows) + ", " + std::to_string(num_cols) + ")");
    }

    const size_t entry_count = rows.size() - 1;
    std::vector<Eigen::Triplet<double>> triplets;
    triplets.reserve(entry_count);

    for (size_t k = 0; k < entry_count; ++k) {
        // 1-based in R
        const Eigen::Index row = to_index(rows[k], "row index") - 1;
        const Eigen::Index col = to_index(cols[k], "column index") - 1;
        if (row < 0 || row >= num_rows || col < 0 || col >= num_cols) {
            throw InvalidTransformOutput(
                "index inside (" + std::to_string(num_rows) + ", " + std::to_string(num_cols) + ")",
                "(" + std::to_string(row + 1) + ", " + std::to_string(col + 1) + ")");
        }
        triplets.emplace_back(static_cast<int>(row), static_cast<int>(col), values[k]);
    }

    SparseMatrix matrix(num_rows, num_cols);
    matrix.setFromTriplets(triplets.begin(), triplets.end());
    return matrix;
}

// ============================================================================
// RPredictor
// ============================================================================

RPredictor::RPredictor(SessionFactory session_factory)
    : session_factory_(std::move(session_factory)),
      state_(PredictorState::UNCONFIGURED) {

    if (!session_factory_) {
        throw std::invalid_argument("RPredictor: session factory cannot be empty");
    }
}

void RPredictor::configure(const PredictorParams& params) {
    // Claim the UNCONFIGURED -> CONFIGURING step so only one caller configures
    PredictorState expected = PredictorState::UNCONFIGURED;
    if (!state_.compare_exchange_strong(expected, PredictorState::CONFIGURING)) {
        throw PredictorStateError("Predictor already configured. Current state: " +
                                  state_to_string(expected));
    }

    params_ = params;
    Logger::get_instance().log_state_transition(
        make_context("configure"), state_to_string(PredictorState::UNCONFIGURED),
        state_to_string(PredictorState::CONFIGURING));

    const CallContext ctx = make_context("configure");
    const RuntimeScripts scripts = RuntimeScripts::from_directory(params_.r_script_dir);

    try {
        runtime_ = std::make_unique<RuntimeHandle>(session_factory_(), scripts, ctx);

        auto lock = runtime_->acquire();
        ValueCodec& codec = runtime_->codec();

        positive_class_label_ = codec.to_foreign_optional(params_.positive_class_label);
        negative_class_label_ = codec.to_foreign_optional(params_.negative_class_label);
        class_labels_ = codec.to_foreign_labels(params_.class_labels);

        runtime_->initialize(params_.code_dir, params_.target_type);

        if (params_.target_type == TargetType::UNSTRUCTURED) {
            check_unstructured_hooks();
        }

        model_ = runtime_->load_model(params_.code_dir, params_.target_type);
    } catch (const ForeignExecutionError&) {
        // Already logged with the R traceback
        transition_state(PredictorState::FAILED);
        throw;
    } catch (const std::exception& e) {
        transition_state(PredictorState::FAILED);
        Logger::get_instance().log_error(ctx, e.what());
        throw;
    }

    transition_state(PredictorState::CONFIGURED);

    std::map<std::string, std::string> settings;
    settings["code_dir"] = params_.code_dir;
    settings["common_script"] = scripts.common_script;
    settings["score_script"] = scripts.score_script;
    if (params_.positive_class_label) {
        settings["positive_class_label"] = *params_.positive_class_label;
    }
    if (params_.negative_class_label) {
        settings["negative_class_label"] = *params_.negative_class_label;
    }
    if (params_.class_labels) {
        settings["class_labels"] = std::to_string(params_.class_labels->size());
    }
    Logger::get_instance().log_predictor_configured(ctx, settings);
}

TabularFrame RPredictor::predict_structured(const Bytes& binary_data,
                                            const std::optional<std::string>& mimetype) {
    require_configured("predict");

    const CallContext ctx = make_context("predict");
    Logger::get_instance().log_payload(ctx, "binary_data", binary_data.data(), binary_data.size());

    auto lock = runtime_->acquire();
    runtime_->set_context(ctx);
    ValueCodec& codec = runtime_->codec();

    ForeignArguments args{
        {"", codec.to_foreign_character(target_type_to_string(params_.target_type))},
        {"binary_data", codec.to_foreign_raw(binary_data)},
        {"mimetype", codec.to_foreign_optional(mimetype)},
        {"model", model_},
        {"positive_class_label", positive_class_label_},
        {"negative_class_label", negative_class_label_},
        {"class_labels", class_labels_},
    };

    ForeignValuePtr value = runtime_->invoke(entry_points::kOuterPredict, args);

    std::string actual;
    try {
        ForeignResult result = codec.decode(value);
        if (auto frame = std::get_if<TabularFrame>(&result)) {
            return *frame;
        }
        // Regression models return a bare vector
        if (auto array = std::get_if<NumericArray>(&result)) {
            return ValueCodec::array_to_frame(*array);
        }
        actual = describe(result);
    } catch (const UnsupportedValueType& e) {
        // An unlabelled binary result comes back as a data.frame without column names
        actual = (value ? value->type_name() : std::string("NULL")) + " (" + e.what() + ")";
    }

    InvalidPredictionShape error("data.frame", actual);
    Logger::get_instance().log_error(ctx, error.what());
    throw error;
}

UnstructuredResult RPredictor::predict_unstructured(const UnstructuredData& data,
                                                    const std::optional<HostMap>& query,
                                                    const HostMap& extra) {
    require_configured("predict_unstructured");

    const CallContext ctx = make_context("predict_unstructured");

    auto lock = runtime_->acquire();
    runtime_->set_context(ctx);
    ValueCodec& codec = runtime_->codec();

    ForeignValuePtr r_data;
    if (auto bytes = std::get_if<Bytes>(&data)) {
        Logger::get_instance().log_payload(ctx, "data", bytes->data(), bytes->size());
        r_data = codec.to_foreign_raw(*bytes);
    } else {
        const std::string& text = std::get<std::string>(data);
        Logger::get_instance().log_payload(ctx, "data",
                                           reinterpret_cast<const uint8_t*>(text.data()), text.size());
        r_data = codec.to_foreign_character(text);
    }

    ForeignArguments args{
        {"model", model_},
        {"data", r_data},
    };
    for (const auto& [key, value] : extra) {
        if (key == "model" || key == "data" || key == "query") {
            throw ConfigurationError("predict_unstructured: extra argument '" + key +
                                     "' is reserved");
        }
        if (!is_null(value)) {
            args.emplace_back(key, codec.to_foreign(value));
        }
    }
    if (query) {
        args.emplace_back("query", codec.to_foreign_list(*query));
    }

    ForeignResult result = codec.decode(runtime_->invoke(entry_points::kPredictUnstructured, args));

    auto list = std::get_if<ForeignList>(&result);
    if (!list || list->size() != 2) {
        UnexpectedResultType error("list of length 2", describe(result),
                                   "Wrong type returned in unstructured mode.");
        Logger::get_instance().log_error(ctx, error.what());
        throw error;
    }

    UnstructuredResult response;
    response.payload = codec.to_host_value(*list->elements[0]);
    response.metadata = codec.to_host_map(*list->elements[1]);
    return response;
}

TransformResult RPredictor::transform(const Bytes& binary_data,
                                      const std::optional<Bytes>& target_binary_data,
                                      const std::optional<std::string>& mimetype) {
    require_configured("transform");

    const CallContext ctx = make_context("transform");
    Logger& logger = Logger::get_instance();
    logger.log_payload(ctx, "binary_data", binary_data.data(), binary_data.size());
    if (target_binary_data) {
        logger.log_payload(ctx, "target_binary_data", target_binary_data->data(),
                           target_binary_data->size());
    }

    auto lock = runtime_->acquire();
    runtime_->set_context(ctx);
    ValueCodec& codec = runtime_->codec();

    ForeignArguments args{
        {"binary_data", codec.to_foreign_raw(binary_data)},
        {"target_binary_data", target_binary_data ? codec.to_foreign_raw(*target_binary_data)
                                                  : codec.null_value()},
        {"mimetype", codec.to_foreign_optional(mimetype)},
        {"transformer", model_},
    };

    ForeignResult result = codec.decode(runtime_->invoke(entry_points::kOuterTransform, args));

    auto list = std::get_if<ForeignList>(&result);
    if (!list || list->size() != 2) {
        throw InvalidTransformOutput("list of length 2", describe(result),
                                     "Expected transform to return a two-element list containing X and y.");
    }

    ForeignResult features = codec.decode(list->elements[0]);
    auto frame = std::get_if<TabularFrame>(&features);
    if (!frame) {
        throw InvalidTransformOutput("data.frame", describe(features));
    }

    TransformResult output;
    if (is_triplet_frame(*frame)) {
        output.features = triplet_frame_to_sparse(*frame);
    } else {
        output.features = *frame;
    }

    const ForeignValue& target = *list->elements[1];
    switch (target.kind()) {
        case ForeignKind::NULL_VALUE:
            output.target = std::monostate{};
            break;
        case ForeignKind::DATA_FRAME:
            output.target = codec.to_frame(target);
            break;
        case ForeignKind::DOUBLE:
        case ForeignKind::INTEGER:
        case ForeignKind::LOGICAL:
        case ForeignKind::CHARACTER:
        case ForeignKind::FACTOR:
            output.target = codec.to_column(target);
            break;
        default:
            throw InvalidTransformOutput("NULL, data.frame or vector", target.type_name());
    }

    return output;
}

bool RPredictor::has_read_input_data_hook() {
    require_configured("has_read_input_data_hook");

    auto lock = runtime_->acquire();
    runtime_->set_context(make_context("has_read_input_data_hook"));

    ForeignValuePtr value = runtime_->invoke(entry_points::kHasReadInputDataHook, {});
    if (!value || value->kind() != ForeignKind::LOGICAL || value->length() == 0) {
        throw UnexpectedResultType("logical", value ? value->type_name() : "NULL");
    }
    return value->logicals().front().value_or(false);
}

SupportedPayloadFormats RPredictor::supported_payload_formats() const {
    SupportedPayloadFormats formats;
    formats.add(PayloadFormat::CSV);
    formats.add(PayloadFormat::MTX);
    return formats;
}

// Private helper methods

void RPredictor::transition_state(PredictorState new_state) {
    PredictorState old_state = state_.exchange(new_state);
    Logger::get_instance().log_state_transition(
        make_context("configure"), state_to_string(old_state), state_to_string(new_state));
}

void RPredictor::require_configured(const std::string& operation) const {
    if (state_ != PredictorState::CONFIGURED) {
        throw PredictorStateError("Cannot run " + operation + ": predictor is " +
                                  state_to_string(state_));
    }
}

void RPredictor::check_unstructured_hooks() {
    const std::string mode = target_type_to_string(params_.target_type);
    for (const char* hook : {entry_points::kPredictUnstructured, hooks::kLoadModel,
                             hooks::kScoreUnstructured}) {
        if (!runtime_->hook_exists(hook)) {
            throw MissingHookError(hook, mode);
        }
    }
}

CallContext RPredictor::make_context(const std::string& operation) const {
    return CallContext(params_.predictor_id, target_type_to_string(params_.target_type), operation);
}

} // namespace rbridge
