/**
 * @file r_predictor.hpp
 * @brief Predictor that runs model code written in R
 *
 * RPredictor implements IPredictor on top of a RuntimeHandle. configure()
 * starts the session, checks the hooks the target type requires and loads
 * the model; every request then builds R arguments through the codec,
 * calls the matching entry point under error capture and converts the
 * result back.
 *
 * Usage Example:
 *   @code
 *   RPredictor predictor([]() { return std::make_unique<RSession>(); });
 *
 *   PredictorParams params("/opt/model", TargetType::REGRESSION);
 *   predictor.configure(params);
 *
 *   TabularFrame predictions = predictor.predict_structured(csv_bytes, "text/csv");
 *   @endcode
 */

#ifndef RBRIDGE_R_PREDICTOR_HPP
#define RBRIDGE_R_PREDICTOR_HPP

#include "predictor_interface.hpp"
#include "runtime_handle.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <string>

namespace rbridge {

/**
 * @brief Rebuild a sparse matrix from a triplet frame
 *
 * The frame carries 1-based (row, column, value) triplets in the columns
 * __DR__i, __DR__j, __DR__x; its last row holds (rows, cols, unused).
 *
 * @throws InvalidTransformOutput If the frame has no terminator row, a negative
 *         shape, a non-numeric column or an index outside the shape
 */
SparseMatrix triplet_frame_to_sparse(const TabularFrame& frame);

/// True if the frame's column names are exactly the sparse triplet markers
bool is_triplet_frame(const TabularFrame& frame);

class RPredictor : public IPredictor {
public:
    using SessionFactory = std::function<std::unique_ptr<ForeignSession>()>;

    /**
     * @param session_factory Creates the session on configure (must not be empty)
     */
    explicit RPredictor(SessionFactory session_factory);

    ~RPredictor() override = default;

    RPredictor(const RPredictor&) = delete;
    RPredictor& operator=(const RPredictor&) = delete;

    void configure(const PredictorParams& params) override;

    TabularFrame predict_structured(
        const Bytes& binary_data,
        const std::optional<std::string>& mimetype = std::nullopt
    ) override;

    UnstructuredResult predict_unstructured(
        const UnstructuredData& data,
        const std::optional<HostMap>& query = std::nullopt,
        const HostMap& extra = {}
    ) override;

    TransformResult transform(
        const Bytes& binary_data,
        const std::optional<Bytes>& target_binary_data = std::nullopt,
        const std::optional<std::string>& mimetype = std::nullopt
    ) override;

    bool has_read_input_data_hook() override;

    /// CSV and MTX
    SupportedPayloadFormats supported_payload_formats() const override;

    bool is_configured() const override {
        return state_ == PredictorState::CONFIGURED;
    }

    PredictorState get_state() const { return state_; }

    const PredictorParams& get_params() const { return params_; }

private:
    SessionFactory session_factory_;
    std::unique_ptr<RuntimeHandle> runtime_;
    PredictorParams params_;
    std::atomic<PredictorState> state_;

    // Owned by the session, held for the predictor's lifetime
    ForeignValuePtr model_;
    ForeignValuePtr positive_class_label_;
    ForeignValuePtr negative_class_label_;
    ForeignValuePtr class_labels_;

    void transition_state(PredictorState new_state);
    void require_configured(const std::string& operation) const;
    void check_unstructured_hooks();
    CallContext make_context(const std::string& operation) const;
};

} // namespace rbridge

#endif // RBRIDGE_R_PREDICTOR_HPP
