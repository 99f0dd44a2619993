/**
 * @file runtime_handle.hpp
 * @brief Long-lived handle to one R session
 *
 * The handle owns the session for the lifetime of a predictor, sources the
 * bridge's support scripts into it, and is the only path through which calls
 * reach R. The interpreter is single-threaded and non-reentrant, so every
 * entry goes through one recursive mutex; callers that need to build
 * arguments, call and convert the result as one unit take acquire() first.
 */

#ifndef RBRIDGE_RUNTIME_HANDLE_HPP
#define RBRIDGE_RUNTIME_HANDLE_HPP

#include "foreign_session.hpp"
#include "logger.hpp"
#include "types.hpp"
#include "value_codec.hpp"

#include <memory>
#include <mutex>
#include <string>

namespace rbridge {

/// R entry points defined by the support scripts
namespace entry_points {
constexpr const char* kInit = "init";
constexpr const char* kLoadSerializedModel = "load_serialized_model";
constexpr const char* kOuterPredict = "outer_predict";
constexpr const char* kPredictUnstructured = "predict_unstructured";
constexpr const char* kOuterTransform = "outer_transform";
constexpr const char* kHasReadInputDataHook = "has_read_input_data_hook";
}

/// Hooks supplied by the model author in custom.R
namespace hooks {
constexpr const char* kLoadModel = "load_model";
constexpr const char* kScoreUnstructured = "score_unstructured";
}

/**
 * @brief Locations of the two support scripts
 */
struct RuntimeScripts {
    std::string common_script;   ///< Shared helpers, sourced first
    std::string score_script;    ///< Entry points, sourced second

    /**
     * @brief common.R and score.R inside @p directory
     *
     * An empty directory selects the scripts installed with the library.
     */
    static RuntimeScripts from_directory(const std::string& directory);
};

class RuntimeHandle {
public:
    using Lock = std::unique_lock<std::recursive_mutex>;

    /**
     * @param session Session to own (must not be null)
     * @param scripts Support scripts to source on initialize
     * @param ctx Logging context for calls made through this handle
     */
    RuntimeHandle(std::unique_ptr<ForeignSession> session,
                  const RuntimeScripts& scripts,
                  const CallContext& ctx = CallContext());

    ~RuntimeHandle() = default;

    RuntimeHandle(const RuntimeHandle&) = delete;
    RuntimeHandle& operator=(const RuntimeHandle&) = delete;

    /**
     * @brief Source the support scripts and call R init(model_directory, target_type)
     *
     * @throws RuntimeStateError If called more than once
     * @throws ConfigurationError If a support script does not exist
     * @throws ForeignExecutionError If sourcing or init fails in R
     */
    void initialize(const std::string& model_directory, TargetType target_type);

    bool is_initialized() const;

    /**
     * @brief Whether @p name is bound in the session
     */
    bool hook_exists(const std::string& name) const;

    /**
     * @brief Call R load_serialized_model(model_directory, target_type)
     *
     * @return Opaque model handle, kept alive by the caller
     */
    ForeignValuePtr load_model(const std::string& model_directory, TargetType target_type);

    /**
     * @brief Call an R function with arguments already in R representation
     *
     * @throws RuntimeStateError If initialize() has not completed
     * @throws ForeignExecutionError If R signals an error
     */
    ForeignValuePtr invoke(const std::string& function_name, const ForeignArguments& args);

    /**
     * @brief Take exclusive access to the session
     */
    Lock acquire();

    /// Codec bound to this handle's session; use under acquire()
    ValueCodec& codec() { return codec_; }

    void set_context(const CallContext& ctx);

    const RuntimeScripts& scripts() const { return scripts_; }

private:
    mutable std::recursive_mutex mutex_;
    std::unique_ptr<ForeignSession> session_;
    ValueCodec codec_;
    RuntimeScripts scripts_;
    CallContext ctx_;
    bool initialize_called_;
    bool initialized_;

    void source_script(const std::string& path);
    ForeignValuePtr call_captured(const std::string& function_name, const ForeignArguments& args);
};

} // namespace rbridge

#endif // RBRIDGE_RUNTIME_HANDLE_HPP
