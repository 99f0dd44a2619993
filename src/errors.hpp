/**
 * @file errors.hpp
 * @brief Exception taxonomy for the R bridge
 *
 * Every error raised by the bridge derives from BridgeError, which derives
 * from std::runtime_error. Nothing in the library catches these to hide them:
 * they propagate to the caller of the host-facing API.
 */

#ifndef RBRIDGE_ERRORS_HPP
#define RBRIDGE_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace rbridge {

/**
 * @brief Base exception for bridge errors
 */
class BridgeError : public std::runtime_error {
public:
    explicit BridgeError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Raised when predictor configuration is invalid
 */
class ConfigurationError : public BridgeError {
public:
    explicit ConfigurationError(const std::string& message)
        : BridgeError("Configuration error: " + message) {}
};

/**
 * @brief Raised when a hook required by the target type is not bound in the session
 */
class MissingHookError : public ConfigurationError {
public:
    MissingHookError(const std::string& hook_name, const std::string& target_type)
        : ConfigurationError("In '" + target_type + "' mode hook '" + hook_name +
                             "' must be provided."),
          hook_name_(hook_name) {}

    const std::string& hook_name() const { return hook_name_; }

private:
    std::string hook_name_;
};

/**
 * @brief Raised when a config file cannot be read or is not valid JSON
 */
class ConfigParseError : public BridgeError {
public:
    explicit ConfigParseError(const std::string& message)
        : BridgeError(message) {}
};

/**
 * @brief Raised when R signals an error during a call
 *
 * The message embeds the R diagnostic text (error output and traceback) verbatim.
 */
class ForeignExecutionError : public BridgeError {
public:
    ForeignExecutionError(const std::string& function_name, const std::string& diagnostics)
        : BridgeError(build_message(function_name, diagnostics)),
          function_name_(function_name),
          diagnostics_(diagnostics) {}

    const std::string& function_name() const { return function_name_; }
    const std::string& diagnostics() const { return diagnostics_; }

private:
    std::string function_name_;
    std::string diagnostics_;

    static std::string build_message(const std::string& function_name,
                                     const std::string& diagnostics) {
        if (diagnostics.empty()) {
            return "Error from R code in '" + function_name +
                   "': R reported a failure without diagnostic output";
        }
        return "Error from R code in '" + function_name + "':\n" + diagnostics;
    }
};

/**
 * @brief Raised when the codec is asked to convert a value it cannot represent
 */
class UnsupportedValueType : public BridgeError {
public:
    explicit UnsupportedValueType(const std::string& message)
        : BridgeError("Can not convert value: " + message) {}
};

/**
 * @brief Raised when an R result does not have the shape the calling mode expects
 */
class UnexpectedResultType : public BridgeError {
public:
    UnexpectedResultType(const std::string& expected, const std::string& actual,
                         const std::string& hint = "")
        : BridgeError(build_message(expected, actual, hint)),
          expected_(expected),
          actual_(actual) {}

    const std::string& expected() const { return expected_; }
    const std::string& actual() const { return actual_; }

private:
    std::string expected_;
    std::string actual_;

    static std::string build_message(const std::string& expected, const std::string& actual,
                                     const std::string& hint) {
        std::string message = "Expected result type: " + expected + ", actual: " + actual + ".";
        if (!hint.empty()) {
            message += " " + hint;
        }
        return message;
    }
};

/**
 * @brief Raised when a structured prediction does not yield a tabular frame
 */
class InvalidPredictionShape : public UnexpectedResultType {
public:
    InvalidPredictionShape(const std::string& expected, const std::string& actual)
        : UnexpectedResultType(expected, actual,
                               "Are you trying to run binary classification without "
                               "class labels provided?") {}
};

/**
 * @brief Raised when a transform does not return (features, target) in the expected form
 */
class InvalidTransformOutput : public UnexpectedResultType {
public:
    InvalidTransformOutput(const std::string& expected, const std::string& actual,
                           const std::string& hint = "")
        : UnexpectedResultType(expected, actual, hint) {}
};

/**
 * @brief Raised when the predictor is used outside the CONFIGURED state
 */
class PredictorStateError : public BridgeError {
public:
    explicit PredictorStateError(const std::string& message)
        : BridgeError(message) {}
};

/**
 * @brief Raised when the runtime handle is misused (double initialize, call before initialize)
 */
class RuntimeStateError : public BridgeError {
public:
    explicit RuntimeStateError(const std::string& message)
        : BridgeError(message) {}
};

} // namespace rbridge

#endif // RBRIDGE_ERRORS_HPP
