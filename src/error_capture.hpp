/**
 * @file error_capture.hpp
 * @brief Scoped interception of R errors
 *
 * ForeignErrorCapture arms the session's error channel when constructed and
 * disarms it when destroyed, on normal and exceptional exits alike, so no
 * interception state survives the call it guards. A fault raised inside the
 * guarded call is logged at ERROR together with the R diagnostics and
 * rethrown as ForeignExecutionError.
 *
 * Usage Example:
 *   @code
 *   auto value = run_with_error_capture(session, ctx, "outer_predict", [&]() {
 *       return session.call("outer_predict", args);
 *   });
 *   @endcode
 */

#ifndef RBRIDGE_ERROR_CAPTURE_HPP
#define RBRIDGE_ERROR_CAPTURE_HPP

#include "foreign_session.hpp"
#include "logger.hpp"

#include <string>

namespace rbridge {

class ForeignErrorCapture {
public:
    ForeignErrorCapture(ForeignSession& session, const CallContext& ctx,
                        const std::string& function_name);

    /// Disarms the session's error channel
    ~ForeignErrorCapture();

    ForeignErrorCapture(const ForeignErrorCapture&) = delete;
    ForeignErrorCapture& operator=(const ForeignErrorCapture&) = delete;

    /**
     * @brief Collect diagnostics, log them and throw
     *
     * @param fault_message Error text carried by the fault
     * @throws ForeignExecutionError Always
     */
    [[noreturn]] void raise(const std::string& fault_message);

private:
    ForeignSession& session_;
    CallContext ctx_;
    std::string function_name_;
};

/**
 * @brief Run @p fn with the session's error channel armed
 *
 * @throws ForeignExecutionError If @p fn raises a ForeignFault
 */
template <typename Fn>
auto run_with_error_capture(ForeignSession& session, const CallContext& ctx,
                            const std::string& function_name, Fn&& fn) -> decltype(fn()) {
    ForeignErrorCapture capture(session, ctx, function_name);
    try {
        return fn();
    } catch (const ForeignFault& fault) {
        capture.raise(fault.what());
    }
}

} // namespace rbridge

#endif // RBRIDGE_ERROR_CAPTURE_HPP
