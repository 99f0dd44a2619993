#include "error_capture.hpp"
#include "errors.hpp"

namespace rbridge {

ForeignErrorCapture::ForeignErrorCapture(ForeignSession& session, const CallContext& ctx,
                                         const std::string& function_name)
    : session_(session), ctx_(ctx), function_name_(function_name) {
    session_.arm_error_capture();
}

ForeignErrorCapture::~ForeignErrorCapture() {
    session_.disarm_error_capture();
}

void ForeignErrorCapture::raise(const std::string& fault_message) {
    Logger& logger = Logger::get_instance();

    std::string traceback;
    try {
        traceback = session_.collect_diagnostics();
    } catch (const std::exception& e) {
        logger.log_warning(ctx_, std::string("Failed to get R traceback: ") + e.what());
    }

    logger.log_foreign_error(ctx_, function_name_, fault_message, traceback);

    std::string diagnostics = fault_message;
    if (!traceback.empty() && traceback != fault_message) {
        if (!diagnostics.empty()) {
            diagnostics += "\n";
        }
        diagnostics += "R Traceback:\n" + traceback;
    }

    throw ForeignExecutionError(function_name_, diagnostics);
}

} // namespace rbridge
