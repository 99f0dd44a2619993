/**
 * @file runtime_handle.cpp
 * @brief Implementation of RuntimeHandle
 */

#include "runtime_handle.hpp"
#include "error_capture.hpp"
#include "errors.hpp"

#include <chrono>
#include <filesystem>
#include <stdexcept>

#ifndef RBRIDGE_R_SCRIPT_DIR
#define RBRIDGE_R_SCRIPT_DIR "r"
#endif

namespace fs = std::filesystem;

namespace rbridge {

namespace {

ForeignSession& checked_session(const std::unique_ptr<ForeignSession>& session) {
    if (!session) {
        throw std::invalid_argument("RuntimeHandle: session cannot be null");
    }
    return *session;
}

} // namespace

RuntimeScripts RuntimeScripts::from_directory(const std::string& directory) {
    fs::path dir(directory.empty() ? std::string(RBRIDGE_R_SCRIPT_DIR) : directory);

    RuntimeScripts scripts;
    scripts.common_script = (dir / "common.R").string();
    scripts.score_script = (dir / "score.R").string();
    return scripts;
}

RuntimeHandle::RuntimeHandle(std::unique_ptr<ForeignSession> session,
                             const RuntimeScripts& scripts,
                             const CallContext& ctx)
    : session_(std::move(session)),
      codec_(checked_session(session_)),
      scripts_(scripts),
      ctx_(ctx),
      initialize_called_(false),
      initialized_(false) {}

void RuntimeHandle::initialize(const std::string& model_directory, TargetType target_type) {
    Lock lock(mutex_);

    if (initialize_called_) {
        throw RuntimeStateError("R session already initialized");
    }
    initialize_called_ = true;

    for (const auto& script : {scripts_.common_script, scripts_.score_script}) {
        if (!fs::exists(script)) {
            throw ConfigurationError("R support script not found: " + script);
        }
    }

    source_script(scripts_.common_script);
    source_script(scripts_.score_script);

    call_captured(entry_points::kInit, {
        ForeignArgument("", codec_.to_foreign_character(model_directory)),
        ForeignArgument("", codec_.to_foreign_character(target_type_to_string(target_type))),
    });

    initialized_ = true;
}

bool RuntimeHandle::is_initialized() const {
    Lock lock(mutex_);
    return initialized_;
}

bool RuntimeHandle::hook_exists(const std::string& name) const {
    Lock lock(mutex_);
    return session_->has_binding(name);
}

ForeignValuePtr RuntimeHandle::load_model(const std::string& model_directory, TargetType target_type) {
    Lock lock(mutex_);
    return invoke(entry_points::kLoadSerializedModel, {
        ForeignArgument("", codec_.to_foreign_character(model_directory)),
        ForeignArgument("", codec_.to_foreign_character(target_type_to_string(target_type))),
    });
}

ForeignValuePtr RuntimeHandle::invoke(const std::string& function_name, const ForeignArguments& args) {
    Lock lock(mutex_);

    if (!initialized_) {
        throw RuntimeStateError("R session not initialized; cannot call '" + function_name + "'");
    }

    return call_captured(function_name, args);
}

RuntimeHandle::Lock RuntimeHandle::acquire() {
    return Lock(mutex_);
}

void RuntimeHandle::set_context(const CallContext& ctx) {
    Lock lock(mutex_);
    ctx_ = ctx;
}

void RuntimeHandle::source_script(const std::string& path) {
    run_with_error_capture(*session_, ctx_, "source(" + path + ")", [&]() {
        session_->source(path);
    });
}

ForeignValuePtr RuntimeHandle::call_captured(const std::string& function_name,
                                             const ForeignArguments& args) {
    auto start_time = std::chrono::steady_clock::now();

    ForeignValuePtr result = run_with_error_capture(*session_, ctx_, function_name, [&]() {
        return session_->call(function_name, args);
    });

    auto end_time = std::chrono::steady_clock::now();
    Logger::get_instance().log_foreign_call(
        ctx_, function_name,
        std::chrono::duration<double, std::milli>(end_time - start_time).count());

    return result;
}

} // namespace rbridge
