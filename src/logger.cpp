/**
 * @file logger.cpp
 * @brief Implementation of structured logger
 */

#include "logger.hpp"
#include <algorithm>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <sstream>

namespace rbridge {

Logger& Logger::get_instance() {
    static Logger instance;
    return instance;
}

Logger::Logger() = default;

Logger::~Logger() {
    flush();
}

void Logger::configure(const LoggerConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
    file_stream_.reset();

    if (!config_.enable_file) {
        return;
    }

    file_stream_ = std::make_unique<std::ofstream>(config_.log_file_path, std::ios::app);
    if (!file_stream_->is_open()) {
        std::cerr << "rbridge: cannot open log file " << config_.log_file_path
                  << ", file logging disabled" << std::endl;
        file_stream_.reset();
    }
}

void Logger::set_min_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.min_level = level;
}

LogLevel Logger::get_min_level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.min_level;
}

bool Logger::enabled(LogLevel level) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level >= config_.min_level;
}

Logger::Fields Logger::context_fields(const CallContext& ctx, const std::string& event) {
    Fields fields;
    fields["event"] = event;
    fields["predictor_id"] = ctx.predictor_id;
    if (!ctx.target_type.empty()) {
        fields["target_type"] = ctx.target_type;
    }
    if (!ctx.operation.empty()) {
        fields["operation"] = ctx.operation;
    }
    return fields;
}

// ============================================================================
// Events
// ============================================================================

void Logger::log_predictor_configured(
    const CallContext& ctx,
    const std::map<std::string, std::string>& settings
) {
    Fields fields = context_fields(ctx, "predictor_configured");
    for (const auto& [key, value] : settings) {
        fields.emplace("config." + key, value);
    }
    emit(LogLevel::INFO, "Predictor " + ctx.predictor_id + " configured", fields);
}

void Logger::log_foreign_call(
    const CallContext& ctx,
    const std::string& function_name,
    double elapsed_ms
) {
    if (!enabled(LogLevel::DEBUG)) {
        return;
    }

    Fields fields = context_fields(ctx, "foreign_call");
    fields["function"] = function_name;
    fields["elapsed_ms"] = std::to_string(elapsed_ms);
    emit(LogLevel::DEBUG, "R call " + function_name + " returned", fields);
}

void Logger::log_foreign_error(
    const CallContext& ctx,
    const std::string& function_name,
    const std::string& error_message,
    const std::string& traceback
) {
    Fields fields = context_fields(ctx, "foreign_error");
    fields["function"] = function_name;
    fields["error_message"] = error_message;
    if (!traceback.empty()) {
        fields["traceback"] = traceback;
    }
    emit(LogLevel::ERROR, "R error in " + function_name, fields);
}

void Logger::log_error(
    const CallContext& ctx,
    const std::string& error_message,
    const std::string& stack_trace
) {
    Fields fields = context_fields(ctx, "error");
    fields["error_message"] = error_message;
    if (!stack_trace.empty()) {
        fields["stack_trace"] = stack_trace;
    }
    emit(LogLevel::ERROR, error_message, fields);
}

void Logger::log_warning(
    const CallContext& ctx,
    const std::string& warning_message
) {
    Fields fields = context_fields(ctx, "warning");
    fields["warning"] = warning_message;
    emit(LogLevel::WARN, warning_message, fields);
}

void Logger::log_payload(
    const CallContext& ctx,
    const std::string& payload_name,
    const uint8_t* data,
    size_t size
) {
    size_t limit = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!config_.enable_payload_dump || LogLevel::DEBUG < config_.min_level) {
            return;
        }
        limit = config_.max_payload_dump_bytes;
    }

    const size_t dumped = std::min(size, limit);

    Fields fields = context_fields(ctx, "payload_dump");
    fields["payload_name"] = payload_name;
    fields["payload_size"] = std::to_string(size);
    fields["dumped_bytes"] = std::to_string(dumped);
    fields["hex_data"] = data != nullptr ? hex_dump(data, dumped) : "";
    if (dumped < size) {
        fields["truncated"] = "true";
    }
    emit(LogLevel::DEBUG, "Payload " + payload_name, fields);
}

void Logger::log_state_transition(
    const CallContext& ctx,
    const std::string& old_state,
    const std::string& new_state
) {
    Fields fields = context_fields(ctx, "state_transition");
    fields["old_state"] = old_state;
    fields["new_state"] = new_state;
    emit(LogLevel::DEBUG, old_state + " -> " + new_state, fields);
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::cerr.flush();
    if (file_stream_) {
        file_stream_->flush();
    }
}

// ============================================================================
// Formatting and output
// ============================================================================

void Logger::emit(LogLevel level, const std::string& message, const Fields& fields) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level < config_.min_level) {
        return;
    }

    const std::string timestamp = utc_timestamp();
    std::string line;
    if (config_.enable_json) {
        Fields record = fields;
        record["timestamp"] = timestamp;
        record["level"] = level_to_string(level);
        record["message"] = message;
        line = to_json(record);
    } else {
        line = to_plain(timestamp, level, message, fields);
    }

    if (config_.enable_console) {
        std::cerr << line << '\n';
    }
    if (file_stream_) {
        *file_stream_ << line << '\n';
    }
}

std::string Logger::utc_timestamp() {
    const auto now = std::chrono::system_clock::now();
    const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;

    std::tm utc{};
#ifdef _WIN32
    gmtime_s(&utc, &seconds);
#else
    gmtime_r(&seconds, &utc);
#endif

    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &utc);
    char suffix[8];
    std::snprintf(suffix, sizeof(suffix), ".%03dZ", static_cast<int>(millis));
    return std::string(buffer) + suffix;
}

std::string Logger::to_json(const Fields& fields) {
    std::string out = "{";
    for (auto it = fields.begin(); it != fields.end(); ++it) {
        if (it != fields.begin()) {
            out += ',';
        }
        out += '"';
        append_escaped(out, it->first);
        out += "\":\"";
        append_escaped(out, it->second);
        out += '"';
    }
    out += '}';
    return out;
}

std::string Logger::to_plain(const std::string& timestamp, LogLevel level,
                             const std::string& message, const Fields& fields) {
    std::ostringstream oss;
    oss << timestamp << ' ' << level_to_string(level);

    auto id = fields.find("predictor_id");
    auto op = fields.find("operation");
    if (id != fields.end()) {
        oss << " [" << id->second;
        if (op != fields.end()) {
            oss << '/' << op->second;
        }
        oss << ']';
    }
    oss << ' ' << message;

    for (const auto& [key, value] : fields) {
        if (key == "event" || key == "predictor_id" || key == "operation") {
            continue;
        }
        oss << ' ' << key << '=' << value;
    }
    return oss.str();
}

void Logger::append_escaped(std::string& out, const std::string& text) {
    for (char c : text) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char escaped[8];
                    std::snprintf(escaped, sizeof(escaped), "\\u%04x", static_cast<unsigned>(c));
                    out += escaped;
                } else {
                    out += c;
                }
        }
    }
}

// Lowercase hex, a space every 16 bytes
std::string Logger::hex_dump(const uint8_t* data, size_t count) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(count * 2 + count / 16);
    for (size_t i = 0; i < count; ++i) {
        if (i > 0 && i % 16 == 0) {
            out += ' ';
        }
        out += digits[data[i] >> 4];
        out += digits[data[i] & 0x0F];
    }
    return out;
}

} // namespace rbridge
