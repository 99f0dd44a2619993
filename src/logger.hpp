/**
 * @file logger.hpp
 * @brief Structured logging for the R bridge with JSON output
 *
 * Every event is a flat map of string fields tagged with the predictor,
 * target type and operation it belongs to. Output is one JSON object per
 * line (or a plain "timestamp LEVEL [predictor/operation] message" line),
 * to stderr and optionally to a file. R faults are logged with the R
 * traceback; request payloads are hex-dumped only when explicitly enabled.
 */

#ifndef RBRIDGE_LOGGER_HPP
#define RBRIDGE_LOGGER_HPP

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace rbridge {

/**
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,   ///< Detailed debugging information (payload contents, every R call)
    INFO,    ///< Informational messages (configuration, model load)
    WARN,    ///< Warning messages (non-fatal issues)
    ERROR    ///< Error messages (R faults, failed configuration)
};

/**
 * @brief Convert log level to string
 */
inline std::string level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Parse log level name, case-insensitively; unknown names give INFO
 */
inline LogLevel string_to_level(std::string level_str) {
    std::transform(level_str.begin(), level_str.end(), level_str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (level_str == "DEBUG") return LogLevel::DEBUG;
    if (level_str == "WARN" || level_str == "WARNING") return LogLevel::WARN;
    if (level_str == "ERROR") return LogLevel::ERROR;
    return LogLevel::INFO;
}

/**
 * @brief Call context for logging
 */
struct CallContext {
    std::string predictor_id;        ///< Predictor instance identifier
    std::string target_type;         ///< Target type (regression, binary, ...)
    std::string operation;           ///< Current operation (configure, predict, transform, ...)

    CallContext() = default;

    CallContext(const std::string& id, const std::string& type, const std::string& op = "")
        : predictor_id(id), target_type(type), operation(op) {}
};

/**
 * @brief Where and how much to log
 */
struct LoggerConfig {
    LogLevel min_level;              ///< Events below this level are dropped
    bool enable_console;             ///< Write to stderr
    bool enable_file;                ///< Append to log_file_path
    std::string log_file_path;       ///< Log file, opened in append mode
    bool enable_json;                ///< One JSON object per line; plain text otherwise
    bool enable_payload_dump;        ///< Dump request payloads in debug mode (WARNING: large output)
    size_t max_payload_dump_bytes;   ///< Maximum bytes to dump per payload

    LoggerConfig()
        : min_level(LogLevel::INFO),
          enable_console(true),
          enable_file(false),
          log_file_path("rbridge.log"),
          enable_json(true),
          enable_payload_dump(false),
          max_payload_dump_bytes(1024) {}
};

/**
 * @brief Process-wide event logger shared by every predictor
 *
 * Usage Example:
 *   @code
 *   LoggerConfig config;
 *   config.min_level = LogLevel::DEBUG;
 *
 *   Logger& logger = Logger::get_instance();
 *   logger.configure(config);
 *
 *   CallContext ctx("predictor-1", "regression", "predict");
 *   logger.log_foreign_error(ctx, "outer_predict", "object 'x' not found", traceback);
 *   @endcode
 *
 * All methods are safe to call from concurrent request threads.
 */
class Logger {
public:
    static Logger& get_instance();

    /**
     * @brief Replace the configuration; reopens the log file if file output is enabled
     */
    void configure(const LoggerConfig& config);

    /**
     * @brief Log successful predictor configuration
     *
     * @param ctx Call context
     * @param settings Effective settings (code dir, labels, script paths)
     */
    void log_predictor_configured(
        const CallContext& ctx,
        const std::map<std::string, std::string>& settings
    );

    /**
     * @brief Log a completed call into R (debug level)
     */
    void log_foreign_call(
        const CallContext& ctx,
        const std::string& function_name,
        double elapsed_ms
    );

    /**
     * @brief Log an error raised inside R
     *
     * @param ctx Call context
     * @param function_name R function that was called
     * @param error_message Error text reported by R
     * @param traceback R traceback, if available
     */
    void log_foreign_error(
        const CallContext& ctx,
        const std::string& function_name,
        const std::string& error_message,
        const std::string& traceback = ""
    );

    /**
     * @brief Log a host-side failure (bad result shape, invalid configuration, ...)
     */
    void log_error(
        const CallContext& ctx,
        const std::string& error_message,
        const std::string& stack_trace = ""
    );

    void log_warning(
        const CallContext& ctx,
        const std::string& warning_message
    );

    /**
     * @brief Log payload content (debug mode only)
     *
     * @param ctx Call context
     * @param payload_name Payload identifier (e.g., "binary_data", "target_binary_data")
     * @param data Pointer to payload
     * @param size Payload size
     */
    void log_payload(
        const CallContext& ctx,
        const std::string& payload_name,
        const uint8_t* data,
        size_t size
    );

    /**
     * @brief Log predictor state transition
     */
    void log_state_transition(
        const CallContext& ctx,
        const std::string& old_state,
        const std::string& new_state
    );

    /// Flush stderr and the log file
    void flush();

    void set_min_level(LogLevel level);

    LogLevel get_min_level() const;

private:
    Logger();
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    using Fields = std::map<std::string, std::string>;

    mutable std::mutex mutex_;
    LoggerConfig config_;
    std::unique_ptr<std::ofstream> file_stream_;

    /// Fields every event carries: event name plus the call context
    static Fields context_fields(const CallContext& ctx, const std::string& event);

    void emit(LogLevel level, const std::string& message, const Fields& fields);
    bool enabled(LogLevel level) const;

    static std::string utc_timestamp();
    static std::string to_json(const Fields& fields);
    static std::string to_plain(const std::string& timestamp, LogLevel level,
                                const std::string& message, const Fields& fields);
    static void append_escaped(std::string& out, const std::string& text);
    static std::string hex_dump(const uint8_t* data, size_t count);
};

} // namespace rbridge

#endif // RBRIDGE_LOGGER_HPP
