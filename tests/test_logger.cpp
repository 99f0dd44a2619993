/**
 * @file test_logger.cpp
 * @brief Unit tests for Logger
 */

#include <catch2/catch_test_macros.hpp>
#include "../src/logger.hpp"
#include <filesystem>
#include <fstream>
#include <map>
#include <string>

using namespace rbridge;

namespace {

// Very simple JSON parser for test purposes (flat string objects only)
std::map<std::string, std::string> parse_json_log(const std::string& line) {
    std::map<std::string, std::string> result;

    size_t pos = 1;  // Skip opening {
    while (pos < line.size() - 1) {
        size_t key_start = line.find('"', pos);
        if (key_start == std::string::npos) break;
        size_t key_end = line.find('"', key_start + 1);
        std::string key = line.substr(key_start + 1, key_end - key_start - 1);

        size_t val_start = line.find('"', key_end + 1);
        if (val_start == std::string::npos) break;
        size_t val_end = line.find('"', val_start + 1);
        std::string value = line.substr(val_start + 1, val_end - val_start - 1);

        result[key] = value;
        pos = val_end + 1;
    }

    return result;
}

void log_to_file(const std::string& path, LogLevel min_level = LogLevel::DEBUG) {
    std::filesystem::remove(path);

    LoggerConfig config;
    config.min_level = min_level;
    config.enable_console = false;
    config.enable_file = true;
    config.log_file_path = path;
    Logger::get_instance().configure(config);
}

std::string first_line(const std::string& path) {
    Logger::get_instance().flush();
    std::ifstream file(path);
    std::string line;
    std::getline(file, line);
    return line;
}

} // namespace

TEST_CASE("Logger Configuration", "[logger]") {
    Logger& logger = Logger::get_instance();

    SECTION("Default configuration") {
        LoggerConfig config;

        REQUIRE(config.min_level == LogLevel::INFO);
        REQUIRE(config.enable_console == true);
        REQUIRE(config.enable_file == false);
        REQUIRE(config.enable_json == true);
        REQUIRE(config.enable_payload_dump == false);
        REQUIRE(config.max_payload_dump_bytes == 1024);
    }

    SECTION("Level setters") {
        LoggerConfig config;
        config.enable_console = false;
        config.min_level = LogLevel::WARN;
        logger.configure(config);
        REQUIRE(logger.get_min_level() == LogLevel::WARN);

        logger.set_min_level(LogLevel::DEBUG);
        REQUIRE(logger.get_min_level() == LogLevel::DEBUG);
    }

    SECTION("Level names") {
        REQUIRE(string_to_level("ERROR") == LogLevel::ERROR);
        REQUIRE(string_to_level("warning") == LogLevel::WARN);
        REQUIRE(string_to_level("bogus") == LogLevel::INFO);
        REQUIRE(level_to_string(LogLevel::WARN) == "WARN");
    }
}

TEST_CASE("Logger Level Filtering", "[logger]") {
    const std::string path = "test_rbridge_filter.log";
    log_to_file(path, LogLevel::WARN);

    CallContext ctx("p1", "regression", "predict");
    Logger::get_instance().log_foreign_call(ctx, "outer_predict", 1.5);
    Logger::get_instance().log_warning(ctx, "Failed to get R traceback");

    auto fields = parse_json_log(first_line(path));
    REQUIRE(fields["event"] == "warning");
    REQUIRE(fields["level"] == "WARN");

    std::filesystem::remove(path);
}

TEST_CASE("Logger Predictor Configured", "[logger]") {
    const std::string path = "test_rbridge_configured.log";
    log_to_file(path);

    CallContext ctx("churn", "binary", "configure");
    std::map<std::string, std::string> settings;
    settings["code_dir"] = "/models/churn";
    settings["positive_class_label"] = "yes";

    Logger::get_instance().log_predictor_configured(ctx, settings);

    auto fields = parse_json_log(first_line(path));
    REQUIRE(fields["event"] == "predictor_configured");
    REQUIRE(fields["predictor_id"] == "churn");
    REQUIRE(fields["target_type"] == "binary");
    REQUIRE(fields["config.code_dir"] == "/models/churn");
    REQUIRE(fields["config.positive_class_label"] == "yes");

    std::filesystem::remove(path);
}

TEST_CASE("Logger Foreign Calls and Errors", "[logger]") {
    CallContext ctx("p1", "regression", "predict");

    SECTION("Foreign call") {
        const std::string path = "test_rbridge_call.log";
        log_to_file(path);

        Logger::get_instance().log_foreign_call(ctx, "outer_predict", 12.5);

        auto fields = parse_json_log(first_line(path));
        REQUIRE(fields["event"] == "foreign_call");
        REQUIRE(fields["function"] == "outer_predict");
        REQUIRE(fields["operation"] == "predict");
        REQUIRE(std::stod(fields["elapsed_ms"]) == 12.5);

        std::filesystem::remove(path);
    }

    SECTION("Foreign error with traceback") {
        const std::string path = "test_rbridge_foreign_error.log";
        log_to_file(path);

        Logger::get_instance().log_foreign_error(ctx, "outer_predict", "object x not found",
                                                 "1: score(data)\n2: outer_predict()");

        auto fields = parse_json_log(first_line(path));
        REQUIRE(fields["event"] == "foreign_error");
        REQUIRE(fields["level"] == "ERROR");
        REQUIRE(fields["function"] == "outer_predict");
        REQUIRE(fields["error_message"] == "object x not found");
        REQUIRE(fields["traceback"] == "1: score(data)\\n2: outer_predict()");

        std::filesystem::remove(path);
    }

    SECTION("Foreign error without traceback") {
        const std::string path = "test_rbridge_foreign_error_bare.log";
        log_to_file(path);

        Logger::get_instance().log_foreign_error(ctx, "init", "boom");

        auto fields = parse_json_log(first_line(path));
        REQUIRE(fields["event"] == "foreign_error");
        REQUIRE(fields.count("traceback") == 0);

        std::filesystem::remove(path);
    }

    SECTION("Host error") {
        const std::string path = "test_rbridge_error.log";
        log_to_file(path);

        Logger::get_instance().log_error(ctx, "Invalid prediction shape", "predict_structured");

        auto fields = parse_json_log(first_line(path));
        REQUIRE(fields["event"] == "error");
        REQUIRE(fields["error_message"] == "Invalid prediction shape");
        REQUIRE(fields["stack_trace"] == "predict_structured");

        std::filesystem::remove(path);
    }
}

TEST_CASE("Logger Payload Dumping", "[logger]") {
    const std::string path = "test_rbridge_payload.log";
    std::filesystem::remove(path);

    LoggerConfig config;
    config.min_level = LogLevel::DEBUG;
    config.enable_console = false;
    config.enable_file = true;
    config.log_file_path = path;
    config.enable_payload_dump = true;
    config.max_payload_dump_bytes = 4;
    Logger::get_instance().configure(config);

    CallContext ctx("p1", "unstructured", "predict_unstructured");
    uint8_t payload[6] = {0xDE, 0xAD, 0xBE, 0xEF, 0x00, 0x01};
    Logger::get_instance().log_payload(ctx, "binary_data", payload, sizeof(payload));

    auto fields = parse_json_log(first_line(path));
    REQUIRE(fields["event"] == "payload_dump");
    REQUIRE(fields["payload_name"] == "binary_data");
    REQUIRE(fields["payload_size"] == "6");
    REQUIRE(fields["dumped_bytes"] == "4");
    REQUIRE(fields["truncated"] == "true");
    REQUIRE(fields["hex_data"] == "deadbeef");

    std::filesystem::remove(path);
}

TEST_CASE("Logger State Transitions", "[logger]") {
    const std::string path = "test_rbridge_states.log";
    log_to_file(path);

    CallContext ctx("p1", "regression");
    Logger::get_instance().log_state_transition(ctx, "UNCONFIGURED", "CONFIGURING");

    auto fields = parse_json_log(first_line(path));
    REQUIRE(fields["event"] == "state_transition");
    REQUIRE(fields["old_state"] == "UNCONFIGURED");
    REQUIRE(fields["new_state"] == "CONFIGURING");

    std::filesystem::remove(path);
}

TEST_CASE("Logger JSON Escaping", "[logger]") {
    const std::string path = "test_rbridge_escape.log";
    log_to_file(path);

    CallContext ctx("test", "test");
    Logger::get_instance().log_error(ctx, "Error in f(\"x\") :\n\tboom", "");

    std::string line = first_line(path);
    REQUIRE(line.find("\\\"") != std::string::npos);
    REQUIRE(line.find("\\n") != std::string::npos);
    REQUIRE(line.find("\\t") != std::string::npos);

    std::filesystem::remove(path);
}
