#include <catch2/catch_test_macros.hpp>
#include "../src/config_parser.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace rbridge;

TEST_CASE("Flat config parsing", "[config_parser]") {
    SECTION("Minimal regression config") {
        ConfigMap config;
        config["code_dir"] = "/models/demo";
        config["target_type"] = "regression";

        auto params = parse_predictor_params(config);
        REQUIRE(params.code_dir == "/models/demo");
        REQUIRE(params.target_type == TargetType::REGRESSION);
        REQUIRE_FALSE(params.positive_class_label.has_value());
        REQUIRE_FALSE(params.class_labels.has_value());
        REQUIRE(params.r_script_dir.empty());
        REQUIRE(params.predictor_id == "rbridge");
    }

    SECTION("Binary config with labels") {
        ConfigMap config;
        config["code_dir"] = "/models/demo";
        config["target_type"] = "binary";
        config["positive_class_label"] = "yes";
        config["negative_class_label"] = "no";
        config["predictor_id"] = "churn";

        auto params = parse_predictor_params(config);
        REQUIRE(params.target_type == TargetType::BINARY);
        REQUIRE(params.positive_class_label.value() == "yes");
        REQUIRE(params.negative_class_label.value() == "no");
        REQUIRE(params.predictor_id == "churn");
    }

    SECTION("Multiclass labels are split and trimmed") {
        ConfigMap config;
        config["code_dir"] = "/models/demo";
        config["target_type"] = "multiclass";
        config["class_labels"] = "GALAXY, QSO ,STAR";

        auto params = parse_predictor_params(config);
        REQUIRE(params.class_labels.value() == std::vector<std::string>{"GALAXY", "QSO", "STAR"});
    }

    SECTION("Empty values count as absent") {
        ConfigMap config;
        config["code_dir"] = "/models/demo";
        config["target_type"] = "regression";
        config["positive_class_label"] = "";
        config["r_script_dir"] = "";

        auto params = parse_predictor_params(config);
        REQUIRE_FALSE(params.positive_class_label.has_value());
        REQUIRE(params.r_script_dir.empty());
    }

    SECTION("Missing code_dir should fail") {
        ConfigMap config;
        config["target_type"] = "regression";
        REQUIRE_THROWS_AS(parse_predictor_params(config), ConfigurationError);
    }

    SECTION("Missing target_type should fail") {
        ConfigMap config;
        config["code_dir"] = "/models/demo";
        REQUIRE_THROWS_AS(parse_predictor_params(config), ConfigurationError);
    }

    SECTION("Unknown target_type should fail") {
        ConfigMap config;
        config["code_dir"] = "/models/demo";
        config["target_type"] = "ranking";
        REQUIRE_THROWS_AS(parse_predictor_params(config), ConfigurationError);
    }

    SECTION("Binary with one label should fail") {
        ConfigMap config;
        config["code_dir"] = "/models/demo";
        config["target_type"] = "binary";
        config["positive_class_label"] = "yes";
        REQUIRE_THROWS_AS(parse_predictor_params(config), ConfigurationError);
    }

    SECTION("Label list with only separators should fail") {
        ConfigMap config;
        config["code_dir"] = "/models/demo";
        config["target_type"] = "multiclass";
        config["class_labels"] = " , ,";
        REQUIRE_THROWS_AS(parse_predictor_params(config), ConfigurationError);
    }

    SECTION("Values expand environment references") {
        setenv("RBRIDGE_TEST_MODEL_ROOT", "/srv/models", 1);
        ConfigMap config;
        config["code_dir"] = "${RBRIDGE_TEST_MODEL_ROOT}/demo";
        config["target_type"] = "regression";

        auto params = parse_predictor_params(config);
        REQUIRE(params.code_dir == "/srv/models/demo");
        unsetenv("RBRIDGE_TEST_MODEL_ROOT");
    }
}

TEST_CASE("Label list splitting", "[config_parser]") {
    REQUIRE(split_label_list("a,b,c") == std::vector<std::string>{"a", "b", "c"});
    REQUIRE(split_label_list("  single  ") == std::vector<std::string>{"single"});
    REQUIRE(split_label_list("a,,b") == std::vector<std::string>{"a", "b"});
    REQUIRE(split_label_list("").empty());
}

TEST_CASE("Environment variable expansion", "[config_parser]") {
    SECTION("Expand ${VAR}") {
        setenv("TEST_VAR", "test_value", 1);
        auto result = expand_environment_variables("prefix_${TEST_VAR}_suffix");
        REQUIRE(result == "prefix_test_value_suffix");
        unsetenv("TEST_VAR");
    }

    SECTION("Expand $VAR") {
        setenv("TEST_VAR", "test_value", 1);
        auto result = expand_environment_variables("prefix_$TEST_VAR");
        REQUIRE(result == "prefix_test_value");
        unsetenv("TEST_VAR");
    }

    SECTION("Undefined variable expands to empty string") {
        auto result = expand_environment_variables("${UNDEFINED_RBRIDGE_VAR}");
        REQUIRE(result == "");
    }

    SECTION("Lone dollar is kept") {
        auto result = expand_environment_variables("cost in $ and more");
        REQUIRE(result == "cost in $ and more");
    }

    SECTION("No variables returns original string") {
        auto result = expand_environment_variables("no_variables_here");
        REQUIRE(result == "no_variables_here");
    }
}

TEST_CASE("JSON config parsing", "[config_parser]") {
    SECTION("Parse minimal config") {
        std::string json = R"({
            "code_dir": "/models/demo",
            "target_type": "regression"
        })";

        auto params = parse_predictor_params_from_string(json);
        REQUIRE(params.code_dir == "/models/demo");
        REQUIRE(params.target_type == TargetType::REGRESSION);
    }

    SECTION("class_labels as array") {
        std::string json = R"({
            "code_dir": "/models/iris",
            "target_type": "multiclass",
            "class_labels": ["setosa", "versicolor", "virginica"],
            "predictor_id": "iris"
        })";

        auto params = parse_predictor_params_from_string(json);
        REQUIRE(params.class_labels.value() ==
                std::vector<std::string>{"setosa", "versicolor", "virginica"});
        REQUIRE(params.predictor_id == "iris");
    }

    SECTION("class_labels as string") {
        std::string json = R"({
            "code_dir": "/models/iris",
            "target_type": "multiclass",
            "class_labels": "a,b"
        })";

        auto params = parse_predictor_params_from_string(json);
        REQUIRE(params.class_labels.value() == std::vector<std::string>{"a", "b"});
    }

    SECTION("Null values are ignored") {
        std::string json = R"({
            "code_dir": "/models/demo",
            "target_type": "binary",
            "positive_class_label": null,
            "negative_class_label": null
        })";

        auto params = parse_predictor_params_from_string(json);
        REQUIRE_FALSE(params.positive_class_label.has_value());
        REQUIRE_FALSE(params.negative_class_label.has_value());
    }

    SECTION("Empty class_labels array should fail") {
        std::string json = R"({
            "code_dir": "/models/iris",
            "target_type": "multiclass",
            "class_labels": []
        })";

        REQUIRE_THROWS_AS(parse_predictor_params_from_string(json), ConfigurationError);
    }

    SECTION("Missing code_dir should fail") {
        std::string json = R"({"target_type": "regression"})";
        REQUIRE_THROWS_AS(parse_predictor_params_from_string(json), ConfigurationError);
    }

    SECTION("Non-object JSON should fail") {
        REQUIRE_THROWS_AS(parse_predictor_params_from_string("[1, 2]"), ConfigParseError);
    }

    SECTION("Invalid JSON should fail") {
        std::string json = "not valid json";
        REQUIRE_THROWS_AS(parse_predictor_params_from_string(json), ConfigParseError);
    }
}

TEST_CASE("Config file parsing", "[config_parser]") {
    auto dir = std::filesystem::temp_directory_path() / "rbridge_config_test";
    std::filesystem::create_directories(dir);
    auto file_path = (dir / "predictor.json").string();

    SECTION("Relative paths resolve against the config directory") {
        {
            std::ofstream file(file_path);
            file << R"({
                "code_dir": "model",
                "target_type": "transform",
                "r_script_dir": "/opt/rbridge/r"
            })";
        }

        auto params = parse_predictor_params_from_file(file_path);
        REQUIRE(params.code_dir == (dir / "model").string());
        REQUIRE(params.r_script_dir == "/opt/rbridge/r");
        REQUIRE(params.target_type == TargetType::TRANSFORM);
    }

    SECTION("Missing file should fail") {
        REQUIRE_THROWS_AS(parse_predictor_params_from_file((dir / "absent.json").string()),
                          ConfigParseError);
    }

    std::filesystem::remove_all(dir);
}

TEST_CASE("Relative path resolution", "[config_parser]") {
    REQUIRE(resolve_relative_path("/abs/model", "/etc/rbridge/config.json") == "/abs/model");
    REQUIRE(resolve_relative_path("model", "/etc/rbridge/config.json") == "/etc/rbridge/model");
}
