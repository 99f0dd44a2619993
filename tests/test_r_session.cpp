/**
 * @file test_r_session.cpp
 * @brief Integration tests against the embedded R interpreter
 *
 * All cases share one interpreter, so this binary runs as a single test.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "../src/error_capture.hpp"
#include "../src/r_predictor.hpp"
#include "../src/r_session.hpp"

#include <arrow/api.h>

#include <filesystem>
#include <fstream>
#include <random>
#include <string>

using namespace rbridge;
using Catch::Matchers::ContainsSubstring;

namespace {

void quiet_logger() {
    LoggerConfig config;
    config.enable_console = false;
    Logger::get_instance().configure(config);
}

/**
 * @brief Temporary model directory with a custom.R
 */
class TempModelDir {
public:
    explicit TempModelDir(const std::string& custom_code) {
        std::random_device rd;
        dir_ = std::filesystem::temp_directory_path() /
               ("rbridge_model_" + std::to_string(rd()) + std::to_string(rd()));
        std::filesystem::create_directories(dir_);
        std::ofstream(dir_ / "custom.R") << custom_code;
    }

    ~TempModelDir() {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    std::string path() const { return dir_.string(); }

    std::string file(const std::string& name) const { return (dir_ / name).string(); }

private:
    std::filesystem::path dir_;
};

RPredictor make_predictor() {
    return RPredictor([]() { return std::make_unique<RSession>(); });
}

PredictorParams make_params(const TempModelDir& model, TargetType type) {
    PredictorParams params(model.path(), type);
    params.r_script_dir = RBRIDGE_SOURCE_R_DIR;
    return params;
}

Bytes to_bytes(const std::string& text) {
    return Bytes(text.begin(), text.end());
}

std::vector<double> double_column(const TabularFrame& frame, const std::string& name) {
    auto column = frame->GetColumnByName(name);
    REQUIRE(column != nullptr);
    REQUIRE(column->type()->id() == arrow::Type::DOUBLE);

    std::vector<double> values;
    for (const auto& chunk : column->chunks()) {
        auto array = std::static_pointer_cast<arrow::DoubleArray>(chunk);
        for (int64_t i = 0; i < array->length(); ++i) {
            values.push_back(array->Value(i));
        }
    }
    return values;
}

} // namespace

TEST_CASE("RSession values", "[r_session]") {
    RSession session;

    SECTION("Raw vectors keep every byte") {
        Bytes bytes{0x00, 0xFF, 0x00, 0x42};
        auto value = session.make_raw(bytes);
        REQUIRE(value->kind() == ForeignKind::RAW);
        REQUIRE(value->raw() == bytes);
    }

    SECTION("Character vectors are UTF-8") {
        auto value = session.make_character({"caf\xC3\xA9", ""});
        REQUIRE(value->kind() == ForeignKind::CHARACTER);
        REQUIRE(value->length() == 2);
        REQUIRE(value->strings()[0].value() == "caf\xC3\xA9");
        REQUIRE(value->strings()[1].value().empty());
    }

    SECTION("Named lists") {
        auto list = session.make_list({"a", "b"}, {session.make_character({"x"}), session.make_null()});
        REQUIRE(list->kind() == ForeignKind::LIST);
        REQUIRE(list->names() == std::vector<std::string>{"a", "b"});
        REQUIRE(list->element(1)->is_null());
    }

    SECTION("Wrong accessor is rejected") {
        auto value = session.make_character({"x"});
        REQUIRE_THROWS_AS(value->raw(), UnsupportedValueType);
    }
}

TEST_CASE("RSession calls", "[r_session]") {
    TempModelDir dir("");
    {
        std::ofstream script(dir.file("helpers.R"));
        script << "shout <- function(text, suffix = \"!\") paste0(toupper(text), suffix)\n"
               << "levels_of <- function() factor(c(\"b\", NA, \"a\"))\n"
               << "frame <- function() data.frame(x = c(1.5, NA), y = c(\"u\", \"v\"), "
               << "stringsAsFactors = FALSE)\n"
               << "probs <- function() matrix(c(0.1, 0.9, 0.8, 0.2), nrow = 2)\n"
               << "explode <- function() stop(\"model exploded\")\n";
    }

    RSession session;
    session.source(dir.file("helpers.R"));

    SECTION("Bindings live in the session environment") {
        REQUIRE(session.has_binding("shout"));
        REQUIRE_FALSE(session.has_binding("not_defined_anywhere"));

        RSession other;
        REQUIRE_FALSE(other.has_binding("shout"));
    }

    SECTION("Positional and named arguments") {
        auto result = session.call("shout", {
            ForeignArgument("", session.make_character({"hi"})),
            ForeignArgument("suffix", session.make_character({"?"}))
        });
        REQUIRE(result->strings().front().value() == "HI?");
    }

    SECTION("Factors read as their labels") {
        auto result = session.call("levels_of", {});
        REQUIRE(result->kind() == ForeignKind::FACTOR);
        auto labels = result->strings();
        REQUIRE(labels[0].value() == "b");
        REQUIRE_FALSE(labels[1].has_value());
        REQUIRE(labels[2].value() == "a");
    }

    SECTION("Matrices are not flat vectors") {
        auto result = session.call("probs", {});
        REQUIRE(result->kind() == ForeignKind::MATRIX);
        REQUIRE(result->type_name() == "matrix");
        REQUIRE(result->length() == 4);

        ValueCodec codec(session);
        REQUIRE(std::holds_alternative<UnsupportedResult>(codec.decode(result)));
    }

    SECTION("Data frames convert to tables") {
        ValueCodec codec(session);
        TabularFrame table = codec.to_frame(*session.call("frame", {}));
        REQUIRE(table->num_rows() == 2);
        REQUIRE(table->ColumnNames() == std::vector<std::string>{"x", "y"});
        REQUIRE(table->column(0)->null_count() == 1);
    }

    SECTION("R errors become foreign faults") {
        REQUIRE_THROWS_WITH(session.call("explode", {}), ContainsSubstring("model exploded"));
        REQUIRE_THROWS_AS(session.call("no_such_function", {}), ForeignFault);

        auto result = session.call("shout", {ForeignArgument("", session.make_character({"ok"}))});
        REQUIRE(result->strings().front().value() == "OK!");
    }

    SECTION("Error capture wraps the fault") {
        quiet_logger();
        CallContext ctx("r_session", "regression", "call");

        try {
            run_with_error_capture(session, ctx, "explode", [&]() {
                return session.call("explode", {});
            });
            FAIL("Expected ForeignExecutionError");
        } catch (const ForeignExecutionError& e) {
            REQUIRE(e.function_name() == "explode");
            REQUIRE_THAT(e.what(), ContainsSubstring("model exploded"));
        }

        auto result = run_with_error_capture(session, ctx, "shout", [&]() {
            return session.call("shout", {ForeignArgument("", session.make_character({"again"}))});
        });
        REQUIRE(result->strings().front().value() == "AGAIN!");
    }
}

TEST_CASE("RPredictor end to end", "[r_session][predictor]") {
    quiet_logger();

    SECTION("Structured regression with a score hook") {
        TempModelDir model(
            "load_model <- function(code_dir) list(scale = 2)\n"
            "score <- function(data, model, ...) {\n"
            "    data.frame(Predictions = data$x * model$scale)\n"
            "}\n");

        RPredictor predictor = make_predictor();
        predictor.configure(make_params(model, TargetType::REGRESSION));
        REQUIRE(predictor.is_configured());
        REQUIRE_FALSE(predictor.has_read_input_data_hook());

        TabularFrame frame = predictor.predict_structured(to_bytes("x\n1\n2\n3\n"), std::string("text/csv"));
        REQUIRE(double_column(frame, kPredictionColumn) == std::vector<double>{2.0, 4.0, 6.0});
    }

    SECTION("Bare numeric result becomes the Predictions column") {
        TempModelDir model(
            "load_model <- function(code_dir) NULL\n"
            "score <- function(data, model, ...) as.numeric(data$x) + 0.5\n");

        RPredictor predictor = make_predictor();
        predictor.configure(make_params(model, TargetType::REGRESSION));

        TabularFrame frame = predictor.predict_structured(to_bytes("x\n1\n2\n"));
        REQUIRE(double_column(frame, kPredictionColumn) == std::vector<double>{1.5, 2.5});
    }

    SECTION("Matrix from a score hook is an invalid prediction shape") {
        TempModelDir model(
            "load_model <- function(code_dir) NULL\n"
            "score <- function(data, model, ...) matrix(c(0.1, 0.9, 0.8, 0.2), nrow = 2)\n");

        RPredictor predictor = make_predictor();
        predictor.configure(make_params(model, TargetType::REGRESSION));

        REQUIRE_THROWS_AS(predictor.predict_structured(to_bytes("x\n1\n2\n")), InvalidPredictionShape);
        REQUIRE(predictor.is_configured());
    }

    SECTION("R error during predict carries the R message") {
        TempModelDir model(
            "load_model <- function(code_dir) NULL\n"
            "score <- function(data, model, ...) stop(\"bad feature column\")\n");

        RPredictor predictor = make_predictor();
        predictor.configure(make_params(model, TargetType::REGRESSION));

        REQUIRE_THROWS_WITH(predictor.predict_structured(to_bytes("x\n1\n")),
                            ContainsSubstring("bad feature column"));
        REQUIRE(predictor.is_configured());
    }

    SECTION("Missing model artifact fails configure") {
        TempModelDir model("");

        RPredictor predictor = make_predictor();
        REQUIRE_THROWS_AS(predictor.configure(make_params(model, TargetType::REGRESSION)),
                          ForeignExecutionError);
        REQUIRE(predictor.get_state() == PredictorState::FAILED);
    }

    SECTION("Unstructured echo") {
        TempModelDir model(
            "load_model <- function(code_dir) \"model\"\n"
            "score_unstructured <- function(model, data, ...) {\n"
            "    if (is.raw(data)) return(list(rev(data), list(kind = \"bytes\")))\n"
            "    paste0(model, \":\", data)\n"
            "}\n");

        RPredictor predictor = make_predictor();
        predictor.configure(make_params(model, TargetType::UNSTRUCTURED));

        UnstructuredResult text = predictor.predict_unstructured(std::string("hi"));
        REQUIRE(std::get<std::string>(text.payload) == "model:hi");
        REQUIRE_FALSE(text.metadata.has_value());

        UnstructuredResult bytes = predictor.predict_unstructured(Bytes{1, 2, 0});
        REQUIRE(std::get<Bytes>(bytes.payload) == Bytes{0, 2, 1});
        REQUIRE(bytes.metadata.has_value());
        REQUIRE(std::get<std::string>(bytes.metadata->at("kind")) == "bytes");
    }

    SECTION("Unstructured mode without score_unstructured") {
        TempModelDir model("load_model <- function(code_dir) NULL\n");

        RPredictor predictor = make_predictor();
        REQUIRE_THROWS_WITH(predictor.configure(make_params(model, TargetType::UNSTRUCTURED)),
                            ContainsSubstring("score_unstructured"));
    }

    SECTION("Dense transform with a target") {
        TempModelDir model(
            "transform <- function(X, transformer, y) X * 10\n");

        RPredictor predictor = make_predictor();
        predictor.configure(make_params(model, TargetType::TRANSFORM));

        TransformResult result = predictor.transform(to_bytes("a,b\n1,2\n3,4\n"), to_bytes("y\n0\n1\n"));
        REQUIRE_FALSE(result.is_sparse());
        REQUIRE(double_column(std::get<TabularFrame>(result.features), "a") ==
                std::vector<double>{10.0, 30.0});
        REQUIRE(std::holds_alternative<TabularColumn>(result.target));
        REQUIRE(std::get<TabularColumn>(result.target)->length() == 2);
    }
}
