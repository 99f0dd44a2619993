#include <iostream>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>
#include "config_parser.hpp"
#include "errors.hpp"
#include "frame_io.hpp"
#include "logger.hpp"
#include "r_predictor.hpp"
#include "r_session.hpp"

using namespace rbridge;

namespace {

struct CLIArgs {
    std::string config_path;
    std::string code_dir;
    std::string target_type;
    std::string positive_class_label;
    std::string negative_class_label;
    std::string class_labels;
    std::string r_script_dir;
    std::string input_path;
    std::string target_path;            // transform only
    std::string mimetype;
    std::string output_path;
    std::string target_output_path;     // transform only
    std::vector<std::pair<std::string, std::string>> query;
    std::string log_level = "INFO";
    std::string log_file;
    bool log_plain = false;
    bool help = false;
};

void print_usage(const char* program_name) {
    std::cerr << "rbridge-score\n\n";
    std::cerr << "Usage: " << program_name << " [options]\n\n";
    std::cerr << "Model options:\n";
    std::cerr << "  --config <path>               JSON predictor configuration\n";
    std::cerr << "                                (alternative to the options below)\n";
    std::cerr << "  --code-dir <path>             Directory with custom.R and the model artifact\n";
    std::cerr << "  --target-type <type>          regression, binary, multiclass, anomaly,\n";
    std::cerr << "                                unstructured or transform\n";
    std::cerr << "  --positive-class-label <l>    Binary positive class label\n";
    std::cerr << "  --negative-class-label <l>    Binary negative class label\n";
    std::cerr << "  --class-labels <a,b,c>        Multiclass labels, comma separated\n";
    std::cerr << "  --r-script-dir <path>         Directory with common.R and score.R\n\n";
    std::cerr << "Data options:\n";
    std::cerr << "  --input <path>                Request payload (CSV, MTX or any file in unstructured mode)\n";
    std::cerr << "  --target <path>               Target payload (transform only)\n";
    std::cerr << "  --mimetype <type>             Request MIME type (default: from --input extension)\n";
    std::cerr << "  --query <key=value>           Query parameter (unstructured only, repeatable)\n\n";
    std::cerr << "Output options:\n";
    std::cerr << "  --output <path>               Result file (.csv, .parquet; .mtx for sparse transforms;\n";
    std::cerr << "                                default: stdout in unstructured mode)\n";
    std::cerr << "  --target-output <path>        Transformed target file (transform only)\n\n";
    std::cerr << "Logging options:\n";
    std::cerr << "  --log-level <level>           DEBUG, INFO, WARN or ERROR (default: INFO)\n";
    std::cerr << "  --log-file <path>             Also log to this file\n";
    std::cerr << "  --log-plain                   Plain text log lines instead of JSON\n\n";
    std::cerr << "Examples:\n\n";
    std::cerr << "  " << program_name << " --code-dir model/ --target-type regression \\\n";
    std::cerr << "      --input data/boston.csv --output predictions.csv\n\n";
    std::cerr << "  " << program_name << " --config predictor.json --input request.bin \\\n";
    std::cerr << "      --query ret_mode=binary --output response.bin\n";
}

bool file_exists(const std::string& path) {
    std::ifstream f(path);
    return f.good();
}

bool parse_args(int argc, char* argv[], CLIArgs& args) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            args.help = true;
            return true;
        } else if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--code-dir" && i + 1 < argc) {
            args.code_dir = argv[++i];
        } else if (arg == "--target-type" && i + 1 < argc) {
            args.target_type = argv[++i];
        } else if (arg == "--positive-class-label" && i + 1 < argc) {
            args.positive_class_label = argv[++i];
        } else if (arg == "--negative-class-label" && i + 1 < argc) {
            args.negative_class_label = argv[++i];
        } else if (arg == "--class-labels" && i + 1 < argc) {
            args.class_labels = argv[++i];
        } else if (arg == "--r-script-dir" && i + 1 < argc) {
            args.r_script_dir = argv[++i];
        } else if (arg == "--input" && i + 1 < argc) {
            args.input_path = argv[++i];
        } else if (arg == "--target" && i + 1 < argc) {
            args.target_path = argv[++i];
        } else if (arg == "--mimetype" && i + 1 < argc) {
            args.mimetype = argv[++i];
        } else if (arg == "--query" && i + 1 < argc) {
            std::string pair = argv[++i];
            size_t eq = pair.find('=');
            if (eq == std::string::npos || eq == 0) {
                std::cerr << "Error: --query expects key=value, got: " << pair << "\n\n";
                return false;
            }
            args.query.emplace_back(pair.substr(0, eq), pair.substr(eq + 1));
        } else if (arg == "--output" && i + 1 < argc) {
            args.output_path = argv[++i];
        } else if (arg == "--target-output" && i + 1 < argc) {
            args.target_output_path = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            args.log_level = argv[++i];
        } else if (arg == "--log-file" && i + 1 < argc) {
            args.log_file = argv[++i];
        } else if (arg == "--log-plain") {
            args.log_plain = true;
        } else {
            std::cerr << "Error: Unknown option or missing argument: " << arg << "\n\n";
            return false;
        }
    }
    return true;
}

bool validate_args(const CLIArgs& args) {
    bool valid = true;

    if (args.config_path.empty()) {
        if (args.code_dir.empty()) {
            std::cerr << "Error: --code-dir is required (or use --config)\n";
            valid = false;
        }
        if (args.target_type.empty()) {
            std::cerr << "Error: --target-type is required (or use --config)\n";
            valid = false;
        }
    } else if (!file_exists(args.config_path)) {
        std::cerr << "Error: Config file not found: " << args.config_path << "\n";
        valid = false;
    }

    if (args.input_path.empty()) {
        std::cerr << "Error: --input is required\n";
        valid = false;
    } else if (!file_exists(args.input_path)) {
        std::cerr << "Error: Input file not found: " << args.input_path << "\n";
        valid = false;
    }

    if (!args.target_path.empty() && !file_exists(args.target_path)) {
        std::cerr << "Error: Target file not found: " << args.target_path << "\n";
        valid = false;
    }

    return valid;
}

PredictorParams build_params(const CLIArgs& args) {
    if (!args.config_path.empty()) {
        return parse_predictor_params_from_file(args.config_path);
    }

    ConfigMap config;
    config["code_dir"] = args.code_dir;
    config["target_type"] = args.target_type;
    config["positive_class_label"] = args.positive_class_label;
    config["negative_class_label"] = args.negative_class_label;
    config["class_labels"] = args.class_labels;
    config["r_script_dir"] = args.r_script_dir;
    return parse_predictor_params(config);
}

Bytes read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw ConfigurationError("Cannot open file: " + path);
    }
    return Bytes(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

bool write_host_value(const HostValue& value, const std::string& path) {
    std::string text;
    if (auto bytes = std::get_if<Bytes>(&value)) {
        text.assign(bytes->begin(), bytes->end());
    } else if (auto str = std::get_if<std::string>(&value)) {
        text = *str;
    }

    if (path.empty()) {
        std::cout << text;
        std::cout.flush();
        return true;
    }

    std::ofstream out(path, std::ios::binary);
    out << text;
    return out.good();
}

int run_structured(RPredictor& predictor, const CLIArgs& args, const Bytes& input,
                   const std::string& mimetype) {
    if (!predictor.supported_payload_formats().is_mimetype_supported(mimetype)) {
        std::cerr << "Warning: mimetype '" << mimetype << "' is not a native payload format; "
                  << "relying on the model's read_input_data hook\n";
    }

    TabularFrame predictions = predictor.predict_structured(input, mimetype);

    FrameWriter writer;
    if (!writer.write_frame(args.output_path, predictions)) {
        std::cerr << "Error: " << writer.get_last_error() << "\n";
        return 1;
    }
    std::cout << "Wrote " << predictions->num_rows() << " predictions to " << args.output_path << "\n";
    return 0;
}

int run_transform(RPredictor& predictor, const CLIArgs& args, const Bytes& input,
                  const std::string& mimetype) {
    std::optional<Bytes> target;
    if (!args.target_path.empty()) {
        target = read_file(args.target_path);
    }

    TransformResult result = predictor.transform(input, target, mimetype);

    FrameWriter writer;
    bool ok = result.is_sparse()
        ? writer.write_sparse(args.output_path, std::get<SparseMatrix>(result.features))
        : writer.write_frame(args.output_path, std::get<TabularFrame>(result.features));
    if (!ok) {
        std::cerr << "Error: " << writer.get_last_error() << "\n";
        return 1;
    }

    if (result.has_target() && !args.target_output_path.empty()) {
        if (auto frame = std::get_if<TabularFrame>(&result.target)) {
            ok = writer.write_frame(args.target_output_path, *frame);
        } else {
            ok = writer.write_column(args.target_output_path,
                                     std::get<TabularColumn>(result.target), "target");
        }
        if (!ok) {
            std::cerr << "Error: " << writer.get_last_error() << "\n";
            return 1;
        }
    }

    std::cout << "Wrote transformed " << (result.is_sparse() ? "sparse" : "dense")
              << " features to " << args.output_path << "\n";
    return 0;
}

int run_unstructured(RPredictor& predictor, const CLIArgs& args, const Bytes& input,
                     const std::string& mimetype) {
    std::optional<HostMap> query;
    if (!args.query.empty()) {
        query = HostMap();
        for (const auto& [key, value] : args.query) {
            (*query)[key] = value;
        }
    }

    HostMap extra;
    extra["mimetype"] = mimetype;

    UnstructuredResult result = predictor.predict_unstructured(input, query, extra);

    if (!write_host_value(result.payload, args.output_path)) {
        std::cerr << "Error: Failed to write response to " << args.output_path << "\n";
        return 1;
    }

    if (result.metadata) {
        for (const auto& [key, value] : *result.metadata) {
            std::cerr << key << ": ";
            if (auto str = std::get_if<std::string>(&value)) {
                std::cerr << *str;
            } else if (auto bytes = std::get_if<Bytes>(&value)) {
                std::cerr << "<" << bytes->size() << " bytes>";
            } else {
                std::cerr << "NULL";
            }
            std::cerr << "\n";
        }
    }
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    CLIArgs args;

    if (!parse_args(argc, argv, args)) {
        print_usage(argv[0]);
        return 1;
    }

    if (args.help) {
        print_usage(argv[0]);
        return 0;
    }

    if (!validate_args(args)) {
        std::cerr << "\nUse --help for usage information.\n";
        return 1;
    }

    LoggerConfig log_config;
    log_config.min_level = string_to_level(args.log_level);
    log_config.enable_json = !args.log_plain;
    if (!args.log_file.empty()) {
        log_config.enable_file = true;
        log_config.log_file_path = args.log_file;
    }
    Logger::get_instance().configure(log_config);

    try {
        PredictorParams params = build_params(args);

        if (params.target_type != TargetType::UNSTRUCTURED && args.output_path.empty()) {
            std::cerr << "Error: --output is required for target type '"
                      << target_type_to_string(params.target_type) << "'\n";
            return 1;
        }

        RPredictor predictor([]() { return std::make_unique<RSession>(); });
        predictor.configure(params);

        Bytes input = read_file(args.input_path);
        std::string mimetype = args.mimetype.empty() ? mimetype_for_path(args.input_path)
                                                     : args.mimetype;

        int rc = 0;
        switch (params.target_type) {
            case TargetType::TRANSFORM:
                rc = run_transform(predictor, args, input, mimetype);
                break;
            case TargetType::UNSTRUCTURED:
                rc = run_unstructured(predictor, args, input, mimetype);
                break;
            default:
                rc = run_structured(predictor, args, input, mimetype);
                break;
        }

        Logger::get_instance().flush();
        return rc;

    } catch (const ForeignExecutionError& e) {
        std::cerr << "R error in " << e.function_name() << ":\n" << e.diagnostics() << "\n";
        return 2;
    } catch (const BridgeError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
