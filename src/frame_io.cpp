#include "frame_io.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>

#include <arrow/api.h>
#include <arrow/csv/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/writer.h>

#include <unsupported/Eigen/SparseExtra>

namespace rbridge {

namespace {

std::string lower_extension(const std::string& filepath) {
    std::string extension = std::filesystem::path(filepath).extension().string();
    std::transform(extension.begin(), extension.end(), extension.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return extension;
}

} // namespace

FrameFileFormat frame_format_for_path(const std::string& filepath) {
    const std::string extension = lower_extension(filepath);
    if (extension == ".parquet" || extension == ".pq") {
        return FrameFileFormat::PARQUET;
    }
    return FrameFileFormat::CSV;
}

std::string mimetype_for_path(const std::string& filepath) {
    const std::string extension = lower_extension(filepath);
    if (extension == ".csv") return "text/csv";
    if (extension == ".mtx") return "text/mtx";
    return "application/octet-stream";
}

// ============================================================================
// FrameWriter implementation
// ============================================================================

void FrameWriter::set_error(const std::string& error) {
    last_error_ = error;
}

bool FrameWriter::write_frame(const std::string& filepath, const TabularFrame& frame) {
    return write_frame(filepath, frame, frame_format_for_path(filepath));
}

bool FrameWriter::write_frame(const std::string& filepath, const TabularFrame& frame,
                              FrameFileFormat format) {
    if (!frame) {
        set_error("Cannot write empty frame to " + filepath);
        return false;
    }
    return format == FrameFileFormat::PARQUET ? write_parquet(filepath, frame)
                                              : write_csv(filepath, frame);
}

bool FrameWriter::write_column(const std::string& filepath, const TabularColumn& column,
                               const std::string& column_name) {
    if (!column) {
        set_error("Cannot write empty column to " + filepath);
        return false;
    }
    auto schema = arrow::schema({arrow::field(column_name, column->type())});
    std::vector<std::shared_ptr<arrow::ChunkedArray>> columns{column};
    return write_frame(filepath, arrow::Table::Make(schema, columns));
}

bool FrameWriter::write_sparse(const std::string& filepath, const SparseMatrix& matrix) {
    if (!Eigen::saveMarket(matrix, filepath)) {
        set_error("Failed to write MatrixMarket file: " + filepath);
        return false;
    }
    return true;
}

bool FrameWriter::write_csv(const std::string& filepath, const TabularFrame& frame) {
    auto outfile = arrow::io::FileOutputStream::Open(filepath);
    if (!outfile.ok()) {
        set_error("Failed to open " + filepath + ": " + outfile.status().ToString());
        return false;
    }

    auto status = arrow::csv::WriteCSV(*frame, arrow::csv::WriteOptions::Defaults(),
                                       outfile.ValueOrDie().get());
    if (!status.ok()) {
        set_error("Failed to write CSV file: " + status.ToString());
        return false;
    }

    status = outfile.ValueOrDie()->Close();
    if (!status.ok()) {
        set_error("Failed to close " + filepath + ": " + status.ToString());
        return false;
    }
    return true;
}

bool FrameWriter::write_parquet(const std::string& filepath, const TabularFrame& frame) {
    auto outfile = arrow::io::FileOutputStream::Open(filepath);
    if (!outfile.ok()) {
        set_error("Failed to open " + filepath + ": " + outfile.status().ToString());
        return false;
    }

    auto status = parquet::arrow::WriteTable(
        *frame,
        arrow::default_memory_pool(),
        outfile.ValueOrDie(),
        1024 * 1024  // 1MB row group size
    );
    if (!status.ok()) {
        set_error("Failed to write Parquet file: " + status.ToString());
        return false;
    }
    return true;
}

} // namespace rbridge
