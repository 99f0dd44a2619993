#ifndef RBRIDGE_FRAME_IO_HPP
#define RBRIDGE_FRAME_IO_HPP

#include "types.hpp"

#include <string>

namespace rbridge {

/**
 * Output file format for a tabular result
 */
enum class FrameFileFormat {
    CSV,
    PARQUET
};

/**
 * Pick the output format from a file extension (".parquet" or ".pq", otherwise CSV)
 */
FrameFileFormat frame_format_for_path(const std::string& filepath);

/**
 * Guess the request MIME type from an input file extension
 *
 * .csv -> text/csv, .mtx -> text/mtx, anything else -> application/octet-stream
 */
std::string mimetype_for_path(const std::string& filepath);

/**
 * FrameWriter - Writes prediction and transform results to disk
 *
 * Supports:
 * - Tabular frames: CSV (header row) or Parquet
 * - Sparse matrices: MatrixMarket coordinate format
 */
class FrameWriter {
public:
    FrameWriter() = default;
    ~FrameWriter() = default;

    // Prevent copying
    FrameWriter(const FrameWriter&) = delete;
    FrameWriter& operator=(const FrameWriter&) = delete;

    /**
     * Write a frame in the format implied by the file extension
     *
     * @return true on success, false on error (see get_last_error())
     */
    bool write_frame(const std::string& filepath, const TabularFrame& frame);

    bool write_frame(const std::string& filepath, const TabularFrame& frame, FrameFileFormat format);

    /**
     * Write a single column as a one-column CSV file named after @p column_name
     */
    bool write_column(const std::string& filepath, const TabularColumn& column,
                      const std::string& column_name);

    /**
     * Write a sparse matrix in MatrixMarket format (1-based indices)
     */
    bool write_sparse(const std::string& filepath, const SparseMatrix& matrix);

    /**
     * Get last error message
     */
    const std::string& get_last_error() const { return last_error_; }

private:
    std::string last_error_;

    bool write_csv(const std::string& filepath, const TabularFrame& frame);
    bool write_parquet(const std::string& filepath, const TabularFrame& frame);
    void set_error(const std::string& error);
};

} // namespace rbridge

#endif // RBRIDGE_FRAME_IO_HPP
