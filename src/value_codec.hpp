/**
 * @file value_codec.hpp
 * @brief Conversion between host values and values living in the R session
 *
 * host -> R:
 *   null            -> NULL
 *   Bytes           -> raw vector (byte-exact)
 *   std::string     -> character vector of length 1 (built explicitly)
 *   HostMap         -> named list, values converted by the rules above
 *   label list      -> character vector
 *
 * R -> host:
 *   NULL            -> null
 *   raw vector      -> Bytes
 *   character(1)    -> std::string (any other length is an error)
 *   named list      -> HostMap
 *   data.frame      -> TabularFrame (Arrow table)
 *   numeric vector  -> single "Predictions" column when a frame is expected
 */

#ifndef RBRIDGE_VALUE_CODEC_HPP
#define RBRIDGE_VALUE_CODEC_HPP

#include "foreign_session.hpp"
#include "types.hpp"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace rbridge {

/**
 * @brief Plain (non data frame) R list, elements still in the session
 */
struct ForeignList {
    std::vector<std::string> names;
    std::vector<ForeignValuePtr> elements;

    size_t size() const { return elements.size(); }
};

/**
 * @brief Bare numeric vector with no column structure
 */
struct NumericArray {
    std::shared_ptr<arrow::Array> values;
};

/**
 * @brief R value that has no direct host counterpart
 */
struct UnsupportedResult {
    ForeignKind kind;
    std::string type_name;
};

/**
 * @brief Tagged result of decoding an R value
 *
 * Built once from ForeignValue::kind(); callers match on the alternative.
 */
using ForeignResult = std::variant<
    std::monostate,     // NULL
    Bytes,              // raw vector
    std::string,        // character scalar
    ForeignList,        // list
    TabularFrame,       // data.frame
    NumericArray,       // numeric / integer vector
    UnsupportedResult   // everything else
>;

/// Human readable name of the decoded alternative, for error messages
std::string result_type_name(const ForeignResult& result);

/**
 * @brief Converts values across the host/R boundary
 *
 * Holds a reference to the session it creates values in; the session must
 * outlive the codec. Not thread-safe: callers hold the runtime handle lock.
 */
class ValueCodec {
public:
    explicit ValueCodec(ForeignSession& session) : session_(session) {}

    // host -> R

    ForeignValuePtr null_value();
    ForeignValuePtr to_foreign(const HostValue& value);
    ForeignValuePtr to_foreign_raw(const Bytes& bytes);
    ForeignValuePtr to_foreign_character(const std::string& text);

    /// Absent -> NULL, present -> character(1)
    ForeignValuePtr to_foreign_optional(const std::optional<std::string>& text);

    /// Absent -> NULL, present -> character(n)
    ForeignValuePtr to_foreign_labels(const std::optional<std::vector<std::string>>& labels);

    ForeignValuePtr to_foreign_list(const HostMap& map);

    // R -> host

    /**
     * @brief Convert NULL, raw or character scalar
     * @throws UnsupportedValueType For any other kind, or a character vector of length != 1
     */
    HostValue to_host_value(const ForeignValue& value) const;

    /**
     * @brief Convert a named list
     * @return std::nullopt for NULL
     * @throws UnsupportedValueType If the value is not a list, an element is unnamed,
     *         a name repeats, or an element is not NULL/raw/character
     */
    std::optional<HostMap> to_host_map(const ForeignValue& value) const;

    /**
     * @brief Convert a data.frame or a bare numeric vector to a frame
     * @throws UnexpectedResultType For any other kind
     */
    TabularFrame to_frame(const ForeignValue& value) const;

    /**
     * @brief Convert an atomic vector (numeric, integer, logical, character, factor)
     * @throws UnsupportedValueType For lists and non-vector values
     */
    TabularColumn to_column(const ForeignValue& value) const;

    /**
     * @brief Classify and convert a result value
     */
    ForeignResult decode(const ForeignValuePtr& value) const;

    /// Wrap a numeric array into a frame with the single "Predictions" column
    static TabularFrame array_to_frame(const NumericArray& array);

private:
    ForeignSession& session_;

    TabularFrame data_frame_to_table(const ForeignValue& frame) const;
    std::shared_ptr<arrow::Array> vector_to_array(const ForeignValue& vector) const;
};

} // namespace rbridge

#endif // RBRIDGE_VALUE_CODEC_HPP
