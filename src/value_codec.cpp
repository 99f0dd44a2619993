#include "value_codec.hpp"
#include "errors.hpp"

#include <arrow/api.h>

namespace rbridge {

namespace {

void check_arrow(const arrow::Status& status, const std::string& context) {
    if (!status.ok()) {
        throw BridgeError(context + ": " + status.ToString());
    }
}

template <typename Builder, typename T>
std::shared_ptr<arrow::Array> build_array(const std::vector<std::optional<T>>& values,
                                          const std::string& context) {
    Builder builder;
    check_arrow(builder.Reserve(static_cast<int64_t>(values.size())), context);
    for (const auto& value : values) {
        if (value) {
            check_arrow(builder.Append(*value), context);
        } else {
            check_arrow(builder.AppendNull(), context);
        }
    }
    std::shared_ptr<arrow::Array> array;
    check_arrow(builder.Finish(&array), context);
    return array;
}

struct ResultTypeName {
    std::string operator()(const std::monostate&) const { return "NULL"; }
    std::string operator()(const Bytes&) const { return "raw"; }
    std::string operator()(const std::string&) const { return "character"; }
    std::string operator()(const ForeignList&) const { return "list"; }
    std::string operator()(const TabularFrame&) const { return "data.frame"; }
    std::string operator()(const NumericArray&) const { return "numeric"; }
    std::string operator()(const UnsupportedResult& other) const { return other.type_name; }
};

} // namespace

std::string result_type_name(const ForeignResult& result) {
    return std::visit(ResultTypeName{}, result);
}

// ============================================================================
// host -> R
// ============================================================================

ForeignValuePtr ValueCodec::null_value() {
    return session_.make_null();
}

ForeignValuePtr ValueCodec::to_foreign(const HostValue& value) {
    if (auto bytes = std::get_if<Bytes>(&value)) {
        return to_foreign_raw(*bytes);
    }
    if (auto text = std::get_if<std::string>(&value)) {
        return to_foreign_character(*text);
    }
    return null_value();
}

ForeignValuePtr ValueCodec::to_foreign_raw(const Bytes& bytes) {
    return session_.make_raw(bytes);
}

ForeignValuePtr ValueCodec::to_foreign_character(const std::string& text) {
    return session_.make_character({text});
}

ForeignValuePtr ValueCodec::to_foreign_optional(const std::optional<std::string>& text) {
    return text ? to_foreign_character(*text) : null_value();
}

ForeignValuePtr ValueCodec::to_foreign_labels(const std::optional<std::vector<std::string>>& labels) {
    return labels ? session_.make_character(*labels) : null_value();
}

ForeignValuePtr ValueCodec::to_foreign_list(const HostMap& map) {
    std::vector<std::string> names;
    std::vector<ForeignValuePtr> values;
    names.reserve(map.size());
    values.reserve(map.size());

    for (const auto& [key, value] : map) {
        names.push_back(key);
        values.push_back(to_foreign(value));
    }

    return session_.make_list(names, values);
}

// ============================================================================
// R -> host
// ============================================================================

HostValue ValueCodec::to_host_value(const ForeignValue& value) const {
    switch (value.kind()) {
        case ForeignKind::NULL_VALUE:
            return std::monostate{};

        case ForeignKind::RAW:
            return value.raw();

        case ForeignKind::CHARACTER: {
            // Scalars arrive from R as one-element vectors
            auto strings = value.strings();
            if (strings.size() != 1) {
                throw UnsupportedValueType(
                    "expected a character scalar, got a character vector of length " +
                    std::to_string(strings.size()));
            }
            if (!strings.front()) {
                throw UnsupportedValueType("character NA has no host representation");
            }
            return *strings.front();
        }

        default:
            throw UnsupportedValueType(
                "R value of type '" + value.type_name() + "' (expected NULL, raw or character)");
    }
}

std::optional<HostMap> ValueCodec::to_host_map(const ForeignValue& value) const {
    if (value.is_null()) {
        return std::nullopt;
    }
    if (value.kind() != ForeignKind::LIST) {
        throw UnsupportedValueType(
            "R value of type '" + value.type_name() + "' (expected a named list)");
    }

    const size_t count = value.length();
    std::vector<std::string> names = value.names();
    if (count > 0 && names.size() != count) {
        throw UnsupportedValueType("list elements must be named");
    }

    HostMap result;
    for (size_t i = 0; i < count; ++i) {
        const std::string& key = names[i];
        if (key.empty()) {
            throw UnsupportedValueType("list element " + std::to_string(i + 1) + " has no name");
        }
        if (result.count(key) > 0) {
            throw UnsupportedValueType("list name '" + key + "' appears more than once");
        }
        result[key] = to_host_value(*value.element(i));
    }
    return result;
}

TabularFrame ValueCodec::to_frame(const ForeignValue& value) const {
    switch (value.kind()) {
        case ForeignKind::DATA_FRAME:
            return data_frame_to_table(value);
        case ForeignKind::DOUBLE:
        case ForeignKind::INTEGER:
            return array_to_frame(NumericArray{vector_to_array(value)});
        default:
            throw UnexpectedResultType("data.frame", value.type_name());
    }
}

TabularColumn ValueCodec::to_column(const ForeignValue& value) const {
    return std::make_shared<arrow::ChunkedArray>(vector_to_array(value));
}

ForeignResult ValueCodec::decode(const ForeignValuePtr& value) const {
    if (!value) {
        return std::monostate{};
    }

    switch (value->kind()) {
        case ForeignKind::NULL_VALUE:
            return std::monostate{};

        case ForeignKind::RAW:
            return value->raw();

        case ForeignKind::CHARACTER:
            if (value->length() == 1) {
                return std::get<std::string>(to_host_value(*value));
            }
            return UnsupportedResult{ForeignKind::CHARACTER,
                                     "character vector of length " +
                                         std::to_string(value->length())};

        case ForeignKind::LIST: {
            ForeignList list;
            list.names = value->names();
            list.elements.reserve(value->length());
            for (size_t i = 0; i < value->length(); ++i) {
                list.elements.push_back(value->element(i));
            }
            return list;
        }

        case ForeignKind::DATA_FRAME:
            return data_frame_to_table(*value);

        case ForeignKind::DOUBLE:
        case ForeignKind::INTEGER:
            return NumericArray{vector_to_array(*value)};

        default:
            return UnsupportedResult{value->kind(), value->type_name()};
    }
}

TabularFrame ValueCodec::array_to_frame(const NumericArray& array) {
    auto schema = arrow::schema({arrow::field(kPredictionColumn, array.values->type())});
    std::vector<std::shared_ptr<arrow::Array>> columns{array.values};
    return arrow::Table::Make(schema, columns, array.values->length());
}

TabularFrame ValueCodec::data_frame_to_table(const ForeignValue& frame) const {
    const size_t column_count = frame.length();
    std::vector<std::string> names = frame.names();
    if (names.size() != column_count) {
        throw UnsupportedValueType("data.frame columns must be named");
    }

    arrow::FieldVector fields;
    std::vector<std::shared_ptr<arrow::Array>> columns;
    fields.reserve(column_count);
    columns.reserve(column_count);

    int64_t num_rows = -1;
    for (size_t i = 0; i < column_count; ++i) {
        auto column = frame.element(i);
        auto array = vector_to_array(*column);

        if (num_rows >= 0 && array->length() != num_rows) {
            throw UnsupportedValueType(
                "data.frame column '" + names[i] + "' has " + std::to_string(array->length()) +
                " rows, expected " + std::to_string(num_rows));
        }
        num_rows = array->length();

        fields.push_back(arrow::field(names[i], array->type()));
        columns.push_back(array);
    }

    return arrow::Table::Make(arrow::schema(fields), columns, num_rows < 0 ? 0 : num_rows);
}

std::shared_ptr<arrow::Array> ValueCodec::vector_to_array(const ForeignValue& vector) const {
    const std::string context = "Failed to build column from R " + vector.type_name();

    switch (vector.kind()) {
        case ForeignKind::DOUBLE:
            return build_array<arrow::DoubleBuilder>(vector.doubles(), context);
        case ForeignKind::INTEGER:
            return build_array<arrow::Int32Builder>(vector.integers(), context);
        case ForeignKind::LOGICAL:
            return build_array<arrow::BooleanBuilder>(vector.logicals(), context);
        case ForeignKind::CHARACTER:
        case ForeignKind::FACTOR:
            return build_array<arrow::StringBuilder>(vector.strings(), context);
        default:
            throw UnsupportedValueType(
                "R value of type '" + vector.type_name() + "' is not an atomic column");
    }
}

} // namespace rbridge
