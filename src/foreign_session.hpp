/**
 * @file foreign_session.hpp
 * @brief Abstract view of an interpreter session and the values living inside it
 *
 * The bridge never touches interpreter objects directly. It holds ForeignValue
 * handles and reads them through typed accessors; it creates new interpreter
 * values only through a ForeignSession. RSession implements both over the
 * embedded R C API. Tests substitute an in-process fake.
 *
 * Lifecycle:
 *   1. source(path) - evaluate support scripts into the session
 *   2. call(function, args) - invoke a bound function
 *   3. session destroyed - all bindings released
 */

#ifndef RBRIDGE_FOREIGN_SESSION_HPP
#define RBRIDGE_FOREIGN_SESSION_HPP

#include "types.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace rbridge {

/**
 * @brief Declared kind of a foreign value, determined once per value
 */
enum class ForeignKind {
    NULL_VALUE,   ///< R NULL
    RAW,          ///< raw vector
    CHARACTER,    ///< character vector
    FACTOR,       ///< factor (integer codes with levels)
    LOGICAL,      ///< logical vector
    INTEGER,      ///< integer vector
    DOUBLE,       ///< numeric vector
    LIST,         ///< generic vector (list), possibly named
    DATA_FRAME,   ///< list with class data.frame
    MATRIX,       ///< atomic vector with a dim attribute (matrix or array)
    OTHER         ///< closures, environments, S4 objects, ...
};

inline std::string kind_to_string(ForeignKind kind) {
    switch (kind) {
        case ForeignKind::NULL_VALUE: return "NULL";
        case ForeignKind::RAW: return "raw";
        case ForeignKind::CHARACTER: return "character";
        case ForeignKind::FACTOR: return "factor";
        case ForeignKind::LOGICAL: return "logical";
        case ForeignKind::INTEGER: return "integer";
        case ForeignKind::DOUBLE: return "numeric";
        case ForeignKind::LIST: return "list";
        case ForeignKind::DATA_FRAME: return "data.frame";
        case ForeignKind::MATRIX: return "matrix";
        case ForeignKind::OTHER: return "other";
        default: return "unknown";
    }
}

/**
 * @brief Raised by a ForeignSession when the interpreter signals an error
 *
 * Internal to the session seam: ForeignErrorCapture converts it into
 * ForeignExecutionError before it reaches the host-facing API.
 */
class ForeignFault : public std::runtime_error {
public:
    explicit ForeignFault(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Opaque handle to a value owned by the interpreter session
 *
 * Accessors that do not apply to the value's kind throw UnsupportedValueType.
 */
class ForeignValue {
public:
    virtual ~ForeignValue() = default;

    virtual ForeignKind kind() const = 0;

    /// Class or type name as the interpreter reports it (for error messages)
    virtual std::string type_name() const = 0;

    /// Number of elements; for a data frame, the number of columns
    virtual size_t length() const = 0;

    virtual Bytes raw() const = 0;

    /// Character or factor elements; NA is std::nullopt
    virtual std::vector<std::optional<std::string>> strings() const = 0;

    virtual std::vector<std::optional<double>> doubles() const = 0;
    virtual std::vector<std::optional<int32_t>> integers() const = 0;
    virtual std::vector<std::optional<bool>> logicals() const = 0;

    /// Element names; empty strings where unnamed, empty vector if no names at all
    virtual std::vector<std::string> names() const = 0;

    /// List element or data frame column
    virtual std::shared_ptr<ForeignValue> element(size_t index) const = 0;

    bool is_null() const { return kind() == ForeignKind::NULL_VALUE; }
    bool is_raw() const { return kind() == ForeignKind::RAW; }
    bool is_character() const { return kind() == ForeignKind::CHARACTER; }
};

using ForeignValuePtr = std::shared_ptr<ForeignValue>;

/**
 * @brief Call argument: empty name means positional
 */
struct ForeignArgument {
    std::string name;
    ForeignValuePtr value;

    ForeignArgument(std::string name_, ForeignValuePtr value_)
        : name(std::move(name_)), value(std::move(value_)) {}
};

using ForeignArguments = std::vector<ForeignArgument>;

/**
 * @brief An interpreter session
 *
 * Implementations are not thread-safe; RuntimeHandle serializes access.
 */
class ForeignSession {
public:
    virtual ~ForeignSession() = default;

    /**
     * @brief Evaluate a script file into the session
     * @throws ForeignFault If evaluation fails
     */
    virtual void source(const std::string& path) = 0;

    /**
     * @brief Call a function bound in the session
     * @throws ForeignFault If the function is not bound or signals an error
     */
    virtual ForeignValuePtr call(const std::string& function_name,
                                 const ForeignArguments& args) = 0;

    /// Whether a symbol is bound in the session's own scope
    virtual bool has_binding(const std::string& name) const = 0;

    virtual ForeignValuePtr make_null() = 0;
    virtual ForeignValuePtr make_raw(const Bytes& bytes) = 0;
    virtual ForeignValuePtr make_character(const std::vector<std::string>& values) = 0;
    virtual ForeignValuePtr make_list(const std::vector<std::string>& names,
                                      const std::vector<ForeignValuePtr>& values) = 0;

    /**
     * @brief Start intercepting the interpreter's error channel
     *
     * Clears any diagnostics captured by a previous call.
     */
    virtual void arm_error_capture() = 0;

    /// Stop intercepting; must be safe to call on every exit path
    virtual void disarm_error_capture() noexcept = 0;

    /**
     * @brief Diagnostic text for the last fault (error output and traceback)
     *
     * @return Empty string if the interpreter exposes nothing
     */
    virtual std::string collect_diagnostics() = 0;
};

} // namespace rbridge

#endif // RBRIDGE_FOREIGN_SESSION_HPP
