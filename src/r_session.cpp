#include "r_session.hpp"
#include "errors.hpp"

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <stdexcept>

#define R_NO_REMAP
#include <Rinternals.h>
#include <Rembedded.h>
#include <R_ext/Parse.h>

#define CSTACK_DEFNS
#define R_INTERFACE_PTRS
#include <Rinterface.h>

namespace rbridge {

namespace {

constexpr const char* kTracebackExpression =
    "paste(unlist(lapply(.traceback(), paste, collapse = \"\\n\")), collapse = \"\\n\")";

std::recursive_mutex& interpreter_mutex() {
    static std::recursive_mutex mutex;
    return mutex;
}

using InterpreterLock = std::unique_lock<std::recursive_mutex>;

std::once_flag g_start_flag;

// Target of the console hook while an error capture is armed
std::string* g_capture_target = nullptr;

void capture_console(const char* buf, int len, int otype) {
    if (otype != 0 && g_capture_target != nullptr) {
        g_capture_target->append(buf, static_cast<size_t>(len));
        return;
    }
    std::fwrite(buf, 1, static_cast<size_t>(len), otype == 0 ? stdout : stderr);
}

std::string trim(const std::string& text) {
    const char* whitespace = " \t\r\n";
    size_t begin = text.find_first_not_of(whitespace);
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(whitespace);
    return text.substr(begin, end - begin + 1);
}

std::string current_error_message() {
    const char* buffer = R_curErrorBuf();
    return trim(buffer != nullptr ? buffer : "");
}

ForeignKind classify(SEXP x) {
    if (x == R_NilValue) {
        return ForeignKind::NULL_VALUE;
    }
    if (Rf_isFactor(x)) {
        return ForeignKind::FACTOR;
    }
    if (Rf_inherits(x, "data.frame")) {
        return ForeignKind::DATA_FRAME;
    }
    // Matrices keep their atomic TYPEOF but are not flat columns
    if (Rf_isVectorAtomic(x) && Rf_getAttrib(x, R_DimSymbol) != R_NilValue) {
        return ForeignKind::MATRIX;
    }
    switch (TYPEOF(x)) {
        case RAWSXP: return ForeignKind::RAW;
        case STRSXP: return ForeignKind::CHARACTER;
        case LGLSXP: return ForeignKind::LOGICAL;
        case INTSXP: return ForeignKind::INTEGER;
        case REALSXP: return ForeignKind::DOUBLE;
        case VECSXP: return ForeignKind::LIST;
        default: return ForeignKind::OTHER;
    }
}

/**
 * @brief Parse @p code and evaluate every expression in @p env
 *
 * @return Value of the last expression, unprotected
 * @throws ForeignFault On parse or evaluation error
 */
SEXP parse_and_eval(const std::string& code, SEXP env) {
    ParseStatus status;
    SEXP text = PROTECT(Rf_mkString(code.c_str()));
    SEXP parsed = PROTECT(R_ParseVector(text, -1, &status, R_NilValue));
    if (status != PARSE_OK) {
        UNPROTECT(2);
        throw ForeignFault("Failed to parse R expression: " + code);
    }

    SEXP result = R_NilValue;
    for (R_xlen_t i = 0; i < Rf_xlength(parsed); ++i) {
        int error_occurred = 0;
        result = R_tryEval(VECTOR_ELT(parsed, i), env, &error_occurred);
        if (error_occurred) {
            UNPROTECT(2);
            throw ForeignFault(current_error_message());
        }
    }

    UNPROTECT(2);
    return result;
}

/**
 * @brief R object kept alive for as long as the handle exists
 */
class RValue : public ForeignValue {
public:
    explicit RValue(SEXP value) : value_(value) {
        InterpreterLock lock(interpreter_mutex());
        R_PreserveObject(value_);
        kind_ = classify(value_);
    }

    ~RValue() override {
        InterpreterLock lock(interpreter_mutex());
        R_ReleaseObject(value_);
    }

    RValue(const RValue&) = delete;
    RValue& operator=(const RValue&) = delete;

    SEXP sexp() const { return value_; }

    ForeignKind kind() const override { return kind_; }

    std::string type_name() const override {
        InterpreterLock lock(interpreter_mutex());
        SEXP klass = Rf_getAttrib(value_, R_ClassSymbol);
        if (TYPEOF(klass) == STRSXP && Rf_xlength(klass) > 0) {
            return Rf_translateCharUTF8(STRING_ELT(klass, 0));
        }
        if (kind_ != ForeignKind::OTHER) {
            return kind_to_string(kind_);
        }
        return Rf_type2char(TYPEOF(value_));
    }

    size_t length() const override {
        InterpreterLock lock(interpreter_mutex());
        return static_cast<size_t>(Rf_xlength(value_));
    }

    Bytes raw() const override {
        require(RAWSXP, "raw");
        InterpreterLock lock(interpreter_mutex());
        const R_xlen_t size = Rf_xlength(value_);
        Bytes bytes(static_cast<size_t>(size));
        if (size > 0) {
            std::memcpy(bytes.data(), RAW(value_), static_cast<size_t>(size));
        }
        return bytes;
    }

    std::vector<std::optional<std::string>> strings() const override {
        InterpreterLock lock(interpreter_mutex());
        const R_xlen_t size = Rf_xlength(value_);
        std::vector<std::optional<std::string>> result;
        result.reserve(static_cast<size_t>(size));

        if (kind_ == ForeignKind::FACTOR) {
            SEXP levels = Rf_getAttrib(value_, R_LevelsSymbol);
            const R_xlen_t level_count = Rf_xlength(levels);
            const int* codes = INTEGER(value_);
            for (R_xlen_t i = 0; i < size; ++i) {
                if (codes[i] == NA_INTEGER || codes[i] < 1 || codes[i] > level_count) {
                    result.emplace_back(std::nullopt);
                } else {
                    result.emplace_back(Rf_translateCharUTF8(STRING_ELT(levels, codes[i] - 1)));
                }
            }
            return result;
        }

        if (TYPEOF(value_) != STRSXP) {
            throw UnsupportedValueType("R " + type_name() + " is not a character vector");
        }
        for (R_xlen_t i = 0; i < size; ++i) {
            SEXP element = STRING_ELT(value_, i);
            if (element == NA_STRING) {
                result.emplace_back(std::nullopt);
            } else {
                result.emplace_back(Rf_translateCharUTF8(element));
            }
        }
        return result;
    }

    std::vector<std::optional<double>> doubles() const override {
        require(REALSXP, "numeric");
        InterpreterLock lock(interpreter_mutex());
        const R_xlen_t size = Rf_xlength(value_);
        const double* data = REAL(value_);
        std::vector<std::optional<double>> result;
        result.reserve(static_cast<size_t>(size));
        for (R_xlen_t i = 0; i < size; ++i) {
            if (ISNA(data[i])) {
                result.emplace_back(std::nullopt);
            } else {
                result.emplace_back(data[i]);
            }
        }
        return result;
    }

    std::vector<std::optional<int32_t>> integers() const override {
        require(INTSXP, "integer");
        InterpreterLock lock(interpreter_mutex());
        const R_xlen_t size = Rf_xlength(value_);
        const int* data = INTEGER(value_);
        std::vector<std::optional<int32_t>> result;
        result.reserve(static_cast<size_t>(size));
        for (R_xlen_t i = 0; i < size; ++i) {
            if (data[i] == NA_INTEGER) {
                result.emplace_back(std::nullopt);
            } else {
                result.emplace_back(static_cast<int32_t>(data[i]));
            }
        }
        return result;
    }

    std::vector<std::optional<bool>> logicals() const override {
        require(LGLSXP, "logical");
        InterpreterLock lock(interpreter_mutex());
        const R_xlen_t size = Rf_xlength(value_);
        const int* data = LOGICAL(value_);
        std::vector<std::optional<bool>> result;
        result.reserve(static_cast<size_t>(size));
        for (R_xlen_t i = 0; i < size; ++i) {
            if (data[i] == NA_LOGICAL) {
                result.emplace_back(std::nullopt);
            } else {
                result.emplace_back(data[i] != 0);
            }
        }
        return result;
    }

    std::vector<std::string> names() const override {
        InterpreterLock lock(interpreter_mutex());
        SEXP names = Rf_getAttrib(value_, R_NamesSymbol);
        std::vector<std::string> result;
        if (names == R_NilValue) {
            return result;
        }
        const R_xlen_t size = Rf_xlength(names);
        result.reserve(static_cast<size_t>(size));
        for (R_xlen_t i = 0; i < size; ++i) {
            SEXP element = STRING_ELT(names, i);
            result.emplace_back(element == NA_STRING ? "" : Rf_translateCharUTF8(element));
        }
        return result;
    }

    std::shared_ptr<ForeignValue> element(size_t index) const override {
        require(VECSXP, "list");
        InterpreterLock lock(interpreter_mutex());
        if (index >= static_cast<size_t>(Rf_xlength(value_))) {
            throw std::out_of_range("R list index " + std::to_string(index) + " out of range");
        }
        return std::make_shared<RValue>(VECTOR_ELT(value_, static_cast<R_xlen_t>(index)));
    }

private:
    SEXP value_;
    ForeignKind kind_;

    void require(SEXPTYPE type, const char* expected) const {
        if (TYPEOF(value_) != type) {
            throw UnsupportedValueType("R " + type_name() + " is not a " + expected + " vector");
        }
    }
};

/// Wrap a fresh (unprotected) R object
ForeignValuePtr wrap(SEXP value) {
    PROTECT(value);
    auto handle = std::make_shared<RValue>(value);
    UNPROTECT(1);
    return handle;
}

SEXP unwrap(const ForeignValuePtr& value) {
    if (!value) {
        return R_NilValue;
    }
    auto r_value = std::dynamic_pointer_cast<RValue>(value);
    if (!r_value) {
        throw std::invalid_argument("Value was not created by an R session");
    }
    return r_value->sexp();
}

} // namespace

// ============================================================================
// RSession
// ============================================================================

struct RSession::Impl {
    SEXP env = R_NilValue;

    bool armed = false;
    InterpreterLock capture_lock;
    std::string captured;

    FILE* saved_output_file = nullptr;
    FILE* saved_console_file = nullptr;
    void (*saved_write_console)(const char*, int) = nullptr;
    void (*saved_write_console_ex)(const char*, int, int) = nullptr;
};

void RSession::start_interpreter() {
    std::call_once(g_start_flag, []() {
#ifdef RBRIDGE_R_HOME
        setenv("R_HOME", RBRIDGE_R_HOME, 0);
#endif
        const char* r_home = std::getenv("R_HOME");
        if (r_home == nullptr || *r_home == '\0') {
            throw ForeignFault("R_HOME is not set; cannot start the R interpreter");
        }

        const char* argv[] = {"rbridge", "--silent", "--no-save", "--no-restore", "--vanilla"};
        int argc = static_cast<int>(sizeof(argv) / sizeof(argv[0]));

        Rf_initialize_R(argc, const_cast<char**>(argv));
        R_CStackLimit = static_cast<uintptr_t>(-1);
        R_Interactive = FALSE;
        setup_Rmainloop();
    });
}

RSession::RSession() : impl_(std::make_unique<Impl>()) {
    start_interpreter();

    InterpreterLock lock(interpreter_mutex());
    SEXP env = parse_and_eval("new.env(parent = globalenv())", R_GlobalEnv);
    R_PreserveObject(env);
    impl_->env = env;
}

RSession::~RSession() {
    disarm_error_capture();

    InterpreterLock lock(interpreter_mutex());
    R_ReleaseObject(impl_->env);
}

void RSession::source(const std::string& path) {
    InterpreterLock lock(interpreter_mutex());

    SEXP file = PROTECT(Rf_mkString(path.c_str()));
    SEXP call = PROTECT(Rf_lang3(Rf_install("source"), file, impl_->env));
    SET_TAG(CDR(call), Rf_install("file"));
    SET_TAG(CDDR(call), Rf_install("local"));

    int error_occurred = 0;
    R_tryEval(call, impl_->env, &error_occurred);
    UNPROTECT(2);

    if (error_occurred) {
        throw ForeignFault(current_error_message());
    }
}

ForeignValuePtr RSession::call(const std::string& function_name, const ForeignArguments& args) {
    InterpreterLock lock(interpreter_mutex());

    SEXP call = PROTECT(Rf_allocVector(LANGSXP, static_cast<R_xlen_t>(args.size() + 1)));
    SETCAR(call, Rf_install(function_name.c_str()));

    SEXP node = CDR(call);
    for (const auto& arg : args) {
        SETCAR(node, unwrap(arg.value));
        if (!arg.name.empty()) {
            SET_TAG(node, Rf_install(arg.name.c_str()));
        }
        node = CDR(node);
    }

    int error_occurred = 0;
    SEXP result = R_tryEval(call, impl_->env, &error_occurred);
    if (error_occurred) {
        UNPROTECT(1);
        throw ForeignFault(current_error_message());
    }

    PROTECT(result);
    auto handle = std::make_shared<RValue>(result);
    UNPROTECT(2);
    return handle;
}

bool RSession::has_binding(const std::string& name) const {
    InterpreterLock lock(interpreter_mutex());
    return R_existsVarInFrame(impl_->env, Rf_install(name.c_str()));
}

ForeignValuePtr RSession::make_null() {
    InterpreterLock lock(interpreter_mutex());
    return std::make_shared<RValue>(R_NilValue);
}

ForeignValuePtr RSession::make_raw(const Bytes& bytes) {
    InterpreterLock lock(interpreter_mutex());
    SEXP value = Rf_allocVector(RAWSXP, static_cast<R_xlen_t>(bytes.size()));
    if (!bytes.empty()) {
        std::memcpy(RAW(value), bytes.data(), bytes.size());
    }
    return wrap(value);
}

ForeignValuePtr RSession::make_character(const std::vector<std::string>& values) {
    InterpreterLock lock(interpreter_mutex());
    SEXP value = PROTECT(Rf_allocVector(STRSXP, static_cast<R_xlen_t>(values.size())));
    for (size_t i = 0; i < values.size(); ++i) {
        SET_STRING_ELT(value, static_cast<R_xlen_t>(i),
                       Rf_mkCharLenCE(values[i].data(), static_cast<int>(values[i].size()), CE_UTF8));
    }
    auto handle = std::make_shared<RValue>(value);
    UNPROTECT(1);
    return handle;
}

ForeignValuePtr RSession::make_list(const std::vector<std::string>& names,
                                    const std::vector<ForeignValuePtr>& values) {
    if (names.size() != values.size()) {
        throw std::invalid_argument("make_list: names and values differ in length");
    }

    InterpreterLock lock(interpreter_mutex());
    const R_xlen_t size = static_cast<R_xlen_t>(values.size());
    SEXP list = PROTECT(Rf_allocVector(VECSXP, size));
    SEXP list_names = PROTECT(Rf_allocVector(STRSXP, size));
    for (R_xlen_t i = 0; i < size; ++i) {
        const std::string& name = names[static_cast<size_t>(i)];
        SET_VECTOR_ELT(list, i, unwrap(values[static_cast<size_t>(i)]));
        SET_STRING_ELT(list_names, i,
                       Rf_mkCharLenCE(name.data(), static_cast<int>(name.size()), CE_UTF8));
    }
    Rf_setAttrib(list, R_NamesSymbol, list_names);

    auto handle = std::make_shared<RValue>(list);
    UNPROTECT(2);
    return handle;
}

void RSession::arm_error_capture() {
    InterpreterLock lock(interpreter_mutex());

    impl_->captured.clear();
    if (impl_->armed) {
        return;
    }

    impl_->saved_output_file = R_Outputfile;
    impl_->saved_console_file = R_Consolefile;
    impl_->saved_write_console = ptr_R_WriteConsole;
    impl_->saved_write_console_ex = ptr_R_WriteConsoleEx;

    R_Outputfile = nullptr;
    R_Consolefile = nullptr;
    ptr_R_WriteConsole = nullptr;
    ptr_R_WriteConsoleEx = capture_console;
    g_capture_target = &impl_->captured;

    // Held until disarm so no other session runs R while the hook points here
    impl_->capture_lock = std::move(lock);
    impl_->armed = true;
}

void RSession::disarm_error_capture() noexcept {
    if (!impl_ || !impl_->armed) {
        return;
    }

    R_Outputfile = impl_->saved_output_file;
    R_Consolefile = impl_->saved_console_file;
    ptr_R_WriteConsole = impl_->saved_write_console;
    ptr_R_WriteConsoleEx = impl_->saved_write_console_ex;
    g_capture_target = nullptr;

    impl_->armed = false;
    impl_->capture_lock.unlock();
}

std::string RSession::collect_diagnostics() {
    InterpreterLock lock(interpreter_mutex());

    std::string error_output = trim(impl_->captured);
    const std::string error_message = current_error_message();
    if (!error_message.empty()) {
        size_t position = error_output.find(error_message);
        if (position != std::string::npos) {
            error_output.erase(position, error_message.size());
            error_output = trim(error_output);
        }
    }

    SEXP traceback = PROTECT(parse_and_eval(kTracebackExpression, R_GlobalEnv));
    std::string traceback_text;
    if (TYPEOF(traceback) == STRSXP && Rf_xlength(traceback) > 0 &&
        STRING_ELT(traceback, 0) != NA_STRING) {
        traceback_text = trim(Rf_translateCharUTF8(STRING_ELT(traceback, 0)));
    }
    UNPROTECT(1);

    if (error_output.empty()) {
        return traceback_text;
    }
    if (traceback_text.empty()) {
        return error_output;
    }
    return error_output + "\n" + traceback_text;
}

} // namespace rbridge
