/**
 * @file r_session.hpp
 * @brief ForeignSession over the embedded R interpreter
 *
 * R is embedded once per process and started on first use. Each RSession
 * owns a private environment (child of the global environment) into which
 * the support scripts are sourced and in which all calls are evaluated, so
 * several predictors can coexist in one process without sharing bindings.
 *
 * The interpreter itself is global and not thread-safe. Every entry into R
 * takes a process-wide lock, and an armed error capture holds that lock
 * until it is disarmed.
 */

#ifndef RBRIDGE_R_SESSION_HPP
#define RBRIDGE_R_SESSION_HPP

#include "foreign_session.hpp"

#include <memory>
#include <string>

namespace rbridge {

class RSession : public ForeignSession {
public:
    /**
     * @brief Start R if needed and create the session environment
     *
     * @throws ForeignFault If R cannot be started or the environment cannot be created
     */
    RSession();
    ~RSession() override;

    RSession(const RSession&) = delete;
    RSession& operator=(const RSession&) = delete;

    void source(const std::string& path) override;

    ForeignValuePtr call(const std::string& function_name,
                         const ForeignArguments& args) override;

    bool has_binding(const std::string& name) const override;

    ForeignValuePtr make_null() override;
    ForeignValuePtr make_raw(const Bytes& bytes) override;
    ForeignValuePtr make_character(const std::vector<std::string>& values) override;
    ForeignValuePtr make_list(const std::vector<std::string>& names,
                              const std::vector<ForeignValuePtr>& values) override;

    void arm_error_capture() override;
    void disarm_error_capture() noexcept override;

    /**
     * @brief Captured R error output followed by the R traceback
     */
    std::string collect_diagnostics() override;

    /**
     * @brief Start the embedded interpreter (idempotent)
     *
     * Uses R_HOME from the environment, or the R home found at build time.
     */
    static void start_interpreter();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace rbridge

#endif // RBRIDGE_R_SESSION_HPP
