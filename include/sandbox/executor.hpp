#pragma once

#include <chrono>
#include <memory>
#include <string>
#include "common/cancellation.hpp"
#include "grading/language.hpp"
#include "grading/submission.hpp"

namespace codegrade::sandbox {

/**
 * @brief One program to run
 */
struct execution_request {
    const language *lang = nullptr;

    /**
     * @brief Complete program text, either a harness or raw candidate code
     */
    std::string source;

    std::chrono::milliseconds timeout{10000};
};

/**
 * @brief Runs a program in isolation and reports what it observed.
 *
 * A program that ran to completion is always returned as an outcome, even
 * if it exited with non-zero status. Failures to run it at all are thrown.
 */
struct executor {
    virtual ~executor() = default;

    /**
     * @brief Name of the backend, "local" or "remote"
     */
    virtual std::string name() const = 0;

    /**
     * @brief Whether this backend is enabled and able to run lang
     */
    virtual bool supports(const language &lang) const = 0;

    /**
     * @throw language_unsupported if this backend cannot run request.lang
     * @throw timeout_error if the program exceeded request.timeout
     * @throw io_error if the program could not be written to disk
     * @throw sandbox_unavailable if the remote sandbox could not be used
     * @throw malformed_output if the remote sandbox answered with garbage
     * @throw sandbox_busy if the local sandbox is saturated
     * @throw execution_cancelled if cancel was requested
     */
    virtual execution_outcome execute(const execution_request &request, const cancellation_token &cancel) = 0;
};

enum class backend {
    /**
     * @brief local if it supports the language, remote otherwise
     */
    AUTO,
    LOCAL,
    REMOTE
};

/**
 * @brief Parse "auto", "local" or "remote"
 * @throw std::invalid_argument for any other text
 */
backend parse_backend(const std::string &text);

/**
 * @brief Chooses the executor for one language
 */
struct executor_factory {
    /**
     * @param local may be nullptr if local execution is not available at all
     * @param remote may be nullptr if remote execution is not available at all
     */
    executor_factory(std::shared_ptr<executor> local, std::shared_ptr<executor> remote);

    /**
     * @throw language_unsupported if no allowed executor supports lang
     */
    executor &select(const language &lang, backend preference = backend::AUTO) const;

private:
    std::shared_ptr<executor> local;
    std::shared_ptr<executor> remote;
};

}  // namespace codegrade::sandbox
