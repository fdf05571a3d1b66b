#pragma once

#include <boost/lexical_cast.hpp>
#include <boost/stacktrace.hpp>
#include <chrono>
#include <memory>
#include <ostream>
#include <stdexcept>
#include <string>

namespace codegrade {

/**
 * @brief Classifies an execution-level failure
 * Per-test-case runtime errors are not listed here, they are reported
 * inside test_verdict::error and never abort a grading request.
 */
enum class error_code {
    NONE = 0,

    /**
     * @brief The language id has no mapping, or no backend can run it
     */
    LANGUAGE_UNSUPPORTED,

    /**
     * @brief The program exited with non-zero status before reporting results
     */
    COMPILE_ERROR,

    /**
     * @brief The program was killed after exceeding the wall-clock limit
     */
    TIMEOUT,

    /**
     * @brief The remote sandbox could not be reached or answered with non-2xx
     */
    SANDBOX_UNAVAILABLE,

    /**
     * @brief The harness output or the remote envelope could not be parsed
     */
    MALFORMED_OUTPUT,

    /**
     * @brief The harness file could not be written
     */
    IO_ERROR,

    /**
     * @brief The local sandbox pool and its wait queue are full
     */
    SANDBOX_BUSY,

    /**
     * @brief The caller cancelled the request
     */
    CANCELLED
};

/**
 * @brief Stable name used in JSON results, e.g. "Timeout"
 */
const char *error_name(error_code code);

std::ostream &operator<<(std::ostream &os, error_code code);

/**
 * @brief Base of all execution-level failures
 * Captures a stacktrace at the throw site for diagnostics.
 */
struct grading_exception : std::exception {
    grading_exception(error_code code, const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const grading_exception &ex);

    const char *what() const noexcept override;

    error_code code() const noexcept;

private:
    error_code error;
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

struct language_unsupported : public grading_exception {
    explicit language_unsupported(const std::string &language);
    language_unsupported(const std::string &language, const std::string &reason);

    const std::string language;
};

/**
 * @brief Non-zero exit of the program, locally or inside the remote sandbox.
 * The error message is the program's stderr.
 */
struct compile_error : public grading_exception {
    compile_error(int exit_code, const std::string &stdout_text, const std::string &stderr_text);

    const int exit_code;
    const std::string stdout_text;
    const std::string stderr_text;
};

struct timeout_error : public grading_exception {
    timeout_error(std::chrono::milliseconds elapsed, std::chrono::milliseconds limit);

    const std::chrono::milliseconds elapsed;
    const std::chrono::milliseconds limit;
};

/**
 * @brief Transport or provider failure of the remote sandbox
 * @note status is 0 if no HTTP response was received at all
 */
struct sandbox_unavailable : public grading_exception {
    sandbox_unavailable(long status, const std::string &message);

    const long status;
};

struct malformed_output : public grading_exception {
    malformed_output(const std::string &message, const std::string &output);

    const std::string output;
};

struct io_error : public grading_exception {
    explicit io_error(const std::string &message);
};

struct sandbox_busy : public grading_exception {
    sandbox_busy(size_t running, size_t waiting);
};

struct execution_cancelled : public grading_exception {
    execution_cancelled();
};

/**
 * @brief Transport failure of an HTTP request: DNS, connect, TLS or timeout.
 * Not a grading failure by itself, each caller decides what it maps to.
 */
struct network_error : public std::runtime_error {
    explicit network_error(const std::string &message);
};

}  // namespace codegrade
