#include "common/exceptions.hpp"
#include <fmt/core.h>
#include <boost/exception/diagnostic_information.hpp>

namespace codegrade {
using namespace std;

const char *error_name(error_code code) {
    switch (code) {
        case error_code::NONE: return "None";
        case error_code::LANGUAGE_UNSUPPORTED: return "LanguageUnsupported";
        case error_code::COMPILE_ERROR: return "CompileError";
        case error_code::TIMEOUT: return "Timeout";
        case error_code::SANDBOX_UNAVAILABLE: return "SandboxUnavailable";
        case error_code::MALFORMED_OUTPUT: return "MalformedOutput";
        case error_code::IO_ERROR: return "IOError";
        case error_code::SANDBOX_BUSY: return "SandboxBusy";
        case error_code::CANCELLED: return "Cancelled";
    }
    return "Unknown";
}

ostream &operator<<(ostream &os, error_code code) {
    return os << error_name(code);
}

grading_exception::grading_exception(error_code code, const string &message)
    : error(code), message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *grading_exception::what() const noexcept {
    return message.c_str();
}

error_code grading_exception::code() const noexcept {
    return error;
}

ostream &operator<<(ostream &os, const grading_exception &ex) {
    os << ex.error << ": " << boost::diagnostic_information(ex) << endl
       << *ex.stacktrace;
    return os;
}

language_unsupported::language_unsupported(const string &language)
    : grading_exception(error_code::LANGUAGE_UNSUPPORTED, fmt::format("Language {} not supported", language)), language(language) {}

language_unsupported::language_unsupported(const string &language, const string &reason)
    : grading_exception(error_code::LANGUAGE_UNSUPPORTED, fmt::format("Language {} not supported: {}", language, reason)), language(language) {}

compile_error::compile_error(int exit_code, const string &stdout_text, const string &stderr_text)
    : grading_exception(error_code::COMPILE_ERROR,
                        stderr_text.empty() ? fmt::format("Code execution failed with exit code {}", exit_code) : stderr_text),
      exit_code(exit_code),
      stdout_text(stdout_text),
      stderr_text(stderr_text) {}

timeout_error::timeout_error(chrono::milliseconds elapsed, chrono::milliseconds limit)
    : grading_exception(error_code::TIMEOUT, fmt::format("Execution timed out after {}ms (limit {}ms)", elapsed.count(), limit.count())),
      elapsed(elapsed),
      limit(limit) {}

sandbox_unavailable::sandbox_unavailable(long status, const string &message)
    : grading_exception(error_code::SANDBOX_UNAVAILABLE,
                        status ? fmt::format("Remote sandbox responded with HTTP {}: {}", status, message)
                               : fmt::format("Remote sandbox unreachable: {}", message)),
      status(status) {}

malformed_output::malformed_output(const string &message, const string &output)
    : grading_exception(error_code::MALFORMED_OUTPUT, message), output(output) {}

io_error::io_error(const string &message)
    : grading_exception(error_code::IO_ERROR, message) {}

sandbox_busy::sandbox_busy(size_t running, size_t waiting)
    : grading_exception(error_code::SANDBOX_BUSY, fmt::format("Local sandbox is busy ({} running, {} waiting)", running, waiting)) {}

execution_cancelled::execution_cancelled()
    : grading_exception(error_code::CANCELLED, "Execution cancelled") {}

network_error::network_error(const string &message)
    : runtime_error(message) {}

}  // namespace codegrade
