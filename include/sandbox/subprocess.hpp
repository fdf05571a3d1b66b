#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>
#include "common/cancellation.hpp"

namespace codegrade::sandbox {

/**
 * @brief Resource limits applied to the child with setrlimit before exec
 * A value of 0 leaves the corresponding limit untouched.
 */
struct process_limits {
    /**
     * @brief RLIMIT_DATA in KB
     */
    long memory_kb = 0;

    /**
     * @brief RLIMIT_CPU in seconds, a backstop for the wall-clock deadline
     */
    long cpu_seconds = 0;

    /**
     * @brief RLIMIT_FSIZE in bytes
     */
    long file_size_bytes = 16 << 20;

    /**
     * @brief RLIMIT_NOFILE
     */
    long open_files = 256;
};

struct process_options {
    std::filesystem::path working_directory;

    /**
     * @brief Wall-clock limit, the whole process group is stopped when exceeded
     */
    std::chrono::milliseconds timeout{10000};

    /**
     * @brief Time between SIGTERM and SIGKILL
     */
    std::chrono::milliseconds kill_grace{500};

    /**
     * @brief Bytes kept from each of stdout and stderr, the rest is drained and dropped
     */
    size_t output_limit = 8 << 20;

    process_limits limits;
};

struct process_result {
    /**
     * @brief exit status, or -signal if the child died from a signal
     */
    int exit_code = 0;

    /**
     * @brief true if the child called exit, false if a signal ended it
     */
    bool exited = false;

    /**
     * @brief we stopped the child because the deadline passed
     */
    bool timed_out = false;

    /**
     * @brief we stopped the child because the token was cancelled
     */
    bool cancelled = false;

    /**
     * @brief stdout or stderr exceeded output_limit and was cut
     */
    bool truncated = false;

    std::string stdout_text;
    std::string stderr_text;
    std::chrono::milliseconds elapsed{0};
};

/**
 * @brief Run argv[0] (searched in PATH) in a new process group and capture its output.
 *
 * The child gets /dev/null as stdin, the given rlimits and a core size of 0.
 * When the deadline passes or cancel is requested, the whole group receives
 * SIGTERM, then SIGKILL after kill_grace. This call returns no later than
 * timeout + kill_grace plus scheduling slack, even if the child ignores SIGTERM.
 *
 * If exec fails, the child writes the reason to stderr and exits with 127.
 *
 * @throw std::system_error if pipes cannot be created or fork fails
 * @throw std::invalid_argument if argv is empty
 */
process_result run_process(const std::vector<std::string> &argv, const process_options &options, const cancellation_token &cancel);

}  // namespace codegrade::sandbox
