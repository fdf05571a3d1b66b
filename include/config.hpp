#pragma once

#include <nlohmann/json.hpp>
#include <filesystem>
#include <string>
#include <vector>

namespace codegrade {

/**
 * @brief Directory that receives generated harness files.
 * Every execution works in a subdirectory named after a fresh uuid and
 * removes it before returning, so the directory stays empty when idle.
 * @defaultValue <system temp>/codegrade
 */
extern std::filesystem::path TEMP_DIR;

/**
 * @brief Default wall-clock limit for one execution, in milliseconds
 */
extern int EXECUTION_TIMEOUT_MS;

/**
 * @brief Time between SIGTERM and SIGKILL when a child must be stopped
 */
extern int KILL_GRACE_PERIOD_MS;

/**
 * @brief RLIMIT_DATA for local interpreters in KB, 0 disables the limit
 */
extern long MEMORY_LIMIT_KB;

/**
 * @brief Maximum number of bytes kept from each of stdout and stderr
 */
extern size_t OUTPUT_LIMIT_BYTES;

/**
 * @brief Number of local sandbox executions allowed to run at the same time
 */
extern size_t MAX_CONCURRENT_EXECUTIONS;

/**
 * @brief Number of callers allowed to wait for a local sandbox slot.
 * The next caller is rejected with sandbox_busy.
 */
extern size_t MAX_QUEUED_EXECUTIONS;

/**
 * @brief Base url of the remote sandbox (piston compatible), without trailing slash
 */
extern std::string REMOTE_SANDBOX_URL;

/**
 * @brief Transport timeout for one remote sandbox request, in milliseconds.
 * The effective timeout is never shorter than the execution timeout plus slack.
 */
extern int REMOTE_TIMEOUT_MS;

/**
 * @brief Whether local interpreters may be used
 */
extern bool ENABLE_LOCAL;

/**
 * @brief Whether the remote sandbox may be used
 */
extern bool ENABLE_REMOTE;

/**
 * @brief Connection settings of the qualitative evaluator
 */
struct evaluator_config {
    std::string url = "https://api.groq.com/openai/v1/chat/completions";
    std::string model = "llama-3.1-8b-instant";
    std::vector<std::string> api_keys;
    double temperature = 0.3;
    int max_tokens = 300;
    int timeout_ms = 30000;
    int cooldown_ms = 60000;
    int max_retries = 3;
};

void from_json(const nlohmann::json &j, evaluator_config &config);

extern evaluator_config EVALUATOR;

/**
 * @brief Whether to run in debug mode.
 * Generated harness sources are logged in debug mode.
 */
extern bool DEBUG;

/**
 * @brief Override the settings above with a JSON configuration file
 * @code{.json}
 * {
 *   "sandbox": {"url": "https://emkc.org/api/v2/piston", "timeout_ms": 20000, "enabled": true},
 *   "local": {"enabled": true, "max_concurrent": 4, "max_queued": 16, "memory_limit_kb": 1048576},
 *   "evaluator": {"model": "llama-3.1-8b-instant", "api_keys": ["..."]}
 * }
 * @endcode
 * @throw std::invalid_argument if a section has an unexpected type
 */
void load_config_file(const std::filesystem::path &path);

/**
 * @brief Read API keys from GROQ_API_KEY, GROQ_API_KEY_2 ... GROQ_API_KEY_10
 */
std::vector<std::string> api_keys_from_env(const std::string &prefix = "GROQ_API_KEY");

}  // namespace codegrade
