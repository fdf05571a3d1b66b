#pragma once

#include <nlohmann/json.hpp>
#include <chrono>
#include <memory>
#include <string>
#include "common/http_client.hpp"
#include "sandbox/executor.hpp"

namespace codegrade::sandbox {

struct remote_executor_options {
    /**
     * @brief Base url of a piston compatible service, without trailing slash
     */
    std::string url;

    /**
     * @brief Transport timeout, raised to the execution timeout plus slack when shorter
     */
    std::chrono::milliseconds timeout{30000};

    bool enabled = true;

    static remote_executor_options from_config();
};

/**
 * @brief Delegates execution to a remote sandbox speaking the piston API.
 *
 * POST <url>/execute
 * @code{.json}
 * {"language": "python", "version": "*", "files": [{"name": "main.py", "content": "..."}]}
 * @endcode
 * answers with
 * @code{.json}
 * {"language": "python", "version": "3.10.0",
 *  "compile": {"stdout": "", "stderr": "", "code": 0, "signal": null},
 *  "run": {"stdout": "...", "stderr": "", "code": 0, "signal": null}}
 * @endcode
 * where "compile" only exists for compiled languages.
 */
struct remote_executor : public executor {
    remote_executor(std::shared_ptr<http_client> client, remote_executor_options options = remote_executor_options::from_config());

    std::string name() const override;

    /**
     * @brief Enabled and lang has a remote id
     */
    bool supports(const language &lang) const override;

    /**
     * @throw language_unsupported before any network call if lang has no remote id
     * @throw sandbox_unavailable on transport failure or non-2xx response
     * @throw malformed_output if the response envelope cannot be parsed
     * @throw timeout_error if the sandbox reports that it killed the program for time
     */
    execution_outcome execute(const execution_request &request, const cancellation_token &cancel) override;

    /**
     * @brief Runtimes installed in the remote sandbox, as returned by GET <url>/runtimes
     * @throw sandbox_unavailable on transport failure or non-2xx response
     * @throw malformed_output if the response is not JSON
     */
    nlohmann::json runtimes(const cancellation_token &cancel = cancellation_token());

private:
    http_response send(http_request request, const cancellation_token &cancel);

    std::shared_ptr<http_client> client;
    remote_executor_options options;
};

}  // namespace codegrade::sandbox
