#pragma once

#include <chrono>
#include <filesystem>
#include "sandbox/execution_pool.hpp"
#include "sandbox/executor.hpp"

namespace codegrade::sandbox {

struct local_executor_options {
    /**
     * @brief Parent of the per-execution scratch directories
     */
    std::filesystem::path temp_dir;

    std::chrono::milliseconds kill_grace{500};
    long memory_limit_kb = 0;
    size_t output_limit = 8 << 20;
    bool enabled = true;

    /**
     * @brief Options filled from the global configuration
     */
    static local_executor_options from_config();
};

/**
 * @brief Runs interpreted languages with an interpreter installed on this host.
 *
 * Each execution takes a slot of the pool, writes the program into a fresh
 * directory under temp_dir named after a uuid, runs the interpreter there
 * and removes the directory before returning, whatever the outcome.
 */
struct local_executor : public executor {
    local_executor(std::shared_ptr<execution_pool> pool, local_executor_options options = local_executor_options::from_config());

    std::string name() const override;

    /**
     * @brief Enabled, lang has an interpreter, and the interpreter is found in PATH
     */
    bool supports(const language &lang) const override;

    execution_outcome execute(const execution_request &request, const cancellation_token &cancel) override;

private:
    std::shared_ptr<execution_pool> pool;
    local_executor_options options;
};

}  // namespace codegrade::sandbox
