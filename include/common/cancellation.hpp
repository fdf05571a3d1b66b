#pragma once

#include <atomic>
#include <memory>

namespace codegrade {

/**
 * @brief Cancellation flag shared by a caller and an in-flight execution.
 * Copies share the same flag. Executors poll cancelled() while they block
 * on a child process, a network transfer or a sandbox slot.
 */
struct cancellation_token {
    cancellation_token() : flag(std::make_shared<std::atomic<bool>>(false)) {}

    /**
     * @brief Request cancellation. Safe to call from any thread.
     */
    void cancel() const { flag->store(true); }

    bool cancelled() const { return flag->load(); }

    /**
     * @brief @throw execution_cancelled if cancellation was requested
     */
    void throw_if_cancelled() const;

private:
    std::shared_ptr<std::atomic<bool>> flag;
};

}  // namespace codegrade
