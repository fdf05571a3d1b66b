#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include "common/cancellation.hpp"

namespace codegrade::sandbox {

/**
 * @brief Counting semaphore with a bounded wait queue, writer/reader model.
 * At most `slots` executions run at the same time, at most `max_waiting`
 * callers block for a slot, anyone beyond that is rejected immediately.
 */
struct execution_pool {
    /**
     * @brief A held slot, released when destroyed
     */
    struct lease {
        explicit lease(execution_pool *pool) : pool(pool) {}
        lease(lease &&other) noexcept : pool(other.pool) { other.pool = nullptr; }
        lease(const lease &) = delete;
        lease &operator=(const lease &) = delete;
        lease &operator=(lease &&) = delete;
        ~lease();

    private:
        execution_pool *pool;
    };

    execution_pool(size_t slots, size_t max_waiting);

    /**
     * @brief Take a slot, blocking while the pool is full
     * @throw sandbox_busy if all slots are taken and max_waiting callers already wait
     * @throw execution_cancelled if cancel is requested while waiting
     */
    lease acquire(const cancellation_token &cancel);

    size_t running() const;
    size_t waiting() const;

private:
    void release();

    const size_t slots;
    const size_t max_waiting;
    size_t nrunning = 0;
    size_t nwaiting = 0;
    mutable std::mutex mut;
    std::condition_variable cond;
};

}  // namespace codegrade::sandbox
