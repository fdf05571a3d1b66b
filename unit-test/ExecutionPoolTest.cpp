#include <atomic>
#include <thread>
#include "common/exceptions.hpp"
#include "gtest/gtest.h"
#include "sandbox/execution_pool.hpp"

using namespace std;
using namespace std::chrono;
using namespace codegrade;
using namespace codegrade::sandbox;

TEST(ExecutionPoolTest, AdmitsUpToSlots) {
    execution_pool pool(2, 0);
    cancellation_token cancel;
    {
        auto first = pool.acquire(cancel);
        auto second = pool.acquire(cancel);
        EXPECT_EQ(pool.running(), 2u);
    }
    EXPECT_EQ(pool.running(), 0u);
}

TEST(ExecutionPoolTest, RejectsWhenQueueIsFull) {
    execution_pool pool(1, 0);
    cancellation_token cancel;
    auto slot = pool.acquire(cancel);
    try {
        pool.acquire(cancel);
        FAIL() << "a full pool without wait queue must reject";
    } catch (sandbox_busy &e) {
        EXPECT_EQ(e.code(), codegrade::error_code::SANDBOX_BUSY);
    }
    EXPECT_EQ(pool.running(), 1u);
}

TEST(ExecutionPoolTest, WaiterGetsReleasedSlot) {
    execution_pool pool(1, 1);
    cancellation_token cancel;
    atomic<bool> acquired(false);

    auto slot = make_unique<execution_pool::lease>(pool.acquire(cancel));
    thread waiter([&] {
        auto lease = pool.acquire(cancel);
        acquired = true;
    });

    while (pool.waiting() == 0) this_thread::sleep_for(milliseconds(5));
    EXPECT_FALSE(acquired);
    // the queue holds a single waiter
    EXPECT_THROW(pool.acquire(cancel), sandbox_busy);

    slot.reset();
    waiter.join();
    EXPECT_TRUE(acquired);
    EXPECT_EQ(pool.running(), 0u);
    EXPECT_EQ(pool.waiting(), 0u);
}

TEST(ExecutionPoolTest, WaiterHonoursCancellation) {
    execution_pool pool(1, 1);
    cancellation_token holder, waiter_cancel;
    auto slot = pool.acquire(holder);

    thread canceller([&] {
        this_thread::sleep_for(milliseconds(100));
        waiter_cancel.cancel();
    });
    EXPECT_THROW(pool.acquire(waiter_cancel), execution_cancelled);
    canceller.join();
    EXPECT_EQ(pool.waiting(), 0u);
    EXPECT_EQ(pool.running(), 1u);
}

TEST(ExecutionPoolTest, NeedsOneSlot) {
    EXPECT_THROW(execution_pool(0, 4), invalid_argument);
}
