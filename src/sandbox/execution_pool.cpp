#include "sandbox/execution_pool.hpp"
#include <glog/logging.h>
#include <stdexcept>
#include "common/exceptions.hpp"

namespace codegrade::sandbox {
using namespace std;

// waiters wake up this often to notice cancellation
static constexpr chrono::milliseconds CANCEL_POLL_INTERVAL(50);

execution_pool::lease::~lease() {
    if (pool) pool->release();
}

execution_pool::execution_pool(size_t slots, size_t max_waiting)
    : slots(slots), max_waiting(max_waiting) {
    if (slots == 0) throw invalid_argument("execution pool needs at least one slot");
}

execution_pool::lease execution_pool::acquire(const cancellation_token &cancel) {
    unique_lock<mutex> mlock(mut);
    if (nrunning >= slots) {
        if (nwaiting >= max_waiting) {
            LOG(WARNING) << "Rejecting execution, " << nrunning << " running and " << nwaiting << " waiting";
            throw sandbox_busy(nrunning, nwaiting);
        }

        ++nwaiting;
        while (nrunning >= slots && !cancel.cancelled())
            cond.wait_for(mlock, CANCEL_POLL_INTERVAL);
        --nwaiting;
    }
    if (cancel.cancelled()) {
        mlock.unlock();
        // hand a wakeup this waiter may have consumed to the next one
        cond.notify_one();
        throw execution_cancelled();
    }
    ++nrunning;
    return lease(this);
}

void execution_pool::release() {
    unique_lock<mutex> mlock(mut);
    --nrunning;
    mlock.unlock();
    cond.notify_one();
}

size_t execution_pool::running() const {
    unique_lock<mutex> mlock(mut);
    return nrunning;
}

size_t execution_pool::waiting() const {
    unique_lock<mutex> mlock(mut);
    return nwaiting;
}

}  // namespace codegrade::sandbox
