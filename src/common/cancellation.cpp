#include "common/cancellation.hpp"
#include "common/exceptions.hpp"

namespace codegrade {

void cancellation_token::throw_if_cancelled() const {
    if (cancelled()) throw execution_cancelled();
}

}  // namespace codegrade
