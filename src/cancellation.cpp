#include "dirmirror/cancellation.hpp"
#include "dirmirror/errors.hpp"

#include <algorithm>
#include <thread>

namespace dirmirror {

void CancellationToken::throwIfCancelled() const {
    if (isCancelled()) {
        throw Interrupted();
    }
}

bool CancellationToken::sleepFor(std::chrono::milliseconds duration) const {
    constexpr std::chrono::milliseconds slice{100};

    const auto deadline = std::chrono::steady_clock::now() + duration;
    while (!isCancelled()) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return true;
        }
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(remaining, slice));
    }
    return false;
}

} // namespace dirmirror
