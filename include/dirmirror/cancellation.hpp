#pragma once

#include <atomic>
#include <chrono>

namespace dirmirror {

class CancellationToken {
public:
    // Safe to call from a signal handler.
    void cancel() noexcept { cancelled_.store(true); }

    [[nodiscard]] bool isCancelled() const noexcept { return cancelled_.load(); }

    void throwIfCancelled() const;

    // Sleeps for `duration` unless cancelled first. Returns false on cancellation.
    bool sleepFor(std::chrono::milliseconds duration) const;

private:
    std::atomic<bool> cancelled_{false};
};

} // namespace dirmirror
