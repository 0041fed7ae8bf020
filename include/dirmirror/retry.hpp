#pragma once

#include "cancellation.hpp"
#include "errors.hpp"
#include "options.hpp"

#include <algorithm>
#include <exception>
#include <string>

#include <spdlog/spdlog.h>

namespace dirmirror {

// Runs `attempt(index)` until it returns without throwing or the policy's
// attempts are used up, sleeping delayFor(index) between failures. Returns
// false after the last failed attempt. Interrupted always propagates.
template <typename Attempt>
bool retryWithBackoff(const RetryPolicy& policy, const CancellationToken& cancel, const std::string& label,
                      Attempt&& attempt) {
    const int attempts = std::max(1, policy.max_attempts);
    for (int index = 0; index < attempts; ++index) {
        cancel.throwIfCancelled();
        try {
            attempt(index);
            return true;
        } catch (const Interrupted&) {
            throw;
        } catch (const std::exception& ex) {
            if (index + 1 >= attempts) {
                spdlog::error("✗ Failed to download {} after {} attempts: {}", label, attempts, ex.what());
                break;
            }
            const auto delay = policy.delayFor(index);
            spdlog::warn("⚠ Attempt {}/{} failed for {}: {}", index + 1, attempts, label, ex.what());
            spdlog::warn("  Retrying in {} ms...", delay.count());
            if (!cancel.sleepFor(delay)) {
                throw Interrupted();
            }
        }
    }
    return false;
}

} // namespace dirmirror
