#include "dirmirror/outcome_channel.hpp"

#include <utility>

namespace dirmirror {

void OutcomeChannel::push(TransferOutcome outcome) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        outcomes_.push_back(std::move(outcome));
    }
    cv_.notify_one();
}

TransferOutcome OutcomeChannel::pop() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this]() { return !outcomes_.empty(); });
    auto outcome = std::move(outcomes_.front());
    outcomes_.pop_front();
    return outcome;
}

} // namespace dirmirror
