#pragma once

#include <condition_variable>
#include <deque>
#include <filesystem>
#include <mutex>
#include <string>

namespace dirmirror {

struct TransferOutcome {
    std::string remote_url;
    std::filesystem::path local_path;
    bool succeeded{false};
};

// Funnels outcomes from worker threads to the single collecting thread, in
// the order the transfers finished.
class OutcomeChannel {
public:
    void push(TransferOutcome outcome);

    // Blocks until an outcome is available.
    [[nodiscard]] TransferOutcome pop();

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<TransferOutcome> outcomes_;
};

} // namespace dirmirror
