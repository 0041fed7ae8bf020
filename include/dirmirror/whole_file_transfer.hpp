#pragma once

#include "cancellation.hpp"
#include "http_client.hpp"
#include "options.hpp"
#include "transfer_strategy.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <string>

namespace dirmirror {

// Single-stream download with resume from the local file size.
class WholeFileTransfer final : public TransferStrategy {
public:
    WholeFileTransfer(HttpClient& client, RetryPolicy retry, const CancellationToken& cancel);

    [[nodiscard]] bool transfer(const std::string& remote_url, const std::filesystem::path& local_path) override;
    [[nodiscard]] std::uint64_t bytesTransferred() const override { return bytes_transferred_.load(); }

private:
    void attemptTransfer(const std::string& remote_url, const std::filesystem::path& local_path);

    HttpClient& client_;
    RetryPolicy retry_;
    const CancellationToken& cancel_;
    std::atomic<std::uint64_t> bytes_transferred_{0};
};

} // namespace dirmirror
