#pragma once

#include "cancellation.hpp"
#include "chunk_coordinator.hpp"
#include "http_client.hpp"
#include "options.hpp"
#include "transfer_strategy.hpp"
#include "whole_file_transfer.hpp"
#include "worker_pool.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <string>

namespace dirmirror {

// Splits a file into fixed-size ranges downloaded in parallel on the shared
// pool, then merges them. Servers without byte-range support, or files whose
// size HEAD cannot tell, go through WholeFileTransfer instead.
class ChunkedTransfer final : public TransferStrategy {
public:
    ChunkedTransfer(HttpClient& client, WorkerPool& pool, RetryPolicy retry, std::uint64_t chunk_size,
                    const CancellationToken& cancel);

    [[nodiscard]] bool transfer(const std::string& remote_url, const std::filesystem::path& local_path) override;
    [[nodiscard]] std::uint64_t bytesTransferred() const override;

private:
    HttpClient& client_;
    std::uint64_t chunk_size_;
    std::atomic<std::uint64_t> bytes_transferred_{0};
    WholeFileTransfer fallback_;
    ChunkCoordinator coordinator_;
};

} // namespace dirmirror
