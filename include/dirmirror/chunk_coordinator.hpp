#pragma once

#include "cancellation.hpp"
#include "http_client.hpp"
#include "options.hpp"
#include "worker_pool.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace dirmirror {

struct ChunkRange {
    int index{0};
    std::uint64_t start_byte{0};
    std::uint64_t end_byte{0}; // inclusive

    [[nodiscard]] std::uint64_t length() const { return end_byte - start_byte + 1; }
    [[nodiscard]] std::string header() const;
};

// ceil(file_size / chunk_size) contiguous ranges covering [0, file_size).
// Empty when either argument is zero.
[[nodiscard]] std::vector<ChunkRange> partitionRanges(std::uint64_t file_size, std::uint64_t chunk_size);

class ChunkCoordinator {
public:
    ChunkCoordinator(HttpClient& client, WorkerPool& pool, RetryPolicy retry, const CancellationToken& cancel,
                     std::atomic<std::uint64_t>& bytes_transferred);

    // Downloads every range whose chunk file is missing or has the wrong size.
    // Returns false when any chunk exhausted its retries; completed chunks stay
    // on disk either way.
    [[nodiscard]] bool downloadChunks(const std::string& remote_url, const std::vector<ChunkRange>& ranges,
                                      const std::filesystem::path& chunk_dir);

    // Appends the chunks into `destination` (truncated first) in ascending index
    // order, deleting each chunk once appended, then removes `chunk_dir`.
    void mergeChunks(std::vector<ChunkRange> ranges, const std::filesystem::path& chunk_dir,
                     const std::filesystem::path& destination) const;

    // "<dir>/.<filename>.chunks"
    [[nodiscard]] static std::filesystem::path chunkDirectoryFor(const std::filesystem::path& destination);
    // "<chunk_dir>/chunk_0007"
    [[nodiscard]] static std::filesystem::path chunkPath(const std::filesystem::path& chunk_dir, int index);
    [[nodiscard]] static bool isChunkComplete(const std::filesystem::path& chunk_dir, const ChunkRange& range);

private:
    void downloadChunk(const std::string& remote_url, const ChunkRange& range,
                       const std::filesystem::path& path);

    HttpClient& client_;
    WorkerPool& pool_;
    RetryPolicy retry_;
    const CancellationToken& cancel_;
    std::atomic<std::uint64_t>& bytes_transferred_;
};

} // namespace dirmirror
