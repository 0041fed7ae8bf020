#include "dirmirror/chunked_transfer.hpp"
#include "dirmirror/errors.hpp"

#include <algorithm>
#include <system_error>

#include <spdlog/spdlog.h>

namespace dirmirror {

ChunkedTransfer::ChunkedTransfer(HttpClient& client, WorkerPool& pool, RetryPolicy retry, std::uint64_t chunk_size,
                                 const CancellationToken& cancel)
    : client_(client),
      chunk_size_(std::max<std::uint64_t>(1, chunk_size)),
      fallback_(client, retry, cancel),
      coordinator_(client, pool, retry, cancel, bytes_transferred_) {}

std::uint64_t ChunkedTransfer::bytesTransferred() const {
    return bytes_transferred_.load() + fallback_.bytesTransferred();
}

bool ChunkedTransfer::transfer(const std::string& remote_url, const std::filesystem::path& local_path) {
    ResourceInfo info;
    try {
        info = client_.head(remote_url);
    } catch (const Interrupted&) {
        throw;
    } catch (const TransferError& ex) {
        spdlog::debug("HEAD {} failed ({}), using a single stream", remote_url, ex.what());
        return fallback_.transfer(remote_url, local_path);
    }

    if (!info.ok() || !info.accepts_ranges || !info.content_length || *info.content_length == 0) {
        spdlog::debug("{} does not support ranged transfers, using a single stream", remote_url);
        return fallback_.transfer(remote_url, local_path);
    }

    const std::uint64_t file_size = *info.content_length;
    std::error_code ec;
    const auto existing_size = std::filesystem::file_size(local_path, ec);
    if (!ec && existing_size == file_size) {
        spdlog::info("✓ Skipped (complete): {}", local_path.string());
        return true;
    }

    const auto ranges = partitionRanges(file_size, chunk_size_);
    const auto chunk_dir = ChunkCoordinator::chunkDirectoryFor(local_path);

    // Chunk files are kept on every failure path so a later run can resume.
    try {
        std::filesystem::create_directories(chunk_dir);
        if (!coordinator_.downloadChunks(remote_url, ranges, chunk_dir)) {
            spdlog::error("✗ Failed to download {}: chunks kept in {}", remote_url, chunk_dir.string());
            return false;
        }
        coordinator_.mergeChunks(ranges, chunk_dir, local_path);
    } catch (const Interrupted&) {
        throw;
    } catch (const std::exception& ex) {
        spdlog::error("✗ Chunked transfer of {} failed: {}", remote_url, ex.what());
        return false;
    }

    const auto final_size = std::filesystem::file_size(local_path, ec);
    if (ec || final_size != file_size) {
        spdlog::error("✗ Size mismatch for {}: expected {} bytes, got {}", local_path.string(), file_size,
                      ec ? 0 : final_size);
        return false;
    }

    spdlog::info("✓ Downloaded ({} chunks): {}", ranges.size(), local_path.string());
    return true;
}

} // namespace dirmirror
