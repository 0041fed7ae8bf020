#include "dirmirror/chunk_coordinator.hpp"
#include "dirmirror/detail/file_handle.hpp"
#include "dirmirror/errors.hpp"
#include "dirmirror/retry.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <future>
#include <system_error>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace dirmirror {

namespace {

constexpr std::size_t kMergeBufferSize = 64 * 1024;

// Only a 206 is accepted: a 200 would carry the whole file, not this range.
class ChunkSink final : public ResponseSink {
public:
    ChunkSink(std::filesystem::path path, std::atomic<std::uint64_t>& counter)
        : path_(std::move(path)), counter_(counter) {}

    bool onStatus(long status) override {
        if (status != 206) {
            return false;
        }
        file_ = detail::openFile(path_, "wb");
        return true;
    }

    bool onData(const char* data, std::size_t size) override {
        detail::writeAll(file_.get(), data, size, path_);
        written_ += size;
        counter_ += size;
        return true;
    }

    void finish() { detail::closeFile(file_, path_); }

    [[nodiscard]] std::uint64_t written() const { return written_; }

private:
    std::filesystem::path path_;
    std::atomic<std::uint64_t>& counter_;
    detail::FileHandle file_{};
    std::uint64_t written_{0};
};

} // namespace

std::string ChunkRange::header() const {
    return fmt::format("{}-{}", start_byte, end_byte);
}

std::vector<ChunkRange> partitionRanges(std::uint64_t file_size, std::uint64_t chunk_size) {
    std::vector<ChunkRange> ranges;
    if (file_size == 0 || chunk_size == 0) {
        return ranges;
    }

    ranges.reserve(static_cast<std::size_t>((file_size + chunk_size - 1) / chunk_size));
    int index = 0;
    for (std::uint64_t start = 0; start < file_size; start += chunk_size) {
        const std::uint64_t end = std::min(start + chunk_size - 1, file_size - 1);
        ranges.push_back({index++, start, end});
    }
    return ranges;
}

ChunkCoordinator::ChunkCoordinator(HttpClient& client, WorkerPool& pool, RetryPolicy retry,
                                   const CancellationToken& cancel, std::atomic<std::uint64_t>& bytes_transferred)
    : client_(client), pool_(pool), retry_(retry), cancel_(cancel), bytes_transferred_(bytes_transferred) {}

bool ChunkCoordinator::downloadChunks(const std::string& remote_url, const std::vector<ChunkRange>& ranges,
                                      const std::filesystem::path& chunk_dir) {
    std::vector<std::future<bool>> pending;
    pending.reserve(ranges.size());

    for (const auto& range : ranges) {
        if (isChunkComplete(chunk_dir, range)) {
            spdlog::debug("Chunk {} of {} already complete", range.index, remote_url);
            continue;
        }

        auto path = chunkPath(chunk_dir, range.index);
        pending.push_back(pool_.submit(
            [this, remote_url, range, path = std::move(path)]() {
                const auto label = fmt::format("{} [chunk {}]", remote_url, range.index);
                return retryWithBackoff(retry_, cancel_, label,
                                        [&](int) { downloadChunk(remote_url, range, path); });
            },
            TaskPriority::High));
    }
    spdlog::debug("Dispatched {} of {} chunks for {}", pending.size(), ranges.size(), remote_url);

    // Every task must settle before returning: they reference this coordinator.
    pool_.helpUntilReady(pending);

    bool all_complete = true;
    bool interrupted = false;
    for (auto& future : pending) {
        try {
            all_complete = future.get() && all_complete;
        } catch (const Interrupted&) {
            interrupted = true;
            all_complete = false;
        } catch (const std::exception& ex) {
            spdlog::error("Chunk task for {} failed: {}", remote_url, ex.what());
            all_complete = false;
        }
    }
    if (interrupted) {
        throw Interrupted();
    }
    return all_complete;
}

void ChunkCoordinator::downloadChunk(const std::string& remote_url, const ChunkRange& range,
                                     const std::filesystem::path& path) {
    ChunkSink sink(path, bytes_transferred_);
    const long status = client_.get(remote_url, range.header(), sink);
    sink.finish();

    if (status != 206) {
        throw TransferError(fmt::format("HTTP status {} for bytes {}", status, range.header()));
    }
    if (sink.written() != range.length()) {
        throw TransferError(fmt::format("chunk {} incomplete: {} of {} bytes", range.index, sink.written(),
                                        range.length()));
    }
}

void ChunkCoordinator::mergeChunks(std::vector<ChunkRange> ranges, const std::filesystem::path& chunk_dir,
                                   const std::filesystem::path& destination) const {
    std::sort(ranges.begin(), ranges.end(),
              [](const ChunkRange& a, const ChunkRange& b) { return a.index < b.index; });

    auto output = detail::openFile(destination, "wb");
    std::vector<char> buffer(kMergeBufferSize);

    for (const auto& range : ranges) {
        const auto path = chunkPath(chunk_dir, range.index);
        {
            auto input = detail::openFile(path, "rb");
            std::size_t read = 0;
            while ((read = std::fread(buffer.data(), 1, buffer.size(), input.get())) > 0) {
                detail::writeAll(output.get(), buffer.data(), read, destination);
            }
            if (std::ferror(input.get())) {
                throw TransferError(fmt::format("failed to read {}: {}", path.string(), std::strerror(errno)));
            }
        }
        std::filesystem::remove(path);
    }
    detail::closeFile(output, destination);

    std::error_code ec;
    std::filesystem::remove(chunk_dir, ec);
    if (ec) {
        spdlog::warn("Could not remove chunk directory {}: {}", chunk_dir.string(), ec.message());
    }
}

std::filesystem::path ChunkCoordinator::chunkDirectoryFor(const std::filesystem::path& destination) {
    return destination.parent_path() / fmt::format(".{}.chunks", destination.filename().string());
}

std::filesystem::path ChunkCoordinator::chunkPath(const std::filesystem::path& chunk_dir, int index) {
    return chunk_dir / fmt::format("chunk_{:04d}", index);
}

bool ChunkCoordinator::isChunkComplete(const std::filesystem::path& chunk_dir, const ChunkRange& range) {
    std::error_code ec;
    const auto size = std::filesystem::file_size(chunkPath(chunk_dir, range.index), ec);
    return !ec && size == range.length();
}

} // namespace dirmirror
