#include "dirmirror/whole_file_transfer.hpp"
#include "dirmirror/detail/file_handle.hpp"
#include "dirmirror/errors.hpp"
#include "dirmirror/retry.hpp"

#include <optional>
#include <system_error>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace dirmirror {

namespace {

// Opens the destination once the status is known: 206 appends after the
// existing bytes, 200 means the range was ignored and the file starts over.
class ResumeSink final : public ResponseSink {
public:
    ResumeSink(std::filesystem::path path, std::atomic<std::uint64_t>& counter)
        : path_(std::move(path)), counter_(counter) {}

    void onCompleteLength(std::uint64_t length) override { complete_length_ = length; }

    bool onStatus(long status) override {
        if (status == 206) {
            file_ = detail::openFile(path_, "ab");
            appending_ = true;
            return true;
        }
        if (status == 200) {
            file_ = detail::openFile(path_, "wb");
            return true;
        }
        return false;
    }

    bool onData(const char* data, std::size_t size) override {
        detail::writeAll(file_.get(), data, size, path_);
        counter_ += size;
        return true;
    }

    void finish() { detail::closeFile(file_, path_); }

    [[nodiscard]] bool appending() const { return appending_; }
    [[nodiscard]] std::optional<std::uint64_t> completeLength() const { return complete_length_; }

private:
    std::filesystem::path path_;
    std::atomic<std::uint64_t>& counter_;
    detail::FileHandle file_{};
    bool appending_{false};
    std::optional<std::uint64_t> complete_length_;
};

} // namespace

WholeFileTransfer::WholeFileTransfer(HttpClient& client, RetryPolicy retry, const CancellationToken& cancel)
    : client_(client), retry_(retry), cancel_(cancel) {}

bool WholeFileTransfer::transfer(const std::string& remote_url, const std::filesystem::path& local_path) {
    return retryWithBackoff(retry_, cancel_, remote_url,
                            [&](int) { attemptTransfer(remote_url, local_path); });
}

void WholeFileTransfer::attemptTransfer(const std::string& remote_url, const std::filesystem::path& local_path) {
    if (local_path.has_parent_path()) {
        std::filesystem::create_directories(local_path.parent_path());
    }

    std::uint64_t existing_size = 0;
    std::error_code ec;
    if (std::filesystem::exists(local_path, ec)) {
        existing_size = std::filesystem::file_size(local_path, ec);
        if (ec) {
            existing_size = 0;
        }

        try {
            const auto info = client_.head(remote_url);
            const std::uint64_t remote_size = (info.ok() && info.content_length) ? *info.content_length : 0;
            if (remote_size > 0 && existing_size == remote_size) {
                spdlog::info("✓ Skipped (complete): {}", local_path.string());
                return;
            }
            if (existing_size > 0) {
                spdlog::info("⟳ Resuming: {} (from {} bytes)", local_path.string(), existing_size);
            }
        } catch (const Interrupted&) {
            throw;
        } catch (const TransferError& ex) {
            // Without a remote size the range request below decides.
            spdlog::debug("HEAD {} failed: {}", remote_url, ex.what());
        }
    }

    const std::string range = existing_size > 0 ? fmt::format("{}-", existing_size) : std::string{};
    ResumeSink sink(local_path, bytes_transferred_);
    const long status = client_.get(remote_url, range, sink);
    sink.finish();

    if (status == 416) {
        if (sink.completeLength() && *sink.completeLength() == existing_size) {
            spdlog::info("✓ Skipped (complete): {}", local_path.string());
            return;
        }
        // Local copy is longer than the remote file: start over next attempt.
        std::filesystem::remove(local_path, ec);
        throw TransferError(fmt::format("HTTP 416 for bytes {}; discarded local copy", range));
    }
    if (status != 200 && status != 206) {
        throw TransferError(fmt::format("HTTP status {}", status));
    }

    if (sink.appending()) {
        spdlog::info("✓ Resumed: {}", local_path.string());
    } else {
        spdlog::info("✓ Downloaded: {}", local_path.string());
    }
}

} // namespace dirmirror
