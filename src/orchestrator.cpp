#include "dirmirror/orchestrator.hpp"
#include "dirmirror/chunked_transfer.hpp"
#include "dirmirror/crawler.hpp"
#include "dirmirror/errors.hpp"
#include "dirmirror/listing_parser.hpp"
#include "dirmirror/url.hpp"
#include "dirmirror/whole_file_transfer.hpp"

#include <algorithm>
#include <future>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace dirmirror {

namespace {

constexpr const char* kDefaultFilename = "downloaded_file";

using Clock = std::chrono::steady_clock;

} // namespace

DownloadOrchestrator::DownloadOrchestrator(MirrorOptions options, HttpClient& client, const CancellationToken& cancel)
    : options_(std::move(options)),
      client_(client),
      cancel_(cancel),
      pool_(static_cast<std::size_t>(std::max(1, options_.workers))) {
    if (options_.chunked) {
        strategy_ = std::make_unique<ChunkedTransfer>(client_, pool_, options_.retry, options_.chunk_size, cancel_);
    } else {
        strategy_ = std::make_unique<WholeFileTransfer>(client_, options_.retry, cancel_);
    }
}

DownloadOrchestrator::~DownloadOrchestrator() = default;

MirrorSummary DownloadOrchestrator::run(const std::string& target_folder) {
    const std::string base_url = withoutTrailingSlash(options_.base_url);
    std::string folder = target_folder;
    while (!folder.empty() && folder.front() == '/') {
        folder.erase(0, 1);
    }
    const std::string effective_url = folder.empty() ? base_url : base_url + "/" + folder;

    std::filesystem::create_directories(options_.output_dir);

    // A folder given with a trailing slash is always treated as a directory.
    const bool may_be_file = folder.empty() || folder.back() != '/';
    if (may_be_file && isDirectFile(client_, effective_url)) {
        return downloadSingleFile(effective_url, folder.empty());
    }

    std::string folder_name = percentDecode(lastPathSegment(effective_url));
    if (!isSafePathSegment(folder_name)) {
        folder_name = hostOf(base_url);
    }
    if (!isSafePathSegment(folder_name)) {
        folder_name = "download";
    }
    return mirrorDirectory(withTrailingSlash(effective_url), folder_name);
}

MirrorSummary DownloadOrchestrator::downloadSingleFile(const std::string& url, bool from_base_url) {
    std::string filename = percentDecode(lastPathSegment(url));
    if (from_base_url && filename.find('.') == std::string::npos) {
        filename = kDefaultFilename;
    }
    if (!isSafePathSegment(filename)) {
        filename = kDefaultFilename;
    }

    const auto local_path = options_.output_dir / filename;
    spdlog::info("Direct file download: {} -> {}", url, local_path.string());

    const auto start = Clock::now();
    const auto bytes_before = strategy_->bytesTransferred();

    // Runs on the pool so chunk helping stays within the worker count.
    auto task = pool_.submit([this, &url, &local_path]() { return transferOne(url, local_path); });
    MirrorSummary summary;
    record(task.get(), summary);
    summary.bytes_transferred = strategy_->bytesTransferred() - bytes_before;
    summary.elapsed = Clock::now() - start;
    report(summary);
    return summary;
}

MirrorSummary DownloadOrchestrator::mirrorDirectory(const std::string& start_url, const std::string& folder_name) {
    const auto root = options_.output_dir / folder_name;
    spdlog::info("Starting download from: {}", start_url);
    spdlog::info("Output directory: {}", std::filesystem::absolute(root).string());
    spdlog::info("Max workers: {}", pool_.size());
    spdlog::info("{}", std::string(50, '-'));
    std::filesystem::create_directories(root);

    ListingParser parser(client_);
    Crawler crawler(parser, cancel_);
    const auto files = crawler.walk(start_url);

    MirrorSummary summary;
    if (files.empty()) {
        spdlog::info("No files found to download.");
        return summary;
    }
    spdlog::info("Found {} files to download", files.size());
    spdlog::info("{}", std::string(50, '-'));

    const auto start = Clock::now();
    const auto bytes_before = strategy_->bytesTransferred();

    OutcomeChannel channel;
    std::vector<std::future<void>> tasks;
    tasks.reserve(files.size());
    for (const auto& file : files) {
        tasks.push_back(pool_.submit([this, &channel, url = file.remote_url, local = root / file.relative_path]() {
            TransferOutcome outcome{url, local, false};
            try {
                outcome = transferOne(url, local);
            } catch (const Interrupted&) {
                // The run itself reports the interruption once every task settled.
                spdlog::debug("Transfer of {} interrupted", url);
            }
            channel.push(std::move(outcome));
        }));
    }

    for (std::size_t done = 1; done <= files.size(); ++done) {
        record(channel.pop(), summary);
        spdlog::info("Progress: {}/{} files", done, files.size());
    }
    for (auto& task : tasks) {
        task.wait();
    }
    cancel_.throwIfCancelled();

    summary.bytes_transferred = strategy_->bytesTransferred() - bytes_before;
    summary.elapsed = Clock::now() - start;
    report(summary);
    return summary;
}

TransferOutcome DownloadOrchestrator::transferOne(const std::string& remote_url,
                                                  const std::filesystem::path& local_path) {
    TransferOutcome outcome{remote_url, local_path, false};
    try {
        outcome.succeeded = strategy_->transfer(remote_url, local_path);
    } catch (const Interrupted&) {
        throw;
    } catch (const std::exception& ex) {
        spdlog::error("✗ Error downloading {}: {}", remote_url, ex.what());
    }
    return outcome;
}

void DownloadOrchestrator::record(const TransferOutcome& outcome, MirrorSummary& summary) const {
    if (outcome.succeeded) {
        summary.completed.push_back(outcome.local_path);
    } else {
        summary.failed.push_back(outcome.remote_url);
    }
}

void DownloadOrchestrator::report(const MirrorSummary& summary) const {
    spdlog::info("{}", std::string(50, '='));
    spdlog::info("Download completed in {:.2f} seconds", summary.elapsed.count());
    spdlog::info("Successfully downloaded: {} files", summary.completed.size());
    spdlog::info("Failed downloads: {} files", summary.failed.size());
    spdlog::info("Transferred: {}", formatSize(summary.bytes_transferred));

    if (!summary.failed.empty()) {
        spdlog::info("Failed downloads:");
        for (const auto& url : summary.failed) {
            spdlog::info("  - {}", url);
        }
    }
}

std::string DownloadOrchestrator::formatSize(std::uint64_t bytes) {
    constexpr double KB = 1024.0;
    constexpr double MB = KB * 1024.0;
    constexpr double GB = MB * 1024.0;

    const double value = static_cast<double>(bytes);
    if (bytes >= static_cast<std::uint64_t>(GB)) {
        return fmt::format("{:.1f} GB", value / GB);
    } else if (bytes >= static_cast<std::uint64_t>(MB)) {
        return fmt::format("{:.1f} MB", value / MB);
    } else if (bytes >= static_cast<std::uint64_t>(KB)) {
        return fmt::format("{:.1f} KB", value / KB);
    } else {
        return fmt::format("{} B", bytes);
    }
}

} // namespace dirmirror
