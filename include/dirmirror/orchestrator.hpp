#pragma once

#include "cancellation.hpp"
#include "http_client.hpp"
#include "options.hpp"
#include "outcome_channel.hpp"
#include "transfer_strategy.hpp"
#include "worker_pool.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace dirmirror {

struct MirrorSummary {
    std::vector<std::filesystem::path> completed;
    std::vector<std::string> failed;
    std::uint64_t bytes_transferred{0};
    std::chrono::duration<double> elapsed{0.0};

    [[nodiscard]] bool allSucceeded() const { return failed.empty(); }
};

class DownloadOrchestrator {
public:
    DownloadOrchestrator(MirrorOptions options, HttpClient& client, const CancellationToken& cancel);
    ~DownloadOrchestrator();

    DownloadOrchestrator(const DownloadOrchestrator&) = delete;
    DownloadOrchestrator& operator=(const DownloadOrchestrator&) = delete;

    // Mirrors `target_folder` (relative to the base URL) or, when it names a
    // file, downloads just that file. Logs the final report before returning.
    // Throws Interrupted once cancelled.
    MirrorSummary run(const std::string& target_folder = "");

    static std::string formatSize(std::uint64_t bytes);

private:
    MirrorSummary downloadSingleFile(const std::string& url, bool from_base_url);
    MirrorSummary mirrorDirectory(const std::string& start_url, const std::string& folder_name);
    [[nodiscard]] TransferOutcome transferOne(const std::string& remote_url, const std::filesystem::path& local_path);
    void record(const TransferOutcome& outcome, MirrorSummary& summary) const;
    void report(const MirrorSummary& summary) const;

    MirrorOptions options_;
    HttpClient& client_;
    const CancellationToken& cancel_;
    TransferStrategyPtr strategy_;
    // Declared after strategy_ so its threads are joined first.
    WorkerPool pool_;
};

} // namespace dirmirror
