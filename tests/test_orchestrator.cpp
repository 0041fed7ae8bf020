#include "dirmirror/errors.hpp"
#include "dirmirror/orchestrator.hpp"

#include "fake_http_client.hpp"
#include "test_support.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace dirmirror;
using dirmirror::test::FakeHttpClient;
using dirmirror::test::nginxListing;
using dirmirror::test::patternBody;
using dirmirror::test::readFile;
using ::testing::ElementsAre;
using ::testing::IsEmpty;
using ::testing::UnorderedElementsAre;

namespace {

class OrchestratorTest : public ::testing::Test {
protected:
    MirrorOptions options(const std::string& base_url, bool chunked = false) const {
        MirrorOptions opts;
        opts.base_url = base_url;
        opts.output_dir = out_.path();
        opts.workers = 4;
        opts.retry = RetryPolicy{5, std::chrono::milliseconds(0)};
        opts.chunked = chunked;
        opts.chunk_size = 1000;
        return opts;
    }

    static std::vector<std::string> generic(const std::vector<std::filesystem::path>& paths) {
        std::vector<std::string> out;
        for (const auto& path : paths) {
            out.push_back(path.generic_string());
        }
        return out;
    }

    FakeHttpClient client_;
    CancellationToken cancel_;
    test::TempDir out_;
};

} // namespace

TEST_F(OrchestratorTest, MirrorsTreeUnderDerivedFolder) {
    client_.addListing("http://h/root/", nginxListing("/root/", {"a.txt", "sub/"}));
    client_.addListing("http://h/root/sub/", nginxListing("/root/sub/", {"b.txt"}));
    client_.addFile("http://h/root/a.txt", "alpha");
    client_.addFile("http://h/root/sub/b.txt", "beta");

    DownloadOrchestrator orchestrator(options("http://h"), client_, cancel_);
    const auto summary = orchestrator.run("root/");

    const auto root = out_.path() / "root";
    EXPECT_THAT(generic(summary.completed),
                UnorderedElementsAre((root / "a.txt").generic_string(), (root / "sub" / "b.txt").generic_string()));
    EXPECT_THAT(summary.failed, IsEmpty());
    EXPECT_TRUE(summary.allSucceeded());
    EXPECT_EQ(readFile(root / "sub" / "b.txt"), "beta");
    EXPECT_EQ(summary.bytes_transferred, 9u);
}

TEST_F(OrchestratorTest, BaseUrlWithoutFolderUsesLastSegment) {
    client_.addListing("http://h/pub/data/", nginxListing("/pub/data/", {"x.bin"}));
    client_.addFile("http://h/pub/data/x.bin", "x");

    DownloadOrchestrator orchestrator(options("http://h/pub/data/"), client_, cancel_);
    const auto summary = orchestrator.run();

    EXPECT_THAT(generic(summary.completed), ElementsAre((out_.path() / "data" / "x.bin").generic_string()));
}

TEST_F(OrchestratorTest, HostNamesFolderForServerRoot) {
    client_.addListing("http://mirror.example.org/", nginxListing("/", {"x.bin"}));
    client_.addFile("http://mirror.example.org/x.bin", "x");

    DownloadOrchestrator orchestrator(options("http://mirror.example.org"), client_, cancel_);
    const auto summary = orchestrator.run();

    EXPECT_THAT(generic(summary.completed),
                ElementsAre((out_.path() / "mirror.example.org" / "x.bin").generic_string()));
}

TEST_F(OrchestratorTest, ExhaustedFileIsListedOnceAsFailed) {
    client_.addListing("http://h/r/", nginxListing("/r/", {"good.txt", "bad.txt"}));
    client_.addFile("http://h/r/good.txt", "ok");
    client_.addFile("http://h/r/bad.txt", "never");
    client_.failGets("http://h/r/bad.txt", -1);

    DownloadOrchestrator orchestrator(options("http://h"), client_, cancel_);
    const auto summary = orchestrator.run("r/");

    EXPECT_THAT(summary.failed, ElementsAre("http://h/r/bad.txt"));
    EXPECT_EQ(summary.completed.size(), 1u);
    EXPECT_EQ(client_.getCount("http://h/r/bad.txt"), 5);
    EXPECT_FALSE(summary.allSucceeded());
}

TEST_F(OrchestratorTest, DirectFileTargetSkipsCrawl) {
    const auto body = patternBody(2048);
    client_.addFile("http://h/pub/release%201.tar.gz", body);

    DownloadOrchestrator orchestrator(options("http://h/pub"), client_, cancel_);
    const auto summary = orchestrator.run("release%201.tar.gz");

    EXPECT_THAT(generic(summary.completed), ElementsAre((out_.path() / "release 1.tar.gz").generic_string()));
    EXPECT_EQ(readFile(out_.path() / "release 1.tar.gz"), body);
    EXPECT_EQ(client_.fetchCount("http://h/pub/release%201.tar.gz"), 0);
}

TEST_F(OrchestratorTest, ChunkedDirectFileStaysWithinWorkerCount) {
    const auto body = patternBody(8000);
    client_.addFile("http://h/pub/disk.img", body);

    std::atomic<int> in_flight{0};
    std::atomic<int> peak{0};
    client_.setDelay([&](const std::string&, const std::string& range) {
        if (!range.empty()) {
            const int now = ++in_flight;
            int seen = peak.load();
            while (now > seen && !peak.compare_exchange_weak(seen, now)) {
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            --in_flight;
        }
        return std::chrono::milliseconds(0);
    });

    auto opts = options("http://h/pub/disk.img", true);
    opts.workers = 1;
    DownloadOrchestrator orchestrator(opts, client_, cancel_);
    const auto summary = orchestrator.run();

    EXPECT_TRUE(summary.allSucceeded());
    EXPECT_EQ(readFile(out_.path() / "disk.img"), body);
    EXPECT_EQ(client_.getCount("http://h/pub/disk.img"), 8);
    EXPECT_LE(peak.load(), 1);
}

TEST_F(OrchestratorTest, ExtensionlessBaseUrlFileGetsGenericName) {
    client_.addFile("http://h/download", "blob");

    DownloadOrchestrator orchestrator(options("http://h/download"), client_, cancel_);
    const auto summary = orchestrator.run();

    EXPECT_THAT(generic(summary.completed), ElementsAre((out_.path() / "downloaded_file").generic_string()));
}

TEST_F(OrchestratorTest, ChunkedModeMirrorsLargeAndSmallFiles) {
    const auto big = patternBody(4500);
    client_.addListing("http://h/r/", nginxListing("/r/", {"big.iso", "small.txt"}));
    client_.addFile("http://h/r/big.iso", big);
    client_.addFile("http://h/r/small.txt", "tiny").accept_ranges = false;

    DownloadOrchestrator orchestrator(options("http://h", true), client_, cancel_);
    const auto summary = orchestrator.run("r/");

    EXPECT_TRUE(summary.allSucceeded());
    EXPECT_EQ(summary.completed.size(), 2u);
    EXPECT_EQ(client_.getCount("http://h/r/big.iso"), 5);
    EXPECT_EQ(client_.getCount("http://h/r/small.txt"), 1);
    EXPECT_TRUE(readFile(out_.path() / "r" / "big.iso") == big);
}

TEST_F(OrchestratorTest, EmptyTreeReportsNothing) {
    client_.addListing("http://h/empty/", nginxListing("/empty/", {}));

    DownloadOrchestrator orchestrator(options("http://h"), client_, cancel_);
    const auto summary = orchestrator.run("empty/");

    EXPECT_THAT(summary.completed, IsEmpty());
    EXPECT_THAT(summary.failed, IsEmpty());
}

TEST_F(OrchestratorTest, InterruptionAbortsRun) {
    client_.addListing("http://h/r/", nginxListing("/r/", {"a.txt", "b.txt", "c.txt"}));
    client_.addFile("http://h/r/a.txt", "a");
    client_.addFile("http://h/r/b.txt", "b");
    client_.addFile("http://h/r/c.txt", "c");
    client_.setDelay([this](const std::string&, const std::string&) {
        cancel_.cancel();
        return std::chrono::milliseconds(0);
    });

    MirrorOptions opts = options("http://h");
    opts.workers = 1;
    DownloadOrchestrator orchestrator(opts, client_, cancel_);

    EXPECT_THROW((void)orchestrator.run("r/"), Interrupted);
    EXPECT_LE(client_.getCount("http://h/r/b.txt") + client_.getCount("http://h/r/c.txt"), 1);
}

TEST(FormatSizeTest, PicksLargestUnit) {
    EXPECT_EQ(DownloadOrchestrator::formatSize(512), "512 B");
    EXPECT_EQ(DownloadOrchestrator::formatSize(1536), "1.5 KB");
    EXPECT_EQ(DownloadOrchestrator::formatSize(25ULL * 1024 * 1024), "25.0 MB");
    EXPECT_EQ(DownloadOrchestrator::formatSize(3ULL * 1024 * 1024 * 1024), "3.0 GB");
}
