#include "dirmirror/errors.hpp"
#include "dirmirror/retry.hpp"
#include "dirmirror/whole_file_transfer.hpp"

#include "fake_http_client.hpp"
#include "test_support.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <stdexcept>

using namespace dirmirror;
using dirmirror::test::FakeHttpClient;
using dirmirror::test::patternBody;
using dirmirror::test::readFile;
using dirmirror::test::writeFile;
using ::testing::ElementsAre;

namespace {

constexpr const char* kUrl = "http://h/pub/archive.bin";

RetryPolicy fastRetry(int attempts = 5) {
    return RetryPolicy{attempts, std::chrono::milliseconds(0)};
}

class WholeFileTransferTest : public ::testing::Test {
protected:
    FakeHttpClient client_;
    CancellationToken cancel_;
    test::TempDir dir_;
};

} // namespace

TEST_F(WholeFileTransferTest, DownloadsIntoMissingDirectories) {
    const auto body = patternBody(100000);
    client_.addFile(kUrl, body);
    const auto target = dir_.path() / "nested" / "deeper" / "archive.bin";

    WholeFileTransfer transfer(client_, fastRetry(), cancel_);
    ASSERT_TRUE(transfer.transfer(kUrl, target));

    EXPECT_EQ(readFile(target), body);
    EXPECT_EQ(transfer.bytesTransferred(), body.size());
    EXPECT_THAT(client_.rangesRequested(kUrl), ElementsAre(""));
}

TEST_F(WholeFileTransferTest, SecondRunSkipsWithoutTransfer) {
    client_.addFile(kUrl, patternBody(5000));
    const auto target = dir_.path() / "archive.bin";

    WholeFileTransfer transfer(client_, fastRetry(), cancel_);
    ASSERT_TRUE(transfer.transfer(kUrl, target));
    const auto served = client_.bytesServed(kUrl);

    ASSERT_TRUE(transfer.transfer(kUrl, target));
    EXPECT_EQ(client_.getCount(kUrl), 1);
    EXPECT_EQ(client_.bytesServed(kUrl), served);
}

TEST_F(WholeFileTransferTest, CompleteLocalCopyKeptWhenSizeOnlyInRangeReply) {
    const auto body = patternBody(5000);
    client_.addFile(kUrl, body).send_length = false;
    const auto target = dir_.path() / "archive.bin";
    writeFile(target, body);

    WholeFileTransfer transfer(client_, fastRetry(), cancel_);
    ASSERT_TRUE(transfer.transfer(kUrl, target));

    EXPECT_EQ(readFile(target), body);
    EXPECT_EQ(client_.bytesServed(kUrl), 0u);
    EXPECT_THAT(client_.rangesRequested(kUrl), ElementsAre("5000-"));
}

TEST_F(WholeFileTransferTest, ResumeAppendsOnlyMissingBytes) {
    const auto body = patternBody(64000);
    client_.addFile(kUrl, body);
    const auto target = dir_.path() / "archive.bin";
    writeFile(target, body.substr(0, 20000));

    WholeFileTransfer transfer(client_, fastRetry(), cancel_);
    ASSERT_TRUE(transfer.transfer(kUrl, target));

    EXPECT_EQ(readFile(target), body);
    EXPECT_EQ(client_.bytesServed(kUrl), 44000u);
    EXPECT_THAT(client_.rangesRequested(kUrl), ElementsAre("20000-"));
}

TEST_F(WholeFileTransferTest, IgnoredRangeRestartsFromZero) {
    const auto body = patternBody(30000);
    client_.addFile(kUrl, body).honor_ranges = false;
    const auto target = dir_.path() / "archive.bin";
    writeFile(target, "stale bytes that must disappear");

    WholeFileTransfer transfer(client_, fastRetry(), cancel_);
    ASSERT_TRUE(transfer.transfer(kUrl, target));

    EXPECT_EQ(readFile(target), body);
    EXPECT_EQ(client_.bytesServed(kUrl), body.size());
}

TEST_F(WholeFileTransferTest, RecoversAfterTransientFailures) {
    client_.addFile(kUrl, "payload");
    client_.failGets(kUrl, 2);
    const auto target = dir_.path() / "archive.bin";

    WholeFileTransfer transfer(client_, fastRetry(), cancel_);
    ASSERT_TRUE(transfer.transfer(kUrl, target));

    EXPECT_EQ(client_.getCount(kUrl), 3);
    EXPECT_EQ(readFile(target), "payload");
}

TEST_F(WholeFileTransferTest, GivesUpAfterMaxAttempts) {
    client_.addFile(kUrl, "payload");
    client_.failGets(kUrl, -1);

    WholeFileTransfer transfer(client_, fastRetry(5), cancel_);
    EXPECT_FALSE(transfer.transfer(kUrl, dir_.path() / "archive.bin"));
    EXPECT_EQ(client_.getCount(kUrl), 5);
}

TEST_F(WholeFileTransferTest, ErrorStatusIsRetriedThenFails) {
    WholeFileTransfer transfer(client_, fastRetry(3), cancel_);

    EXPECT_FALSE(transfer.transfer("http://h/pub/missing.bin", dir_.path() / "missing.bin"));
    EXPECT_EQ(client_.getCount("http://h/pub/missing.bin"), 3);
    EXPECT_FALSE(std::filesystem::exists(dir_.path() / "missing.bin"));
}

TEST_F(WholeFileTransferTest, OversizedLocalCopyIsReplaced) {
    const auto body = patternBody(1000);
    client_.addFile(kUrl, body).send_length = false;
    const auto target = dir_.path() / "archive.bin";
    writeFile(target, patternBody(4000));

    WholeFileTransfer transfer(client_, fastRetry(), cancel_);
    ASSERT_TRUE(transfer.transfer(kUrl, target));

    EXPECT_EQ(readFile(target), body);
    EXPECT_THAT(client_.rangesRequested(kUrl), ElementsAre("4000-", ""));
}

TEST_F(WholeFileTransferTest, EmptyRemoteFileCreatesEmptyLocalFile) {
    client_.addFile(kUrl, "");
    const auto target = dir_.path() / "empty.bin";

    WholeFileTransfer transfer(client_, fastRetry(), cancel_);
    ASSERT_TRUE(transfer.transfer(kUrl, target));

    ASSERT_TRUE(std::filesystem::exists(target));
    EXPECT_EQ(std::filesystem::file_size(target), 0u);
}

TEST_F(WholeFileTransferTest, CancelledTransferThrows) {
    client_.addFile(kUrl, "payload");
    cancel_.cancel();

    WholeFileTransfer transfer(client_, fastRetry(), cancel_);
    EXPECT_THROW((void)transfer.transfer(kUrl, dir_.path() / "archive.bin"), Interrupted);
    EXPECT_EQ(client_.getCount(kUrl), 0);
}

TEST(RetryPolicyTest, DelayDoublesFromBase) {
    const RetryPolicy policy{5, std::chrono::milliseconds(1000)};

    EXPECT_EQ(policy.delayFor(0).count(), 1000);
    EXPECT_EQ(policy.delayFor(1).count(), 2000);
    EXPECT_EQ(policy.delayFor(4).count(), 16000);
}

TEST(RetryPolicyTest, StopsAtFirstSuccess) {
    CancellationToken cancel;
    int calls = 0;

    const bool ok = retryWithBackoff(RetryPolicy{5, std::chrono::milliseconds(0)}, cancel, "job", [&](int attempt) {
        ++calls;
        if (attempt < 2) {
            throw TransferError("flaky");
        }
    });

    EXPECT_TRUE(ok);
    EXPECT_EQ(calls, 3);
}

TEST(RetryPolicyTest, InterruptedIsNotRetried) {
    CancellationToken cancel;
    int calls = 0;

    EXPECT_THROW(retryWithBackoff(RetryPolicy{5, std::chrono::milliseconds(0)}, cancel, "job",
                                  [&](int) {
                                      ++calls;
                                      throw Interrupted();
                                  }),
                 Interrupted);
    EXPECT_EQ(calls, 1);
}

TEST(RetryPolicyTest, CancellationCutsBackoffShort) {
    CancellationToken cancel;
    const auto started = std::chrono::steady_clock::now();

    EXPECT_THROW(retryWithBackoff(RetryPolicy{3, std::chrono::milliseconds(60000)}, cancel, "job",
                                  [&](int) {
                                      cancel.cancel();
                                      throw std::runtime_error("boom");
                                  }),
                 Interrupted);
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(5));
}
