#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace dirmirror {

struct ResourceInfo {
    long status{0};
    std::optional<std::uint64_t> content_length;
    bool accepts_ranges{false};
    std::string content_type;

    [[nodiscard]] bool ok() const { return status >= 200 && status < 300; }
};

struct FetchResult {
    long status{0};
    std::string body;

    [[nodiscard]] bool ok() const { return status >= 200 && status < 300; }
};

// Receives a streamed response body. Returning false from either callback
// ends the request early without it being treated as an error; throwing
// aborts it and the exception reaches the caller of HttpClient::get.
class ResponseSink {
public:
    virtual ~ResponseSink() = default;

    // Total resource size from a "Content-Range: bytes a-b/N" or "bytes */N"
    // header, when the final response carries one. Called before onStatus.
    virtual void onCompleteLength(std::uint64_t) {}

    // Called once with the final status, before any body bytes.
    virtual bool onStatus(long status) = 0;
    virtual bool onData(const char* data, std::size_t size) = 0;
};

// Transport used by the crawler and the transfer strategies. Implementations
// must be safe to call from several threads at once. Network failures are
// reported as TransferError, cancellation as Interrupted.
class HttpClient {
public:
    virtual ~HttpClient() = default;

    [[nodiscard]] virtual ResourceInfo head(const std::string& url) = 0;

    // Whole body in memory, bounded by the listing timeout.
    [[nodiscard]] virtual FetchResult fetch(const std::string& url) = 0;

    // `range` is empty, "start-" or "start-end" (inclusive). Returns the status.
    virtual long get(const std::string& url, const std::string& range, ResponseSink& sink) = 0;
};

} // namespace dirmirror
