#pragma once

#include "cancellation.hpp"
#include "http_client.hpp"
#include "options.hpp"

#include <memory>
#include <string>

namespace dirmirror {

class CurlHttpClient final : public HttpClient {
public:
    CurlHttpClient(HttpTimeouts timeouts, const CancellationToken& cancel);
    ~CurlHttpClient() override;

    [[nodiscard]] ResourceInfo head(const std::string& url) override;
    [[nodiscard]] FetchResult fetch(const std::string& url) override;
    long get(const std::string& url, const std::string& range, ResponseSink& sink) override;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace dirmirror
