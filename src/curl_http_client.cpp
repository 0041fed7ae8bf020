#include "dirmirror/curl_http_client.hpp"
#include "dirmirror/detail/curl_utils.hpp"
#include "dirmirror/errors.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <exception>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include <curl/curl.h>
#include <fmt/format.h>

namespace dirmirror {

namespace {

constexpr const char* kUserAgent = "dirmirror/1.0";

bool startsWithIgnoreCase(std::string_view text, std::string_view prefix) {
    if (text.size() < prefix.size()) {
        return false;
    }
    return std::equal(prefix.begin(), prefix.end(), text.begin(), [](char a, char b) {
        return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
    });
}

std::string toLower(std::string_view text) {
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered;
}

// Complete length from a Content-Range value; "*" or garbage gives nothing.
std::optional<std::uint64_t> parseCompleteLength(std::string_view value) {
    const auto slash = value.rfind('/');
    if (slash == std::string_view::npos) {
        return std::nullopt;
    }
    const auto digits = value.substr(slash + 1);
    std::uint64_t length = 0;
    const auto [end, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), length);
    if (ec != std::errc{} || end == digits.data()) {
        return std::nullopt;
    }
    return length;
}

} // namespace

class CurlHttpClient::Impl {
public:
    Impl(HttpTimeouts timeouts, const CancellationToken& cancel)
        : timeouts_(timeouts), cancel_(cancel) {
        detail::ensureCurlInitialized();
    }

    [[nodiscard]] ResourceInfo head(const std::string& url) const {
        auto curl = detail::makeCurlHandle();
        applyCommonOptions(curl.get(), url, timeouts_.head);
        curl_easy_setopt(curl.get(), CURLOPT_NOBODY, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, static_cast<long>(timeouts_.head.count()));

        HeaderState headers;
        curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, &Impl::headerCallback);
        curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &headers);

        perform(curl.get(), url);

        ResourceInfo info;
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &info.status);
        info.accepts_ranges = headers.accepts_ranges;

        curl_off_t length = -1;
        //没有Content-Length时返回-1
        if (curl_easy_getinfo(curl.get(), CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length) == CURLE_OK && length >= 0) {
            info.content_length = static_cast<std::uint64_t>(length);
        }

        char* content_type = nullptr;
        if (curl_easy_getinfo(curl.get(), CURLINFO_CONTENT_TYPE, &content_type) == CURLE_OK && content_type) {
            info.content_type = content_type;
        }
        return info;
    }

    [[nodiscard]] FetchResult fetch(const std::string& url) const {
        auto curl = detail::makeCurlHandle();
        applyCommonOptions(curl.get(), url, timeouts_.listing);
        curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, static_cast<long>(timeouts_.listing.count()));

        FetchResult result;
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION,
            +[](char* ptr, size_t size, size_t nmemb, std::string* out) -> size_t {
                if (!out) {
                    return 0;
                }
                out->append(ptr, size * nmemb);
                return size * nmemb;
            });
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &result.body);

        perform(curl.get(), url);
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &result.status);
        return result;
    }

    long get(const std::string& url, const std::string& range, ResponseSink& sink) const {
        auto curl = detail::makeCurlHandle();
        applyCommonOptions(curl.get(), url, timeouts_.request);
        if (!range.empty()) {
            curl_easy_setopt(curl.get(), CURLOPT_RANGE, range.c_str());
        }

        StreamContext ctx{curl.get(), &sink};
        curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, &Impl::streamHeaderCallback);
        curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &ctx);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &Impl::writeCallback);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &ctx);

        const CURLcode res = curl_easy_perform(curl.get());
        if (ctx.failure) {
            std::rethrow_exception(ctx.failure);
        }
        if (ctx.stopped) {
            return ctx.status;
        }
        checkResult(res, url);

        if (!ctx.status_sent) {
            // Empty body: the sink still has to see the status.
            curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &ctx.status);
            ctx.status_sent = true;
            if (ctx.complete_length) {
                sink.onCompleteLength(*ctx.complete_length);
            }
            sink.onStatus(ctx.status);
        }
        return ctx.status;
    }

private:
    struct HeaderState {
        bool accepts_ranges{false};
    };

    struct StreamContext {
        CURL* handle{nullptr};
        ResponseSink* sink{nullptr};
        long status{0};
        bool status_sent{false};
        bool stopped{false};
        std::optional<std::uint64_t> complete_length{};
        std::exception_ptr failure{};
    };

    void applyCommonOptions(CURL* curl, const std::string& url, std::chrono::seconds timeout) const {
        const long seconds = static_cast<long>(timeout.count());
        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 10L);
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl, CURLOPT_USERAGENT, kUserAgent);
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, seconds);
        // A transfer that stalls below 1 B/s for `timeout` is a timeout.
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, seconds);
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, &Impl::progressCallback);
        curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &cancel_);
    }

    void perform(CURL* curl, const std::string& url) const {
        checkResult(curl_easy_perform(curl), url);
    }

    void checkResult(CURLcode res, const std::string& url) const {
        if (res == CURLE_OK) {
            return;
        }
        if (res == CURLE_ABORTED_BY_CALLBACK && cancel_.isCancelled()) {
            throw Interrupted();
        }
        throw TransferError(fmt::format("{}: {}", url, curl_easy_strerror(res)));
    }

    static size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
        auto* state = static_cast<HeaderState*>(userdata);
        const size_t total = size * nitems;
        if (!state) {
            return total;
        }

        std::string_view line(buffer, total);
        if (startsWithIgnoreCase(line, "HTTP/")) {
            // A new response block starts after every redirect.
            *state = HeaderState{};
        } else if (startsWithIgnoreCase(line, "accept-ranges:")) {
            state->accepts_ranges = toLower(line.substr(14)).find("bytes") != std::string::npos;
        }
        return total;
    }

    static size_t streamHeaderCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
        auto* ctx = static_cast<StreamContext*>(userdata);
        const size_t total = size * nitems;
        if (!ctx) {
            return total;
        }

        std::string_view line(buffer, total);
        if (startsWithIgnoreCase(line, "HTTP/")) {
            ctx->complete_length.reset();
        } else if (startsWithIgnoreCase(line, "content-range:")) {
            auto value = line.substr(14);
            while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back()))) {
                value.remove_suffix(1);
            }
            ctx->complete_length = parseCompleteLength(value);
        }
        return total;
    }

    static size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
        auto* ctx = static_cast<StreamContext*>(userdata);
        if (!ctx || !ctx->sink) {
            return 0;
        }

        const size_t total = size * nmemb;
        try {
            if (!ctx->status_sent) {
                curl_easy_getinfo(ctx->handle, CURLINFO_RESPONSE_CODE, &ctx->status);
                ctx->status_sent = true;
                if (ctx->complete_length) {
                    ctx->sink->onCompleteLength(*ctx->complete_length);
                }
                if (!ctx->sink->onStatus(ctx->status)) {
                    ctx->stopped = true;
                    return 0;
                }
            }
            if (!ctx->sink->onData(ptr, total)) {
                ctx->stopped = true;
                return 0;
            }
        } catch (...) {
            // Rethrown after curl_easy_perform returns; exceptions must not cross libcurl.
            ctx->failure = std::current_exception();
            return 0;
        }
        return total;
    }

    static int progressCallback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
        const auto* cancel = static_cast<const CancellationToken*>(clientp);
        return (cancel && cancel->isCancelled()) ? 1 : 0;
    }

    HttpTimeouts timeouts_;
    const CancellationToken& cancel_;
};

CurlHttpClient::CurlHttpClient(HttpTimeouts timeouts, const CancellationToken& cancel)
    : impl_(std::make_unique<Impl>(timeouts, cancel)) {}

CurlHttpClient::~CurlHttpClient() = default;

ResourceInfo CurlHttpClient::head(const std::string& url) { return impl_->head(url); }

FetchResult CurlHttpClient::fetch(const std::string& url) { return impl_->fetch(url); }

long CurlHttpClient::get(const std::string& url, const std::string& range, ResponseSink& sink) {
    return impl_->get(url, range, sink);
}

} // namespace dirmirror
