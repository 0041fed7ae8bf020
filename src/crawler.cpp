#include "dirmirror/crawler.hpp"
#include "dirmirror/errors.hpp"
#include "dirmirror/url.hpp"

#include <algorithm>
#include <cctype>
#include <string_view>

#include <spdlog/spdlog.h>

namespace dirmirror {

namespace {

bool isHtmlContentType(std::string content_type) {
    std::transform(content_type.begin(), content_type.end(), content_type.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return content_type.find("text/html") != std::string::npos ||
           content_type.find("application/xhtml") != std::string::npos;
}

bool looksLikeHtml(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text.find("<html") != std::string::npos || text.find("<!doctype html") != std::string::npos;
}

// Keeps the first bytes of a probe response and stops the transfer after that.
class ProbeSink final : public ResponseSink {
public:
    static constexpr std::size_t kSniffBytes = 512;

    bool onStatus(long status) override { return status == 200 || status == 206; }

    bool onData(const char* data, std::size_t size) override {
        const std::size_t wanted = std::min(size, kSniffBytes - prefix_.size());
        prefix_.append(data, wanted);
        return prefix_.size() < kSniffBytes;
    }

    [[nodiscard]] const std::string& prefix() const { return prefix_; }

private:
    std::string prefix_;
};

} // namespace

Crawler::Crawler(const ListingParser& parser, const CancellationToken& cancel, int max_depth)
    : parser_(parser), cancel_(cancel), max_depth_(max_depth) {}

std::vector<PendingFile> Crawler::walk(const std::string& url, const std::filesystem::path& relative_path) {
    visited_.clear();
    std::vector<PendingFile> files;
    walkInto(url, relative_path, 0, files);
    return files;
}

void Crawler::walkInto(const std::string& url, const std::filesystem::path& relative_path, int depth,
                       std::vector<PendingFile>& out) {
    cancel_.throwIfCancelled();

    if (!visited_.insert(percentDecode(withTrailingSlash(url))).second) {
        spdlog::warn("Skipping already visited directory: {}", url);
        return;
    }
    if (depth > max_depth_) {
        spdlog::warn("Not descending into {}: deeper than {} levels", url, max_depth_);
        return;
    }

    spdlog::info("Scanning: {}", url);
    const auto listing = parser_.parse(url);

    for (const auto& name : listing.files) {
        const auto decoded = percentDecode(name);
        if (!isSafePathSegment(decoded)) {
            spdlog::warn("Ignoring unsafe file name '{}' in {}", name, url);
            continue;
        }
        out.push_back({joinUrl(url, name), relative_path / decoded});
    }

    for (const auto& name : listing.directories) {
        const auto decoded = percentDecode(name);
        if (!isSafePathSegment(decoded)) {
            spdlog::warn("Ignoring unsafe directory name '{}' in {}", name, url);
            continue;
        }
        walkInto(withTrailingSlash(joinUrl(url, name)), relative_path / decoded, depth + 1, out);
    }
}

bool isDirectFile(HttpClient& client, const std::string& url) {
    try {
        const auto info = client.head(url);
        if (info.ok()) {
            if (!info.content_type.empty()) {
                return !isHtmlContentType(info.content_type);
            }
            if (info.content_length) {
                return true;
            }
        }
        spdlog::debug("HEAD {} inconclusive (status {}), probing with a range request", url, info.status);
    } catch (const Interrupted&) {
        throw;
    } catch (const TransferError& ex) {
        spdlog::debug("HEAD {} failed: {}", url, ex.what());
    }

    try {
        ProbeSink sink;
        const long status = client.get(url, "0-0", sink);
        if (status == 206) {
            return true;
        }
        return status == 200 && !looksLikeHtml(sink.prefix());
    } catch (const Interrupted&) {
        throw;
    } catch (const TransferError& ex) {
        spdlog::debug("Range probe of {} failed: {}", url, ex.what());
        return false;
    }
}

} // namespace dirmirror
