#pragma once

#include "cancellation.hpp"
#include "http_client.hpp"
#include "listing_parser.hpp"

#include <filesystem>
#include <string>
#include <unordered_set>
#include <vector>

namespace dirmirror {

struct PendingFile {
    std::string remote_url;
    std::filesystem::path relative_path;
};

class Crawler {
public:
    static constexpr int kDefaultMaxDepth = 64;

    Crawler(const ListingParser& parser, const CancellationToken& cancel, int max_depth = kDefaultMaxDepth);

    // Depth-first walk of the index at `url`. Relative paths are decoded and
    // rooted at `relative_path`.
    [[nodiscard]] std::vector<PendingFile> walk(const std::string& url,
                                                const std::filesystem::path& relative_path = {});

private:
    void walkInto(const std::string& url, const std::filesystem::path& relative_path, int depth,
                  std::vector<PendingFile>& out);

    const ListingParser& parser_;
    const CancellationToken& cancel_;
    int max_depth_;
    std::unordered_set<std::string> visited_;
};

// Decides whether `url` names a file rather than a directory index: HEAD
// first, then a one-byte range probe when HEAD is inconclusive.
[[nodiscard]] bool isDirectFile(HttpClient& client, const std::string& url);

} // namespace dirmirror
