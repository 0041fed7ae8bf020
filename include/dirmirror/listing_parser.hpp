#pragma once

#include "http_client.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace dirmirror {

// Immediate children of one directory index. Names are still URL-encoded,
// directories without their trailing slash.
struct Listing {
    std::vector<std::string> files;
    std::vector<std::string> directories;

    [[nodiscard]] bool empty() const { return files.empty() && directories.empty(); }
};

class ListingParser {
public:
    explicit ListingParser(HttpClient& client);

    // Fetch errors and non-2xx answers are logged and give an empty listing.
    [[nodiscard]] Listing parse(const std::string& url) const;

    [[nodiscard]] static Listing parseDocument(std::string_view html, const std::string& url);

private:
    HttpClient& client_;
};

} // namespace dirmirror
