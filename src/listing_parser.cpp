#include "dirmirror/listing_parser.hpp"
#include "dirmirror/detail/html_anchors.hpp"
#include "dirmirror/errors.hpp"
#include "dirmirror/url.hpp"

#include <unordered_set>
#include <utility>

#include <spdlog/spdlog.h>

namespace dirmirror {

ListingParser::ListingParser(HttpClient& client) : client_(client) {}

Listing ListingParser::parse(const std::string& url) const {
    try {
        const auto response = client_.fetch(url);
        if (!response.ok()) {
            spdlog::error("Error parsing directory {}: HTTP status {}", url, response.status);
            return {};
        }
        return parseDocument(response.body, url);
    } catch (const Interrupted&) {
        throw;
    } catch (const std::exception& ex) {
        spdlog::error("Error parsing directory {}: {}", url, ex.what());
        return {};
    }
}

Listing ListingParser::parseDocument(std::string_view html, const std::string& url) {
    Listing listing;
    std::unordered_set<std::string> seen;

    for (auto& href : detail::extractAnchors(html, url)) {
        while (href.size() >= 2 && href.compare(0, 2, "./") == 0) {
            href.erase(0, 2);
        }
        if (isExcludedHref(href)) {
            continue;
        }
        if (!seen.insert(href).second) {
            continue;
        }

        if (href.back() == '/') {
            href.pop_back();
            if (!href.empty()) {
                listing.directories.push_back(std::move(href));
            }
        } else {
            listing.files.push_back(std::move(href));
        }
    }
    return listing;
}

} // namespace dirmirror
