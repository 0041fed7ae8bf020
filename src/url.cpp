#include "dirmirror/url.hpp"
#include "dirmirror/detail/curl_utils.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace dirmirror {

namespace {

bool startsWithIgnoreCase(std::string_view text, std::string_view prefix) {
    if (text.size() < prefix.size()) {
        return false;
    }
    return std::equal(prefix.begin(), prefix.end(), text.begin(), [](char a, char b) {
        return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
    });
}

// "scheme://host..." -> offset of the first character after the authority.
std::size_t pathOffset(std::string_view url) {
    const auto scheme_end = url.find("://");
    if (scheme_end == std::string_view::npos) {
        return 0;
    }
    const auto path_start = url.find_first_of("/?#", scheme_end + 3);
    return path_start == std::string_view::npos ? url.size() : path_start;
}

} // namespace

bool isExcludedHref(std::string_view href) {
    if (href.empty()) {
        return true;
    }

    static constexpr std::array<std::string_view, 8> kExcludedPrefixes{
        "http://", "https://", "../", "?", "#", "/", "mailto:", "javascript:"};
    for (const auto prefix : kExcludedPrefixes) {
        if (startsWithIgnoreCase(href, prefix)) {
            return true;
        }
    }
    return href == ".." || href.find("://") != std::string_view::npos;
}

std::string percentDecode(std::string_view encoded) {
    return detail::unescape(encoded);
}

bool isSafePathSegment(std::string_view decoded) {
    if (decoded.empty() || decoded == "." || decoded == "..") {
        return false;
    }
    return decoded.find_first_of(std::string_view{"/\\\0", 3}) == std::string_view::npos;
}

std::string withTrailingSlash(std::string url) {
    if (url.empty() || url.back() != '/') {
        url.push_back('/');
    }
    return url;
}

std::string withoutTrailingSlash(std::string url) {
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url;
}

std::string joinUrl(std::string_view directory_url, std::string_view name) {
    while (name.size() >= 2 && name.substr(0, 2) == "./") {
        name.remove_prefix(2);
    }
    std::string joined = withTrailingSlash(std::string{directory_url});
    joined.append(name);
    return joined;
}

std::string lastPathSegment(std::string_view url) {
    const auto offset = pathOffset(url);
    std::string_view path = url.substr(offset);
    const auto query = path.find_first_of("?#");
    if (query != std::string_view::npos) {
        path = path.substr(0, query);
    }
    while (!path.empty() && path.back() == '/') {
        path.remove_suffix(1);
    }
    const auto slash = path.rfind('/');
    return std::string{slash == std::string_view::npos ? path : path.substr(slash + 1)};
}

std::string hostOf(std::string_view url) {
    const auto scheme_end = url.find("://");
    if (scheme_end == std::string_view::npos) {
        return {};
    }
    std::string_view authority = url.substr(scheme_end + 3, pathOffset(url) - scheme_end - 3);
    const auto at = authority.rfind('@');
    if (at != std::string_view::npos) {
        authority.remove_prefix(at + 1);
    }
    if (!authority.empty() && authority.front() == '[') {
        const auto close = authority.find(']');
        return std::string{authority.substr(1, close == std::string_view::npos ? std::string_view::npos : close - 1)};
    }
    return std::string{authority.substr(0, authority.find(':'))};
}

bool hasSchemeAndHost(std::string_view url) {
    const auto scheme_end = url.find("://");
    if (scheme_end == std::string_view::npos || scheme_end == 0) {
        return false;
    }
    const bool scheme_ok = std::all_of(url.begin(), url.begin() + static_cast<std::ptrdiff_t>(scheme_end), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '-' || c == '.';
    });
    return scheme_ok && !hostOf(url).empty();
}

} // namespace dirmirror
