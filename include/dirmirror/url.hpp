#pragma once

#include <string>
#include <string_view>

namespace dirmirror {

// True for anchors a directory index uses for navigation rather than content:
// empty, parent ("../"), query ("?C=N;O=D"), fragment, absolute path and
// absolute URLs.
[[nodiscard]] bool isExcludedHref(std::string_view href);

[[nodiscard]] std::string percentDecode(std::string_view encoded);

// A decoded name usable as one local path component: not empty, not "." or
// "..", no separators, no NUL.
[[nodiscard]] bool isSafePathSegment(std::string_view decoded);

[[nodiscard]] std::string withTrailingSlash(std::string url);
[[nodiscard]] std::string withoutTrailingSlash(std::string url);

// Resolves an encoded relative `name` against a directory URL.
[[nodiscard]] std::string joinUrl(std::string_view directory_url, std::string_view name);

// Last non-empty path segment, still encoded. Query and fragment are ignored.
[[nodiscard]] std::string lastPathSegment(std::string_view url);

[[nodiscard]] std::string hostOf(std::string_view url);

[[nodiscard]] bool hasSchemeAndHost(std::string_view url);

} // namespace dirmirror
