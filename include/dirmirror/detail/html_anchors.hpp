#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace dirmirror::detail {

// Every <a href> value of `html` in document order, entities decoded.
// Malformed markup is recovered from; an unparsable document yields nothing.
[[nodiscard]] std::vector<std::string> extractAnchors(std::string_view html, const std::string& base_url);

} // namespace dirmirror::detail
