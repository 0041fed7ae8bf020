#include "dirmirror/options.hpp"

#include <algorithm>

namespace dirmirror {

std::chrono::milliseconds RetryPolicy::delayFor(int attempt) const {
    const int shift = std::clamp(attempt, 0, 30);
    return base_delay * (std::int64_t{1} << shift);
}

} // namespace dirmirror
