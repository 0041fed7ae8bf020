#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace dirmirror {

struct RetryPolicy {
    int max_attempts{5};
    std::chrono::milliseconds base_delay{1000};

    // Delay after the zero-indexed failed `attempt`: base_delay * 2^attempt.
    [[nodiscard]] std::chrono::milliseconds delayFor(int attempt) const;
};

struct HttpTimeouts {
    std::chrono::seconds request{30};
    std::chrono::seconds head{10};
    std::chrono::seconds listing{30};
};

struct MirrorOptions {
    std::string base_url;
    std::filesystem::path output_dir{"downloads"};
    int workers{8};
    RetryPolicy retry{};
    bool chunked{false};
    std::uint64_t chunk_size{10ULL * 1024 * 1024};
    HttpTimeouts timeouts{};
};

} // namespace dirmirror
