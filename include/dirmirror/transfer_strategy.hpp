#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

namespace dirmirror {

// Moves one remote file to one local path. Implementations are shared by all
// workers, so transfer() must be safe to call concurrently for distinct paths.
class TransferStrategy {
public:
    virtual ~TransferStrategy() = default;

    // True when the local file is complete, whether transferred or skipped.
    [[nodiscard]] virtual bool transfer(const std::string& remote_url, const std::filesystem::path& local_path) = 0;
    [[nodiscard]] virtual std::uint64_t bytesTransferred() const = 0;
};

using TransferStrategyPtr = std::unique_ptr<TransferStrategy>;

} // namespace dirmirror
