#pragma once

#include <cstddef>
#include <cstdio>
#include <filesystem>
#include <memory>

namespace dirmirror::detail {

struct FileDeleter {
    void operator()(FILE* fp) const noexcept {
        if (fp) {
            std::fclose(fp);
        }
    }
};

using FileHandle = std::unique_ptr<FILE, FileDeleter>;

// Both throw TransferError with the path and errno text on failure.
[[nodiscard]] FileHandle openFile(const std::filesystem::path& path, const char* mode);
void writeAll(FILE* file, const char* data, std::size_t size, const std::filesystem::path& path);

// Flushes and closes, reporting a failed close as TransferError.
void closeFile(FileHandle& file, const std::filesystem::path& path);

} // namespace dirmirror::detail
