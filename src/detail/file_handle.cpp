#include "dirmirror/detail/file_handle.hpp"
#include "dirmirror/errors.hpp"

#include <cerrno>
#include <cstring>

#include <fmt/format.h>

namespace dirmirror::detail {

FileHandle openFile(const std::filesystem::path& path, const char* mode) {
    FileHandle file{std::fopen(path.c_str(), mode)};
    if (!file) {
        throw TransferError(fmt::format("cannot open {}: {}", path.string(), std::strerror(errno)));
    }
    return file;
}

void writeAll(FILE* file, const char* data, std::size_t size, const std::filesystem::path& path) {
    if (std::fwrite(data, 1, size, file) != size) {
        throw TransferError(fmt::format("failed to write {}: {}", path.string(), std::strerror(errno)));
    }
}

void closeFile(FileHandle& file, const std::filesystem::path& path) {
    if (!file) {
        return;
    }
    FILE* raw = file.release();
    if (std::fclose(raw) != 0) {
        throw TransferError(fmt::format("failed to close {}: {}", path.string(), std::strerror(errno)));
    }
}

} // namespace dirmirror::detail
