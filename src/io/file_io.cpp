// =============================================================================
// cadvc - Small File Helpers Implementation
// =============================================================================

#include "cadvc/io/file_io.h"

#include <cerrno>
#include <fstream>
#include <iterator>

#include "cadvc/common/error.h"

namespace cadvc::io {

namespace {

std::error_code lastSystemError() {
    return std::error_code(errno != 0 ? errno : EIO, std::generic_category());
}

}  // namespace

std::vector<std::uint8_t> readFileBytes(const std::filesystem::path& path) {
    errno = 0;
    std::ifstream in(path, std::ios::binary | std::ios::ate);
    if (!in.is_open()) {
        throw IOError("Cannot open file", lastSystemError(), ErrorContext(path.string()));
    }

    const auto size = in.tellg();
    in.seekg(0, std::ios::beg);

    std::vector<std::uint8_t> data(static_cast<std::size_t>(size));
    if (!data.empty()) {
        in.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(data.size()));
    }
    if (!in.good()) {
        throw IOError("Failed to read file", ErrorContext(path.string()));
    }
    return data;
}

std::string readFileText(const std::filesystem::path& path) {
    errno = 0;
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw IOError("Cannot open file", lastSystemError(), ErrorContext(path.string()));
    }
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

void writeFileBytes(const std::filesystem::path& path, std::span<const std::uint8_t> data) {
    errno = 0;
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw IOError("Cannot create file", lastSystemError(), ErrorContext(path.string()));
    }
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    out.flush();
    if (!out.good()) {
        throw IOError("Failed to write file", ErrorContext(path.string()));
    }
}

void writeFileText(const std::filesystem::path& path, std::string_view text) {
    writeFileBytes(path, std::span<const std::uint8_t>(
                             reinterpret_cast<const std::uint8_t*>(text.data()), text.size()));
}

}  // namespace cadvc::io
