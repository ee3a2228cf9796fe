// =============================================================================
// cadvc - Small File Helpers
// =============================================================================
// Whole-file read/write helpers used by the packer, transformer and hooks.
// All functions throw IOError (carrying the system error) on failure.
// =============================================================================

#ifndef CADVC_IO_FILE_IO_H
#define CADVC_IO_FILE_IO_H

#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace cadvc::io {

/// @brief Read a whole file as bytes.
/// @throws IOError if the file cannot be opened or read.
[[nodiscard]] std::vector<std::uint8_t> readFileBytes(const std::filesystem::path& path);

/// @brief Read a whole file as text.
/// @throws IOError if the file cannot be opened or read.
[[nodiscard]] std::string readFileText(const std::filesystem::path& path);

/// @brief Write bytes to a file, replacing any previous content.
/// @throws IOError if the file cannot be written.
void writeFileBytes(const std::filesystem::path& path, std::span<const std::uint8_t> data);

/// @brief Write text to a file, replacing any previous content.
/// @throws IOError if the file cannot be written.
void writeFileText(const std::filesystem::path& path, std::string_view text);

}  // namespace cadvc::io

#endif  // CADVC_IO_FILE_IO_H
