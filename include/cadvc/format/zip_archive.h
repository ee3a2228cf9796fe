// =============================================================================
// cadvc - ZIP Container Reader/Writer
// =============================================================================
// Thin RAII wrappers over minizip for the two ZIP containers cadvc handles:
// CAD archives (.FCStd) and chunk archives (<prefix><n>.zip).
//
// This module provides:
// - ZipReader: enumerate and read members of an existing ZIP file
// - ZipWriter: atomic ZIP writer using a temporary file + fsync + rename
// - DeflatedMember: a member compressed ahead of time, so callers can
//   measure the exact payload size before committing it to an archive
//
// Members are written with a fixed 1980-01-01 timestamp, so an archive built
// from the same inputs in the same order is byte-reproducible.
//
// Usage:
//   ZipWriter writer("/path/to/out.zip");
//   writer.addMember(deflateMember("Document.xml", bytes, 6));
//   writer.finalize();  // Closes, fsyncs and renames temp to final
// =============================================================================

#ifndef CADVC_FORMAT_ZIP_ARCHIVE_H
#define CADVC_FORMAT_ZIP_ARCHIVE_H

#include <cstdint>
#include <filesystem>
#include <functional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "cadvc/common/error.h"
#include "cadvc/common/types.h"

namespace cadvc::format {

// =============================================================================
// Constants
// =============================================================================

/// @brief ZIP compression method: stored.
inline constexpr int kMethodStored = 0;

/// @brief ZIP compression method: deflate.
inline constexpr int kMethodDeflate = 8;

/// @brief Local file header size without name and extra field.
inline constexpr std::uint64_t kLocalHeaderSize = 30;

/// @brief Central directory header size without name and extra field.
inline constexpr std::uint64_t kCentralHeaderSize = 46;

/// @brief End of central directory record size without comment.
inline constexpr std::uint64_t kEndOfCentralDirSize = 22;

/// @brief Zip64 end of central directory record plus its locator.
inline constexpr std::uint64_t kZip64EndOfCentralDirSize = 56 + 20;

/// @brief Size of an archive with no members, the smallest a chunk archive can be.
inline constexpr std::uint64_t kMinArchiveSize =
    kEndOfCentralDirSize + kZip64EndOfCentralDirSize;

/// @brief Upper bound on extra fields and data descriptor per member.
inline constexpr std::uint64_t kPerMemberSlack = 64;

// =============================================================================
// ZipEntry
// =============================================================================

/// @brief Central directory information for one member.
struct ZipEntry {
    /// @brief Member name as stored (always '/' separated).
    std::string name;

    /// @brief Uncompressed size in bytes.
    std::uint64_t uncompressedSize = 0;

    /// @brief Compressed size in bytes.
    std::uint64_t compressedSize = 0;

    /// @brief CRC-32 of the uncompressed data.
    std::uint32_t crc32 = 0;

    /// @brief Compression method (0 stored, 8 deflate).
    int method = kMethodDeflate;

    /// @brief True for directory entries (name ends with '/').
    [[nodiscard]] bool isDirectory() const noexcept {
        return !name.empty() && name.back() == '/';
    }
};

// =============================================================================
// DeflatedMember
// =============================================================================

/// @brief A member compressed in memory, ready to be written raw.
struct DeflatedMember {
    std::string name;
    std::vector<std::uint8_t> payload;
    std::uint64_t uncompressedSize = 0;
    std::uint32_t crc32 = 0;
    int method = kMethodDeflate;
    CompressionLevel level = kDefaultCompressionLevel;

    /// @brief Upper bound on the bytes this member adds to an archive.
    [[nodiscard]] std::uint64_t projectedSize() const noexcept {
        return kLocalHeaderSize + kCentralHeaderSize + 2 * name.size() + kPerMemberSlack +
               payload.size();
    }
};

/// @brief Compress data into a raw deflate stream.
/// @param name Member name to record.
/// @param data Uncompressed bytes.
/// @param level Deflate level 0-9; level 0 stores the data.
/// @throws IOError if zlib fails.
[[nodiscard]] DeflatedMember deflateMember(std::string name, std::span<const std::uint8_t> data,
                                           CompressionLevel level);

/// @brief Check that a member name stays inside its extraction root.
/// @return false for absolute names, drive letters and any ".." component.
[[nodiscard]] bool isSafeMemberName(std::string_view name) noexcept;

// =============================================================================
// ZipReader
// =============================================================================

/// @brief Reader for an existing ZIP file.
///
/// Error Handling:
/// - Throws IOError if the file cannot be opened
/// - Throws FormatError if the file is not a readable ZIP or a member fails
///   its CRC check
class ZipReader {
public:
    /// @brief Open a ZIP file and read its central directory.
    /// @param path ZIP file path.
    /// @throws IOError if the file does not exist or cannot be read.
    /// @throws FormatError if the file is not a ZIP container.
    explicit ZipReader(std::filesystem::path path);

    ~ZipReader();

    ZipReader(const ZipReader&) = delete;
    ZipReader& operator=(const ZipReader&) = delete;
    ZipReader(ZipReader&& other) noexcept;
    ZipReader& operator=(ZipReader&&) = delete;

    /// @brief Members in central directory order.
    [[nodiscard]] const std::vector<ZipEntry>& entries() const noexcept { return entries_; }

    /// @brief Read and inflate one member.
    /// @param name Member name as listed in entries().
    /// @throws FormatError if the member is missing or corrupt.
    [[nodiscard]] std::vector<std::uint8_t> read(std::string_view name);

    /// @brief Extract members below a destination directory.
    /// @param destination Target directory, created if needed.
    /// @param filter Optional predicate; members it rejects are skipped.
    /// @return Number of files written (directory entries not counted).
    /// @throws FormatError for unsafe member names or corrupt members.
    /// @throws IOError if a file cannot be written.
    std::size_t extractAll(const std::filesystem::path& destination,
                           const std::function<bool(const ZipEntry&)>& filter = {});

    /// @brief Path of the opened file.
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    void loadDirectory();

    std::filesystem::path path_;
    void* handle_ = nullptr;  // unzFile
    std::vector<ZipEntry> entries_;
};

// =============================================================================
// ZipWriter
// =============================================================================

/// @brief Atomic ZIP writer.
/// @note Writes to `<output>.tmp`; finalize() fsyncs and renames into place.
///
/// Error Handling:
/// - Throws IOError on file operation failures
/// - Automatically removes the temp file on destruction if not finalized
class ZipWriter {
public:
    /// @brief Construct a writer for the specified output path.
    /// @param outputPath Final archive path.
    /// @throws IOError if the temporary file cannot be created.
    explicit ZipWriter(std::filesystem::path outputPath);

    /// @brief Destructor - cleans up temp file if not finalized.
    ~ZipWriter();

    ZipWriter(const ZipWriter&) = delete;
    ZipWriter& operator=(const ZipWriter&) = delete;
    ZipWriter(ZipWriter&&) = delete;
    ZipWriter& operator=(ZipWriter&&) = delete;

    /// @brief Write a member compressed ahead of time.
    /// @throws IOError on write failure.
    void addMember(const DeflatedMember& member);

    /// @brief Compress and write a member.
    /// @throws IOError on compression or write failure.
    void addFile(std::string name, std::span<const std::uint8_t> data, CompressionLevel level);

    /// @brief Close the archive, fsync it and rename it into place.
    /// @throws IOError on close, sync or rename failure.
    void finalize();

    /// @brief Abort writing and remove the temporary file.
    /// @note Safe to call multiple times.
    void abort() noexcept;

    /// @brief Number of members written so far.
    [[nodiscard]] std::size_t memberCount() const noexcept { return memberCount_; }

    [[nodiscard]] bool isFinalized() const noexcept { return finalized_; }

    [[nodiscard]] const std::filesystem::path& outputPath() const noexcept { return outputPath_; }

    [[nodiscard]] const std::filesystem::path& tempPath() const noexcept { return tempPath_; }

private:
    std::filesystem::path outputPath_;
    std::filesystem::path tempPath_;
    void* handle_ = nullptr;  // zipFile
    std::size_t memberCount_ = 0;
    bool finalized_ = false;
    bool aborted_ = false;
};

/// @brief fsync a file by path.
/// @throws IOError if the file cannot be opened or synced.
void syncFile(const std::filesystem::path& path);

}  // namespace cadvc::format

#endif  // CADVC_FORMAT_ZIP_ARCHIVE_H
