// =============================================================================
// cadvc - ZIP Writer Implementation
// =============================================================================
// Implementation of the ZipWriter class.
//
// Key features:
// - Atomic write using temporary file + fsync + rename strategy
// - Raw member writes, so the caller controls compression ahead of time
// - Fixed member timestamps for reproducible output
// =============================================================================

#include "cadvc/format/zip_archive.h"

#include <algorithm>
#include <climits>

#include <fcntl.h>
#include <unistd.h>

#include <fmt/format.h>
#include <minizip/zip.h>

#include "cadvc/common/logger.h"

namespace cadvc::format {

namespace {

namespace fs = std::filesystem;

/// @brief Members at or above this size need zip64 headers.
constexpr std::uint64_t kZip64Threshold = 0xFFFFFFFFULL;

/// @brief Largest slice handed to zipWriteInFileInZip in one call.
constexpr std::size_t kMaxWriteSlice = 1U << 30;

}  // namespace

void syncFile(const fs::path& path) {
    int fd = ::open(path.c_str(), O_RDONLY);
    if (fd < 0) {
        throw IOError("Cannot open for fsync", std::error_code(errno, std::generic_category()),
                      ErrorContext(path.string()));
    }
    int rc = ::fsync(fd);
    int savedErrno = errno;
    ::close(fd);
    if (rc != 0) {
        throw IOError("fsync failed", std::error_code(savedErrno, std::generic_category()),
                      ErrorContext(path.string()));
    }
}

// =============================================================================
// ZipWriter Implementation
// =============================================================================

ZipWriter::ZipWriter(fs::path outputPath)
    : outputPath_(std::move(outputPath)), tempPath_(outputPath_.string() + ".tmp") {
    handle_ = zipOpen64(tempPath_.c_str(), APPEND_STATUS_CREATE);
    if (handle_ == nullptr) {
        throw IOError("Failed to create temporary file: " + tempPath_.string(),
                      ErrorContext(tempPath_.string()));
    }

    CADVC_LOG_DEBUG("ZipWriter created: output={}, temp={}", outputPath_.string(),
                    tempPath_.string());
}

ZipWriter::~ZipWriter() {
    // Clean up if not finalized
    if (!finalized_ && !aborted_) {
        abort();
    }
}

void ZipWriter::addMember(const DeflatedMember& member) {
    if (finalized_ || aborted_) {
        throw IOError("Writer is finalized or aborted", ErrorContext(outputPath_.string()));
    }

    auto* zf = static_cast<zipFile>(handle_);

    zip_fileinfo info{};
    info.tmz_date.tm_year = 1980;
    info.tmz_date.tm_mon = 0;
    info.tmz_date.tm_mday = 1;

    const int zip64 = member.uncompressedSize >= kZip64Threshold ? 1 : 0;
    int rc = zipOpenNewFileInZip2_64(zf, member.name.c_str(), &info, nullptr, 0, nullptr, 0,
                                     nullptr, member.method, static_cast<int>(member.level),
                                     1, zip64);
    if (rc != ZIP_OK) {
        throw IOError(fmt::format("Cannot add member (minizip {})", rc),
                      ErrorContext(tempPath_.string()).withMember(member.name));
    }

    std::size_t offset = 0;
    while (offset < member.payload.size()) {
        const std::size_t slice = std::min(kMaxWriteSlice, member.payload.size() - offset);
        rc = zipWriteInFileInZip(zf, member.payload.data() + offset,
                                 static_cast<unsigned>(slice));
        if (rc != ZIP_OK) {
            throw IOError(fmt::format("Cannot write member data (minizip {})", rc),
                          ErrorContext(tempPath_.string()).withMember(member.name));
        }
        offset += slice;
    }

    rc = zipCloseFileInZipRaw64(zf, member.uncompressedSize, member.crc32);
    if (rc != ZIP_OK) {
        throw IOError(fmt::format("Cannot close member (minizip {})", rc),
                      ErrorContext(tempPath_.string()).withMember(member.name));
    }

    ++memberCount_;
}

void ZipWriter::addFile(std::string name, std::span<const std::uint8_t> data,
                        CompressionLevel level) {
    addMember(deflateMember(std::move(name), data, level));
}

void ZipWriter::finalize() {
    if (finalized_) {
        return;  // Already finalized
    }

    if (aborted_) {
        throw IOError("Cannot finalize aborted writer", ErrorContext(outputPath_.string()));
    }

    int rc = zipClose(static_cast<zipFile>(handle_), nullptr);
    handle_ = nullptr;
    if (rc != ZIP_OK) {
        abort();
        throw IOError(fmt::format("Failed to close archive (minizip {})", rc),
                      ErrorContext(tempPath_.string()));
    }

    syncFile(tempPath_);

    // Atomic rename: temp -> final
    std::error_code ec;
    fs::rename(tempPath_, outputPath_, ec);
    if (ec) {
        abort();
        throw IOError("Failed to rename temporary file to final output", ec,
                      ErrorContext(outputPath_.string()));
    }

    finalized_ = true;

    CADVC_LOG_DEBUG("ZIP archive finalized: {}, members={}", outputPath_.string(), memberCount_);
}

void ZipWriter::abort() noexcept {
    if (aborted_) {
        return;  // Already aborted
    }
    aborted_ = true;

    if (handle_ != nullptr) {
        zipClose(static_cast<zipFile>(handle_), nullptr);
        handle_ = nullptr;
    }

    std::error_code ec;
    fs::remove(tempPath_, ec);

    CADVC_LOG_DEBUG("ZipWriter aborted: {}", tempPath_.string());
}

}  // namespace cadvc::format
