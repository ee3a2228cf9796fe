// =============================================================================
// cadvc - ZIP Reader Implementation
// =============================================================================
// minizip-backed reader plus the raw deflate helper shared with the writer.
// =============================================================================

#include "cadvc/format/zip_archive.h"

#include <algorithm>
#include <climits>

#include <fmt/format.h>
#include <minizip/unzip.h>
#include <zlib.h>

#include "cadvc/common/logger.h"
#include "cadvc/io/file_io.h"

namespace cadvc::format {

namespace {

namespace fs = std::filesystem;

/// @brief Read buffer size for member inflation.
constexpr std::size_t kReadBufferSize = 64 * 1024;

/// @brief Output buffer size for raw deflate.
constexpr std::size_t kDeflateBufferSize = 256 * 1024;

/// @brief Largest input slice handed to zlib in one call.
constexpr std::size_t kMaxZlibInput = 1U << 30;

}  // namespace

// =============================================================================
// Member Helpers
// =============================================================================

DeflatedMember deflateMember(std::string name, std::span<const std::uint8_t> data,
                             CompressionLevel level) {
    DeflatedMember member;
    member.name = std::move(name);
    member.uncompressedSize = data.size();
    member.level = level;
    member.crc32 = static_cast<std::uint32_t>(crc32_z(0L, data.data(), data.size()));

    if (level == 0) {
        member.method = kMethodStored;
        member.payload.assign(data.begin(), data.end());
        return member;
    }

    member.method = kMethodDeflate;

    z_stream strm{};
    int rc = deflateInit2(&strm, static_cast<int>(level), Z_DEFLATED, -MAX_WBITS, 8,
                          Z_DEFAULT_STRATEGY);
    if (rc != Z_OK) {
        throw IOError(fmt::format("deflateInit2 failed for {} (zlib {})", member.name, rc));
    }

    std::vector<std::uint8_t> buffer(kDeflateBufferSize);
    std::size_t offset = 0;
    int flush = Z_NO_FLUSH;
    do {
        const std::size_t slice = std::min(kMaxZlibInput, data.size() - offset);
        strm.next_in = const_cast<Bytef*>(data.data() + offset);
        strm.avail_in = static_cast<uInt>(slice);
        offset += slice;
        flush = offset == data.size() ? Z_FINISH : Z_NO_FLUSH;

        do {
            strm.next_out = buffer.data();
            strm.avail_out = static_cast<uInt>(buffer.size());
            rc = deflate(&strm, flush);
            if (rc == Z_STREAM_ERROR) {
                deflateEnd(&strm);
                throw IOError(fmt::format("deflate failed for {}", member.name));
            }
            const std::size_t produced = buffer.size() - strm.avail_out;
            member.payload.insert(member.payload.end(), buffer.begin(),
                                  buffer.begin() + static_cast<std::ptrdiff_t>(produced));
        } while (strm.avail_out == 0);
    } while (flush != Z_FINISH);

    deflateEnd(&strm);
    return member;
}

bool isSafeMemberName(std::string_view name) noexcept {
    if (name.empty()) {
        return false;
    }
    if (name.front() == '/' || name.front() == '\\') {
        return false;
    }
    if (name.size() >= 2 && name[1] == ':') {
        return false;
    }

    std::size_t start = 0;
    while (start <= name.size()) {
        std::size_t end = name.find_first_of("/\\", start);
        if (end == std::string_view::npos) {
            end = name.size();
        }
        if (name.substr(start, end - start) == "..") {
            return false;
        }
        start = end + 1;
    }
    return true;
}

// =============================================================================
// ZipReader Implementation
// =============================================================================

ZipReader::ZipReader(fs::path path) : path_(std::move(path)) {
    std::error_code ec;
    if (!fs::is_regular_file(path_, ec)) {
        throw IOError("Cannot open archive",
                      ec ? ec : std::make_error_code(std::errc::no_such_file_or_directory),
                      ErrorContext(path_.string()));
    }

    handle_ = unzOpen64(path_.c_str());
    if (handle_ == nullptr) {
        throw FormatError("Not a readable ZIP container", ErrorContext(path_.string()));
    }

    try {
        loadDirectory();
    } catch (...) {
        unzClose(static_cast<unzFile>(handle_));
        handle_ = nullptr;
        throw;
    }

    CADVC_LOG_DEBUG("ZipReader opened {} ({} members)", path_.string(), entries_.size());
}

ZipReader::~ZipReader() {
    if (handle_ != nullptr) {
        unzClose(static_cast<unzFile>(handle_));
        handle_ = nullptr;
    }
}

ZipReader::ZipReader(ZipReader&& other) noexcept
    : path_(std::move(other.path_)),
      handle_(std::exchange(other.handle_, nullptr)),
      entries_(std::move(other.entries_)) {}

void ZipReader::loadDirectory() {
    auto* zf = static_cast<unzFile>(handle_);

    int rc = unzGoToFirstFile(zf);
    while (rc == UNZ_OK) {
        unz_file_info64 info{};
        if (unzGetCurrentFileInfo64(zf, &info, nullptr, 0, nullptr, 0, nullptr, 0) != UNZ_OK) {
            throw FormatError("Cannot read central directory entry", ErrorContext(path_.string()));
        }

        std::string name(info.size_filename, '\0');
        if (unzGetCurrentFileInfo64(zf, &info, name.data(), static_cast<uLong>(name.size()),
                                    nullptr, 0, nullptr, 0) != UNZ_OK) {
            throw FormatError("Cannot read member name", ErrorContext(path_.string()));
        }

        ZipEntry entry;
        entry.name = std::move(name);
        entry.uncompressedSize = info.uncompressed_size;
        entry.compressedSize = info.compressed_size;
        entry.crc32 = static_cast<std::uint32_t>(info.crc);
        entry.method = static_cast<int>(info.compression_method);
        entries_.push_back(std::move(entry));

        rc = unzGoToNextFile(zf);
    }

    if (rc != UNZ_END_OF_LIST_OF_FILE) {
        throw FormatError(fmt::format("Central directory is damaged (minizip {})", rc),
                          ErrorContext(path_.string()));
    }
}

std::vector<std::uint8_t> ZipReader::read(std::string_view name) {
    auto* zf = static_cast<unzFile>(handle_);
    const std::string key(name);

    if (unzLocateFile(zf, key.c_str(), 1) != UNZ_OK) {
        throw FormatError("Member not found", ErrorContext(path_.string()).withMember(key));
    }

    unz_file_info64 info{};
    if (unzGetCurrentFileInfo64(zf, &info, nullptr, 0, nullptr, 0, nullptr, 0) != UNZ_OK) {
        throw FormatError("Cannot read member header",
                          ErrorContext(path_.string()).withMember(key));
    }

    if (unzOpenCurrentFile(zf) != UNZ_OK) {
        throw FormatError("Cannot open member", ErrorContext(path_.string()).withMember(key));
    }

    std::vector<std::uint8_t> data;
    data.reserve(static_cast<std::size_t>(info.uncompressed_size));

    std::vector<std::uint8_t> buffer(kReadBufferSize);
    for (;;) {
        int n = unzReadCurrentFile(zf, buffer.data(), static_cast<unsigned>(buffer.size()));
        if (n < 0) {
            unzCloseCurrentFile(zf);
            throw FormatError(fmt::format("Member data is corrupt (minizip {})", n),
                              ErrorContext(path_.string()).withMember(key));
        }
        if (n == 0) {
            break;
        }
        data.insert(data.end(), buffer.begin(), buffer.begin() + n);
    }

    if (unzCloseCurrentFile(zf) == UNZ_CRCERROR) {
        throw FormatError("Member CRC mismatch", ErrorContext(path_.string()).withMember(key));
    }

    return data;
}

std::size_t ZipReader::extractAll(const fs::path& destination,
                                  const std::function<bool(const ZipEntry&)>& filter) {
    // Reject the whole archive before anything is written
    for (const auto& entry : entries_) {
        if (!isSafeMemberName(entry.name)) {
            throw FormatError("Unsafe member path",
                              ErrorContext(path_.string()).withMember(entry.name));
        }
    }

    std::size_t written = 0;
    for (const auto& entry : entries_) {
        if (filter && !filter(entry)) {
            continue;
        }

        const fs::path target = destination / fs::path(entry.name).relative_path();
        std::error_code ec;

        if (entry.isDirectory()) {
            fs::create_directories(target, ec);
            if (ec) {
                throw IOError("Cannot create directory", ec, ErrorContext(target.string()));
            }
            continue;
        }

        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            throw IOError("Cannot create directory", ec,
                          ErrorContext(target.parent_path().string()));
        }

        io::writeFileBytes(target, read(entry.name));
        ++written;
    }

    return written;
}

}  // namespace cadvc::format
