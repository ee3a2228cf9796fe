// =============================================================================
// cadvc - Chunk Packer Implementation
// =============================================================================
// Greedy bin-packing of tree files into size-capped chunk archives.
// =============================================================================

#include "cadvc/algo/chunk_packer.h"

#include <algorithm>
#include <charconv>

#include <fmt/format.h>

#include "cadvc/algo/glob.h"
#include "cadvc/common/logger.h"
#include "cadvc/format/zip_archive.h"
#include "cadvc/io/file_io.h"

namespace cadvc::algo {

namespace {

namespace fs = std::filesystem;

/// @brief Fixed bytes every chunk archive carries besides its members.
constexpr std::uint64_t kArchiveOverhead = format::kMinArchiveSize;

constexpr std::string_view kChunkExtension = ".zip";
constexpr std::string_view kTempExtension = ".tmp";

bool isMarkerFile(std::string_view name) noexcept {
    return name == kChangeFileName || name == kLockFileName;
}

}  // namespace

// =============================================================================
// ChunkPackerConfig Implementation
// =============================================================================

ChunkPackerConfig ChunkPackerConfig::fromRepository(const RepositoryConfig& config) {
    ChunkPackerConfig result;
    result.patterns = config.binaryPatterns;
    result.maxChunkBytes = config.maxChunkBytes;
    result.compressionLevel = config.compressionLevel;
    result.chunkPrefix = config.chunkPrefix;
    return result;
}

VoidResult ChunkPackerConfig::validate() const {
    if (chunkPrefix.empty()) {
        return makeVoidError(ErrorCode::kConfigInvalid, "Chunk prefix must not be empty");
    }
    if (chunkPrefix.find('/') != std::string::npos) {
        return makeVoidError(ErrorCode::kConfigInvalid, "Chunk prefix must be a plain file name");
    }
    if (compressionLevel > kMaxCompressionLevel) {
        return makeVoidError(ErrorCode::kConfigInvalid,
                             fmt::format("Compression level {} out of range 0-9",
                                         static_cast<int>(compressionLevel)));
    }
    if (maxChunkBytes <= kArchiveOverhead) {
        return makeVoidError(ErrorCode::kConfigInvalid,
                             fmt::format("Chunk cap of {} bytes is too small", maxChunkBytes));
    }
    return makeVoidSuccess();
}

// =============================================================================
// ChunkPacker Implementation
// =============================================================================

ChunkPacker::ChunkPacker(ChunkPackerConfig config) : config_(std::move(config)) {}

std::optional<std::uint32_t> ChunkPacker::chunkIndexOf(std::string_view fileName) const {
    const std::string_view prefix = config_.chunkPrefix;
    if (fileName.size() <= prefix.size() + kChunkExtension.size() ||
        !fileName.starts_with(prefix) || !fileName.ends_with(kChunkExtension)) {
        return std::nullopt;
    }

    const std::string_view digits = fileName.substr(
        prefix.size(), fileName.size() - prefix.size() - kChunkExtension.size());
    if (!std::all_of(digits.begin(), digits.end(), [](char c) { return c >= '0' && c <= '9'; })) {
        return std::nullopt;
    }

    std::uint32_t index = 0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), index);
    if (ec != std::errc{} || ptr != digits.data() + digits.size() || index == 0) {
        return std::nullopt;
    }
    return index;
}

bool ChunkPacker::isChunkArtifact(std::string_view fileName) const {
    if (chunkIndexOf(fileName).has_value()) {
        return true;
    }
    if (fileName.ends_with(kTempExtension)) {
        return chunkIndexOf(fileName.substr(0, fileName.size() - kTempExtension.size()))
            .has_value();
    }
    return false;
}

std::string ChunkPacker::chunkFileName(std::uint32_t index) const {
    return fmt::format("{}{}{}", config_.chunkPrefix, index, kChunkExtension);
}

std::vector<fs::path> ChunkPacker::collectCandidates(const fs::path& treeRoot) const {
    std::vector<std::pair<std::string, fs::path>> found;

    for (const auto& entry : fs::recursive_directory_iterator(treeRoot)) {
        if (entry.is_symlink() || !entry.is_regular_file()) {
            continue;
        }
        const std::string name = entry.path().filename().string();
        if (isMarkerFile(name) || isChunkArtifact(name)) {
            continue;
        }
        std::string rel = posixRelative(entry.path(), treeRoot);
        if (matchAny(rel, config_.patterns)) {
            found.emplace_back(std::move(rel), entry.path());
        }
    }

    std::sort(found.begin(), found.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });

    std::vector<fs::path> candidates;
    candidates.reserve(found.size());
    for (auto& [rel, path] : found) {
        candidates.push_back(std::move(path));
    }
    return candidates;
}

std::vector<ChunkFile> ChunkPacker::findChunks(const fs::path& treeRoot) const {
    std::vector<ChunkFile> chunks;

    std::error_code ec;
    if (!fs::is_directory(treeRoot, ec)) {
        return chunks;
    }

    for (const auto& entry : fs::directory_iterator(treeRoot)) {
        if (!entry.is_regular_file()) {
            continue;
        }
        if (auto index = chunkIndexOf(entry.path().filename().string())) {
            chunks.push_back(ChunkFile{*index, entry.path()});
        }
    }

    std::sort(chunks.begin(), chunks.end(),
              [](const ChunkFile& a, const ChunkFile& b) { return a.index < b.index; });
    return chunks;
}

// =============================================================================
// Packing
// =============================================================================

Result<PackResult> ChunkPacker::pack(const fs::path& treeRoot) const {
    if (auto valid = config_.validate(); !valid) {
        return std::unexpected(valid.error());
    }
    return tryExecute([&] { return packImpl(treeRoot); });
}

PackResult ChunkPacker::packImpl(const fs::path& treeRoot) const {
    if (!findChunks(treeRoot).empty()) {
        throw UsageError("Tree already contains chunk archives; unpack or clear it first",
                         ErrorContext(treeRoot.string()));
    }

    const auto candidates = collectCandidates(treeRoot);
    PackResult result;

    if (candidates.empty()) {
        CADVC_LOG_DEBUG("No chunk candidates in {}", treeRoot.string());
        return result;
    }

    CADVC_LOG_INFO("Packing {} binary files from {}", candidates.size(), treeRoot.string());

    std::uint32_t nextIndex = 1;
    std::vector<format::DeflatedMember> pending;
    std::vector<fs::path> pendingSources;
    std::uint64_t projected = kArchiveOverhead;

    auto flush = [&]() {
        const fs::path target = treeRoot / chunkFileName(nextIndex);

        format::ZipWriter writer(target);
        for (const auto& member : pending) {
            writer.addMember(member);
        }
        writer.finalize();

        const auto actual = fs::file_size(target);
        if (actual > config_.maxChunkBytes) {
            throw CadvcException(ErrorCode::kInternal,
                                 fmt::format("Chunk is {} bytes, over the {} byte cap", actual,
                                             config_.maxChunkBytes),
                                 ErrorContext(target.string()).withChunk(nextIndex));
        }

        // Sources go only after their archive is in place
        for (const auto& source : pendingSources) {
            fs::remove(source);
        }

        CADVC_LOG_DEBUG("Chunk {} written: {} members, {} bytes", target.string(), pending.size(),
                        actual);

        result.chunks.push_back(target);
        result.packedFiles += pendingSources.size();
        ++nextIndex;
        pending.clear();
        pendingSources.clear();
        projected = kArchiveOverhead;
    };

    for (const auto& source : candidates) {
        const auto data = io::readFileBytes(source);
        auto member = format::deflateMember(posixRelative(source, treeRoot), data,
                                            config_.compressionLevel);
        const std::uint64_t added = member.projectedSize();

        // Overflow: flush what we have, then retry against an empty archive
        if (projected + added > config_.maxChunkBytes && !pending.empty()) {
            flush();
        }
        if (projected + added > config_.maxChunkBytes) {
            throw CadvcException(
                ErrorCode::kFileTooLarge,
                fmt::format("Max chunk size {:.2f} GB at compression level {} is too small "
                            "for '{}' ({} bytes, {} compressed)",
                            static_cast<double>(config_.maxChunkBytes) /
                                static_cast<double>(kBytesPerGigabyte),
                            static_cast<int>(config_.compressionLevel), member.name,
                            data.size(), member.payload.size()),
                ErrorContext(source.string()));
        }

        projected += added;
        pending.push_back(std::move(member));
        pendingSources.push_back(source);
    }

    if (!pending.empty()) {
        flush();
    }

    CADVC_LOG_INFO("Packed {} files into {} chunk archive(s)", result.packedFiles,
                   result.chunks.size());
    return result;
}

// =============================================================================
// Unpacking
// =============================================================================

Result<UnpackResult> ChunkPacker::unpack(const fs::path& treeRoot) const {
    return tryExecute([&] { return unpackImpl(treeRoot); });
}

UnpackResult ChunkPacker::unpackImpl(const fs::path& treeRoot) const {
    UnpackResult result;
    const auto chunks = findChunks(treeRoot);

    std::uint32_t expected = 1;
    for (const auto& chunk : chunks) {
        while (expected < chunk.index) {
            result.missingIndices.push_back(expected++);
        }
        expected = chunk.index + 1;
    }
    if (!result.missingIndices.empty()) {
        CADVC_LOG_WARNING("Chunk sequence in {} has {} gap(s), first missing: {}",
                          treeRoot.string(), result.missingIndices.size(),
                          chunkFileName(result.missingIndices.front()));
    }

    for (const auto& chunk : chunks) {
        format::ZipReader reader(chunk.path);
        result.restoredFiles += reader.extractAll(treeRoot);
        ++result.chunkCount;
    }

    if (result.chunkCount > 0) {
        CADVC_LOG_INFO("Restored {} files from {} chunk archive(s)", result.restoredFiles,
                       result.chunkCount);
    }
    return result;
}

}  // namespace cadvc::algo
