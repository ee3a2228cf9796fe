// =============================================================================
// cadvc - Archive Transformer Implementation
// =============================================================================

#include "cadvc/transform/archive_transformer.h"

#include <algorithm>
#include <cerrno>
#include <ctime>
#include <utility>
#include <vector>

#include <unistd.h>

#include <fmt/format.h>

#include "cadvc/algo/chunk_packer.h"
#include "cadvc/algo/glob.h"
#include "cadvc/common/logger.h"
#include "cadvc/format/zip_archive.h"
#include "cadvc/io/file_io.h"

namespace cadvc::transform {

namespace {

namespace fs = std::filesystem;

/// @brief Member folder FreeCAD uses for preview images.
constexpr std::string_view kThumbnailDir = "thumbnails/";

/// @brief Deflate level of rebuilt archives (FreeCAD's own default).
constexpr CompressionLevel kArchiveLevel = kDefaultCompressionLevel;

bool hasNoExtension(std::string_view name) noexcept {
    return name.find('.') == std::string_view::npos;
}

/// @brief Check that an archive can be exported before touching the tree.
VoidResult validateArchive(const fs::path& archive) {
    std::error_code ec;
    const auto status = fs::status(archive, ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        return std::unexpected(errorFromSystem("Cannot access " + archive.string(), ec));
    }
    if (!fs::exists(status)) {
        return makeVoidError(ErrorCode::kNotFound, "Archive not found: " + archive.string());
    }
    if (!hasArchiveExtension(archive.filename().string()) || fs::is_directory(status)) {
        return makeVoidError(ErrorCode::kWrongFileType,
                             "Not a .FCStd file: " + archive.string());
    }
    if (::access(archive.c_str(), R_OK) != 0) {
        return std::unexpected(errorFromSystem("Cannot read " + archive.string(),
                                               std::error_code(errno, std::generic_category())));
    }
    return makeVoidSuccess();
}

/// @brief Remove everything in a tree except the lock marker.
void clearTree(const fs::path& treeRoot) {
    std::vector<fs::path> doomed;
    for (const auto& entry : fs::directory_iterator(treeRoot)) {
        if (entry.path().filename().string() != kLockFileName) {
            doomed.push_back(entry.path());
        }
    }
    for (const auto& path : doomed) {
        fs::remove_all(path);
    }
    CADVC_LOG_DEBUG("Cleared {} entries from {}", doomed.size(), treeRoot.string());
}

/// @brief True if a tree holds output of an earlier export, complete or not.
bool isPreviousExport(const fs::path& treeRoot, const algo::ChunkPacker& packer) {
    std::error_code ec;
    if (!fs::is_directory(treeRoot, ec)) {
        return false;
    }
    if (fs::exists(treeRoot / kChangeFileName, ec)) {
        return true;
    }
    // A failed pack leaves chunk archives behind without a .changefile
    for (const auto& entry : fs::directory_iterator(treeRoot)) {
        if (packer.isChunkArtifact(entry.path().filename().string())) {
            return true;
        }
    }
    return false;
}

/// @brief Move top-level files without an extension into no_extension/.
std::size_t relocateExtensionless(const fs::path& treeRoot) {
    std::vector<fs::path> toMove;
    for (const auto& entry : fs::directory_iterator(treeRoot)) {
        if (entry.is_regular_file() && hasNoExtension(entry.path().filename().string())) {
            toMove.push_back(entry.path());
        }
    }
    if (toMove.empty()) {
        return 0;
    }

    const fs::path target = treeRoot / kNoExtensionDir;
    fs::create_directories(target);
    for (const auto& path : toMove) {
        fs::rename(path, target / path.filename());
    }

    CADVC_LOG_DEBUG("Moved {} files without extension to {}", toMove.size(), target.string());
    return toMove.size();
}

/// @brief Member name a tree file is written back as.
std::string memberNameFor(const std::string& relPath) {
    const std::string prefix = std::string(kNoExtensionDir) + "/";
    if (relPath.starts_with(prefix) && hasNoExtension(std::string_view(relPath).substr(prefix.size())) &&
        relPath.find('/', prefix.size()) == std::string::npos) {
        return relPath.substr(prefix.size());
    }
    return relPath;
}

std::string trimQuotes(std::string_view value) {
    constexpr std::string_view kStrip = " \t\r\n'\"";
    const auto first = value.find_first_not_of(kStrip);
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = value.find_last_not_of(kStrip);
    return std::string(value.substr(first, last - first + 1));
}

}  // namespace

// =============================================================================
// Change Indicator
// =============================================================================

std::string formatChangeFile(const ArchiveIdentity& identity,
                             std::chrono::system_clock::time_point exportedAt) {
    const std::time_t seconds = std::chrono::system_clock::to_time_t(exportedAt);
    std::tm utc{};
    gmtime_r(&seconds, &utc);

    char stamp[32] = {};
    std::strftime(stamp, sizeof(stamp), "%Y-%m-%dT%H:%M:%SZ", &utc);

    return fmt::format("File Last Exported On: {}\n{}='{}'\n", stamp, kChangeFileRelpathKey,
                       identity);
}

std::optional<ArchiveIdentity> parseChangeFile(std::string_view content) {
    const std::string key = std::string(kChangeFileRelpathKey) + "=";

    std::size_t start = 0;
    while (start < content.size()) {
        std::size_t end = content.find('\n', start);
        if (end == std::string_view::npos) {
            end = content.size();
        }
        const std::string_view line = content.substr(start, end - start);
        const auto pos = line.find(key);
        if (pos != std::string_view::npos) {
            std::string value = trimQuotes(line.substr(pos + key.size()));
            if (value.empty()) {
                return std::nullopt;
            }
            return value;
        }
        start = end + 1;
    }
    return std::nullopt;
}

std::optional<ArchiveIdentity> readChangeFile(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return std::nullopt;
    }
    auto content = tryExecute([&] { return io::readFileText(path); });
    if (!content) {
        CADVC_LOG_WARNING("Cannot read {}: {}", path.string(), content.error().message());
        return std::nullopt;
    }
    return parseChangeFile(*content);
}

// =============================================================================
// ArchiveTransformer Implementation
// =============================================================================

ArchiveTransformer::ArchiveTransformer(RepositoryConfig config, std::optional<fs::path> repoRoot)
    : config_(std::move(config)), repoRoot_(std::move(repoRoot)) {}

fs::path ArchiveTransformer::resolve(const fs::path& archive) const {
    if (archive.is_absolute()) {
        return archive;
    }
    if (repoRoot_.has_value()) {
        return *repoRoot_ / archive;
    }
    std::error_code ec;
    fs::path absolute = fs::absolute(archive, ec);
    return ec ? archive : absolute;
}

fs::path ArchiveTransformer::repoRootFor(const fs::path& archive) const {
    if (repoRoot_.has_value()) {
        return *repoRoot_;
    }
    const fs::path absolute = resolve(archive);
    if (auto root = findRepoRoot(absolute.parent_path())) {
        return *root;
    }
    return absolute.parent_path();
}

fs::path ArchiveTransformer::treeRootFor(const fs::path& archive) const {
    return uncompressedDirFor(repoRootFor(archive), resolve(archive), config_);
}

ArchiveIdentity ArchiveTransformer::identityOf(const fs::path& archive) const {
    const fs::path root = repoRootFor(archive);
    const fs::path absolute = resolve(archive);

    std::error_code ec;
    fs::path canonicalArchive = fs::weakly_canonical(absolute, ec);
    if (ec) {
        canonicalArchive = absolute.lexically_normal();
    }
    fs::path canonicalRoot = fs::weakly_canonical(root, ec);
    if (ec) {
        canonicalRoot = root.lexically_normal();
    }
    return algo::posixRelative(canonicalArchive, canonicalRoot);
}

Result<ExportResult> ArchiveTransformer::exportArchive(
    const fs::path& archive, const std::optional<fs::path>& treeRoot) const {
    const fs::path source = resolve(archive);
    if (auto valid = validateArchive(source); !valid) {
        return std::unexpected(valid.error());
    }
    const fs::path tree = treeRoot.value_or(treeRootFor(source));
    return tryExecute([&] { return exportImpl(source, tree); });
}

ExportResult ArchiveTransformer::exportImpl(const fs::path& archive,
                                            const fs::path& treeRoot) const {
    CADVC_LOG_INFO("Exporting {} to {}", archive.string(), treeRoot.string());

    // Opening validates the container before the tree is touched
    format::ZipReader reader(archive);

    const algo::ChunkPacker packer(algo::ChunkPackerConfig::fromRepository(config_));
    if (isPreviousExport(treeRoot, packer)) {
        clearTree(treeRoot);
    }
    fs::create_directories(treeRoot);

    ExportResult result;
    result.treeRoot = treeRoot;

    std::size_t skippedThumbnails = 0;
    result.memberCount = reader.extractAll(treeRoot, [&](const format::ZipEntry& entry) {
        if (!config_.includeThumbnails && entry.name.starts_with(kThumbnailDir)) {
            if (!entry.isDirectory()) {
                ++skippedThumbnails;
            }
            return false;
        }
        return true;
    });
    if (skippedThumbnails > 0) {
        CADVC_LOG_DEBUG("Skipped {} thumbnail members", skippedThumbnails);
    }

    result.relocatedCount = relocateExtensionless(treeRoot);

    if (config_.compressBinaries) {
        auto packed = packer.pack(treeRoot);
        if (!packed) {
            packed.error().throwException();
        }
        result.chunkedCount = packed->packedFiles;
        result.chunkCount = packed->chunks.size();
    }

    io::writeFileText(treeRoot / kChangeFileName,
                      formatChangeFile(identityOf(archive), std::chrono::system_clock::now()));

    CADVC_LOG_INFO("Exported {} members to {} ({} in {} chunk archive(s))", result.memberCount,
                   treeRoot.string(), result.chunkedCount, result.chunkCount);
    return result;
}

Result<ImportResult> ArchiveTransformer::importArchive(const fs::path& treeRoot,
                                                       const fs::path& archive) const {
    std::error_code ec;
    if (!fs::is_directory(treeRoot, ec)) {
        if (ec && ec != std::errc::no_such_file_or_directory) {
            return std::unexpected(errorFromSystem("Cannot access " + treeRoot.string(), ec));
        }
        return makeError<ImportResult>(ErrorCode::kNotFound,
                                       "Expanded tree not found: " + treeRoot.string());
    }
    return tryExecute([&] { return importImpl(treeRoot, resolve(archive)); });
}

ImportResult ArchiveTransformer::importImpl(const fs::path& treeRoot,
                                            const fs::path& archive) const {
    CADVC_LOG_INFO("Importing {} to {}", treeRoot.string(), archive.string());

    ImportResult result;
    result.archive = archive;

    algo::ChunkPacker packer(algo::ChunkPackerConfig::fromRepository(config_));
    if (config_.compressBinaries) {
        auto unpacked = packer.unpack(treeRoot);
        if (!unpacked) {
            unpacked.error().throwException();
        }
        result.unchunkedCount = unpacked->restoredFiles;
    }

    std::vector<std::pair<std::string, fs::path>> members;
    for (const auto& entry : fs::recursive_directory_iterator(treeRoot)) {
        if (entry.is_symlink() || !entry.is_regular_file()) {
            continue;
        }
        if (entry.path().parent_path() == treeRoot) {
            const std::string name = entry.path().filename().string();
            if (name == kChangeFileName || name == kLockFileName || packer.isChunkArtifact(name)) {
                continue;
            }
        }
        members.emplace_back(memberNameFor(algo::posixRelative(entry.path(), treeRoot)),
                             entry.path());
    }

    std::sort(members.begin(), members.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });

    if (archive.has_parent_path()) {
        fs::create_directories(archive.parent_path());
    }

    format::ZipWriter writer(archive);
    for (const auto& [name, path] : members) {
        writer.addFile(name, io::readFileBytes(path), kArchiveLevel);
    }
    writer.finalize();

    result.memberCount = writer.memberCount();
    CADVC_LOG_INFO("Imported {} members into {}", result.memberCount, archive.string());
    return result;
}

// =============================================================================
// Convenience Functions
// =============================================================================

namespace {

RepositoryConfig configFor(const fs::path& archive, const std::optional<RepositoryConfig>& config) {
    if (config.has_value()) {
        return *config;
    }
    std::error_code ec;
    const fs::path absolute = fs::absolute(archive, ec);
    if (auto root = findRepoRoot(absolute.parent_path())) {
        return loadConfig(*root);
    }
    return RepositoryConfig{};
}

}  // namespace

Result<ExportResult> exportArchive(const fs::path& archive,
                                   const std::optional<fs::path>& treeRoot,
                                   const std::optional<RepositoryConfig>& config) {
    ArchiveTransformer transformer(configFor(archive, config));
    return transformer.exportArchive(archive, treeRoot);
}

Result<ImportResult> importArchive(const fs::path& treeRoot, const fs::path& archive,
                                   const std::optional<RepositoryConfig>& config) {
    ArchiveTransformer transformer(configFor(archive, config));
    return transformer.importArchive(treeRoot, archive);
}

}  // namespace cadvc::transform
