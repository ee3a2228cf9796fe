// =============================================================================
// cadvc - Repository Configuration Implementation
// =============================================================================
// yaml-cpp based loader for native and legacy configuration files.
// =============================================================================

#include "cadvc/common/config.h"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <limits>
#include <sstream>

#include <fmt/format.h>
#include <yaml-cpp/yaml.h>

#include "cadvc/common/logger.h"
#include "cadvc/format/zip_archive.h"

namespace cadvc {

namespace {

namespace fs = std::filesystem;

/// @brief Look up a map child without throwing on non-map nodes.
YAML::Node child(const YAML::Node& parent, const char* key) {
    if (!parent.IsDefined() || !parent.IsMap()) {
        return YAML::Node(YAML::NodeType::Undefined);
    }
    return parent[key];
}

/// @brief Assign a scalar field, keeping the default on conversion failure.
template <typename T>
void readField(const YAML::Node& parent, const char* key, T& out) {
    YAML::Node node = child(parent, key);
    if (!node.IsDefined() || node.IsNull()) {
        return;
    }
    try {
        out = node.as<T>();
    } catch (const YAML::BadConversion& ex) {
        CADVC_LOG_WARNING("Config field '{}' is malformed ({}), using default", key, ex.what());
    }
}

void readPatterns(const YAML::Node& parent, const char* key, std::vector<std::string>& out) {
    YAML::Node node = child(parent, key);
    if (!node.IsDefined() || node.IsNull()) {
        return;
    }
    if (!node.IsSequence()) {
        CADVC_LOG_WARNING("Config field '{}' must be a list, using default", key);
        return;
    }
    std::vector<std::string> patterns;
    patterns.reserve(node.size());
    for (const auto& item : node) {
        if (!item.IsScalar()) {
            CADVC_LOG_WARNING("Config field '{}' contains a non-string entry, using default", key);
            return;
        }
        patterns.push_back(item.Scalar());
    }
    out = std::move(patterns);
}

void readLevel(const YAML::Node& parent, const char* key, CompressionLevel& out) {
    int level = out;
    readField(parent, key, level);
    if (level < kMinCompressionLevel || level > kMaxCompressionLevel) {
        int clamped = std::clamp(level, static_cast<int>(kMinCompressionLevel),
                                 static_cast<int>(kMaxCompressionLevel));
        CADVC_LOG_WARNING("Config field '{}' = {} out of range, clamped to {}", key, level,
                          clamped);
        level = clamped;
    }
    out = static_cast<CompressionLevel>(level);
}

void readCapGb(const YAML::Node& parent, const char* key, std::uint64_t& out) {
    double gb = static_cast<double>(out) / static_cast<double>(kBytesPerGigabyte);
    readField(parent, key, gb);
    if (!(gb > 0.0) || !std::isfinite(gb)) {
        CADVC_LOG_WARNING("Config field '{}' must be a positive number, using default", key);
        return;
    }
    const double bytes = gb * static_cast<double>(kBytesPerGigabyte);
    if (bytes >= static_cast<double>(std::numeric_limits<std::uint64_t>::max())) {
        CADVC_LOG_WARNING("Config field '{}' is too large, using default", key);
        return;
    }
    const auto cap = static_cast<std::uint64_t>(bytes);
    if (cap <= format::kMinArchiveSize) {
        CADVC_LOG_WARNING("Config field '{}' leaves no room for archive members, using default",
                          key);
        return;
    }
    out = cap;
}

/// @brief Nested form written by the shell-script era tooling.
void applyLegacy(const YAML::Node& root, RepositoryConfig& config) {
    readField(root, "require-lock-to-modify-FreeCAD-files", config.requireLock);
    readField(root, "include-thumbnails", config.includeThumbnails);

    YAML::Node layout = child(root, "uncompressed-directory-structure");
    readField(layout, "uncompressed-directory-suffix", config.uncompressedSuffix);
    readField(layout, "uncompressed-directory-prefix", config.uncompressedPrefix);

    YAML::Node subdir = child(layout, "subdirectory");
    readField(subdir, "put-uncompressed-directory-in-subdirectory", config.subdirectoryMode);
    readField(subdir, "subdirectory-name", config.subdirectoryName);

    YAML::Node chunking = child(root, "compress-non-human-readable-FreeCAD-files");
    readField(chunking, "enabled", config.compressBinaries);
    readPatterns(chunking, "files-to-compress", config.binaryPatterns);
    readCapGb(chunking, "max-compressed-file-size-gigabyte", config.maxChunkBytes);
    readLevel(chunking, "compression-level", config.compressionLevel);
    readField(chunking, "zip-file-prefix", config.chunkPrefix);
}

void applyNative(const YAML::Node& root, RepositoryConfig& config) {
    readField(root, "uncompressed_suffix", config.uncompressedSuffix);
    readField(root, "uncompressed_prefix", config.uncompressedPrefix);
    readField(root, "subdirectory_mode", config.subdirectoryMode);
    readField(root, "subdirectory_name", config.subdirectoryName);
    readField(root, "include_thumbnails", config.includeThumbnails);
    readField(root, "require_lock", config.requireLock);
    readField(root, "compress_binaries", config.compressBinaries);
    readPatterns(root, "binary_patterns", config.binaryPatterns);
    readCapGb(root, "max_compressed_size_gb", config.maxChunkBytes);
    readLevel(root, "compression_level", config.compressionLevel);
    readField(root, "zip_file_prefix", config.chunkPrefix);
}

}  // namespace

// =============================================================================
// Parsing
// =============================================================================

Result<RepositoryConfig> parseConfig(std::string_view text) {
    YAML::Node root;
    try {
        root = YAML::Load(std::string(text));
    } catch (const YAML::Exception& ex) {
        return makeError<RepositoryConfig>(ErrorCode::kConfigInvalid,
                                           fmt::format("Cannot parse config: {}", ex.what()));
    }

    RepositoryConfig config;
    if (root.IsNull()) {
        return config;
    }
    if (!root.IsMap()) {
        return makeError<RepositoryConfig>(ErrorCode::kConfigInvalid,
                                           "Config root must be an object");
    }

    applyLegacy(root, config);
    applyNative(root, config);

    if (config.chunkPrefix.empty()) {
        CADVC_LOG_WARNING("Config chunk prefix is empty, using default");
        config.chunkPrefix = RepositoryConfig{}.chunkPrefix;
    }
    return config;
}

fs::path configFilePath(const fs::path& repoRoot) {
    std::error_code ec;
    fs::path native = repoRoot / kConfigRelPath;
    if (fs::exists(native, ec)) {
        return native;
    }
    fs::path legacy = repoRoot / kLegacyConfigRelPath;
    if (fs::exists(legacy, ec)) {
        return legacy;
    }
    return native;
}

bool hasConfig(const fs::path& repoRoot) {
    std::error_code ec;
    return fs::exists(repoRoot / kConfigRelPath, ec) ||
           fs::exists(repoRoot / kLegacyConfigRelPath, ec);
}

RepositoryConfig loadConfig(const fs::path& repoRoot) {
    const fs::path path = configFilePath(repoRoot);

    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        CADVC_LOG_DEBUG("No config at {}, using defaults", path.string());
        return RepositoryConfig{};
    }

    std::ostringstream buffer;
    buffer << in.rdbuf();

    auto parsed = parseConfig(buffer.str());
    if (!parsed) {
        CADVC_LOG_WARNING("{} ({}), using defaults", parsed.error().message(), path.string());
        return RepositoryConfig{};
    }

    CADVC_LOG_DEBUG("Loaded config from {}", path.string());
    return std::move(*parsed);
}

// =============================================================================
// Saving
// =============================================================================

std::string serializeConfig(const RepositoryConfig& config) {
    YAML::Emitter out;
    out.SetStringFormat(YAML::DoubleQuoted);
    out.SetMapFormat(YAML::Flow);
    out.SetSeqFormat(YAML::Flow);
    out.SetBoolFormat(YAML::TrueFalseBool);

    out << YAML::BeginMap;
    out << YAML::Key << "uncompressed_suffix" << YAML::Value << config.uncompressedSuffix;
    out << YAML::Key << "uncompressed_prefix" << YAML::Value << config.uncompressedPrefix;
    out << YAML::Key << "subdirectory_mode" << YAML::Value << config.subdirectoryMode;
    out << YAML::Key << "subdirectory_name" << YAML::Value << config.subdirectoryName;
    out << YAML::Key << "include_thumbnails" << YAML::Value << config.includeThumbnails;
    out << YAML::Key << "require_lock" << YAML::Value << config.requireLock;
    out << YAML::Key << "compress_binaries" << YAML::Value << config.compressBinaries;
    out << YAML::Key << "binary_patterns" << YAML::Value << config.binaryPatterns;
    out << YAML::Key << "max_compressed_size_gb" << YAML::Value << config.maxChunkSizeGb();
    out << YAML::Key << "compression_level" << YAML::Value
        << static_cast<int>(config.compressionLevel);
    out << YAML::Key << "zip_file_prefix" << YAML::Value << config.chunkPrefix;
    out << YAML::EndMap;

    return std::string(out.c_str()) + "\n";
}

VoidResult saveConfig(const fs::path& repoRoot, const RepositoryConfig& config) {
    const fs::path path = repoRoot / kConfigRelPath;

    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        return std::unexpected(errorFromSystem("Cannot create " + path.parent_path().string(), ec));
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return makeVoidError(ErrorCode::kIOError, "Cannot write " + path.string());
    }
    out << serializeConfig(config);
    out.flush();
    if (!out.good()) {
        return makeVoidError(ErrorCode::kIOError, "Failed to write " + path.string());
    }

    CADVC_LOG_INFO("Wrote config {}", path.string());
    return makeVoidSuccess();
}

// =============================================================================
// Path Helpers
// =============================================================================

fs::path uncompressedDirFor(const fs::path& repoRoot, const fs::path& archive,
                            const RepositoryConfig& config) {
    const fs::path absolute = archive.is_absolute() ? archive : repoRoot / archive;

    fs::path dir = absolute.parent_path();
    if (config.subdirectoryMode) {
        dir /= config.subdirectoryName;
    }
    return dir / (config.uncompressedPrefix + absolute.stem().string() + config.uncompressedSuffix);
}

std::optional<fs::path> findRepoRoot(const fs::path& start) {
    std::error_code ec;
    fs::path dir = fs::absolute(start, ec);
    if (ec) {
        return std::nullopt;
    }
    if (!fs::is_directory(dir, ec)) {
        dir = dir.parent_path();
    }

    while (!dir.empty()) {
        if (fs::exists(dir / ".git", ec)) {
            return dir;
        }
        fs::path parent = dir.parent_path();
        if (parent == dir) {
            break;
        }
        dir = std::move(parent);
    }
    return std::nullopt;
}

}  // namespace cadvc
