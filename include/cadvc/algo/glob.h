// =============================================================================
// cadvc - Path Glob Matching
// =============================================================================
// Glob matching of tree-relative POSIX paths against the configured binary
// patterns.
//
// Matching rules:
// - A relative pattern is anchored at the right: its components are matched
//   against the last components of the path ("*.brp" matches "a/b/x.brp",
//   "no_extension/*" matches "no_extension/Shape").
// - A pattern starting with '/' must match the whole path.
// - Each component is matched with fnmatch(3); '*' never crosses '/'.
// =============================================================================

#ifndef CADVC_ALGO_GLOB_H
#define CADVC_ALGO_GLOB_H

#include <filesystem>
#include <span>
#include <string>
#include <string_view>

namespace cadvc::algo {

/// @brief Match a relative POSIX path against one pattern.
/// @param relPath Tree-relative path using '/' separators.
/// @param pattern Glob pattern.
[[nodiscard]] bool matchPath(std::string_view relPath, std::string_view pattern);

/// @brief Match a relative POSIX path against any of several patterns.
[[nodiscard]] bool matchAny(std::string_view relPath, std::span<const std::string> patterns);

/// @brief Express path relative to base with '/' separators.
[[nodiscard]] std::string posixRelative(const std::filesystem::path& path,
                                        const std::filesystem::path& base);

}  // namespace cadvc::algo

#endif  // CADVC_ALGO_GLOB_H
