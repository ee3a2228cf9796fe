// =============================================================================
// cadvc - Path Glob Matching Implementation
// =============================================================================

#include "cadvc/algo/glob.h"

#include <vector>

#include <fnmatch.h>

namespace cadvc::algo {

namespace {

std::vector<std::string> splitComponents(std::string_view path) {
    std::vector<std::string> parts;
    std::size_t start = 0;
    while (start <= path.size()) {
        std::size_t end = path.find('/', start);
        if (end == std::string_view::npos) {
            end = path.size();
        }
        if (end > start) {
            std::string_view part = path.substr(start, end - start);
            if (part != ".") {
                parts.emplace_back(part);
            }
        }
        start = end + 1;
    }
    return parts;
}

}  // namespace

bool matchPath(std::string_view relPath, std::string_view pattern) {
    if (pattern.empty()) {
        return false;
    }

    const bool anchored = pattern.front() == '/';
    const auto patternParts = splitComponents(pattern);
    const auto pathParts = splitComponents(relPath);

    if (patternParts.empty() || patternParts.size() > pathParts.size()) {
        return false;
    }
    if (anchored && patternParts.size() != pathParts.size()) {
        return false;
    }

    const std::size_t offset = pathParts.size() - patternParts.size();
    for (std::size_t i = 0; i < patternParts.size(); ++i) {
        if (::fnmatch(patternParts[i].c_str(), pathParts[offset + i].c_str(), 0) != 0) {
            return false;
        }
    }
    return true;
}

bool matchAny(std::string_view relPath, std::span<const std::string> patterns) {
    for (const auto& pattern : patterns) {
        if (matchPath(relPath, pattern)) {
            return true;
        }
    }
    return false;
}

std::string posixRelative(const std::filesystem::path& path, const std::filesystem::path& base) {
    return path.lexically_relative(base).generic_string();
}

}  // namespace cadvc::algo
