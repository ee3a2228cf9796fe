// =============================================================================
// cadvc - Command Support Implementation
// =============================================================================

#include "command_support.h"

#include <iostream>

#include <fmt/format.h>

#include "cadvc/common/config.h"
#include "cadvc/common/logger.h"
#include "cadvc/vcs/vcs_client.h"

namespace cadvc::commands {

namespace fs = std::filesystem;

fs::path resolveUserPath(const fs::path& path) {
    std::error_code ec;
    fs::path absolute = fs::absolute(path, ec);
    if (ec) {
        return path;
    }
    fs::path canonical = fs::weakly_canonical(absolute, ec);
    return ec ? absolute.lexically_normal() : canonical;
}

fs::path resolveRepoRoot(const std::optional<fs::path>& explicitRoot) {
    if (explicitRoot.has_value()) {
        return resolveUserPath(*explicitRoot);
    }

    std::error_code ec;
    const fs::path cwd = fs::current_path(ec);
    if (auto root = vcs::GitClient::discoverRoot(cwd)) {
        return resolveUserPath(*root);
    }
    if (auto root = findRepoRoot(cwd)) {
        return resolveUserPath(*root);
    }
    return resolveUserPath(cwd);
}

Result<std::string> resolveActor(vcs::VcsClient& vcs, const std::optional<std::string>& override) {
    if (override.has_value() && !override->empty()) {
        return *override;
    }
    auto name = vcs.userName();
    if (!name) {
        return std::unexpected(name.error());
    }
    if (!name->has_value()) {
        return makeError<std::string>(ErrorCode::kUsageError,
                                      "git config user.name is not set; set it or pass --user");
    }
    return **name;
}

int reportError(const Error& error, std::string_view action) {
    CADVC_LOG_DEBUG("{} failed ({}): {}", action, errorCodeToString(error.code()), error.message());
    std::cerr << fmt::format("Error: {}\n", error.message());
    return error.exitCode();
}

}  // namespace cadvc::commands
