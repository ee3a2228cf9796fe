// =============================================================================
// cadvc - Command Support
// =============================================================================
// Helpers shared by the command handlers: path resolution against the
// invocation directory and the acting user.
// =============================================================================

#ifndef CADVC_COMMANDS_COMMAND_SUPPORT_H
#define CADVC_COMMANDS_COMMAND_SUPPORT_H

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "cadvc/common/error.h"

namespace cadvc::vcs {
class VcsClient;
}  // namespace cadvc::vcs

namespace cadvc::commands {

/// @brief Absolute, symlink-resolved form of a command line path.
[[nodiscard]] std::filesystem::path resolveUserPath(const std::filesystem::path& path);

/// @brief Repository root for this invocation.
/// @param explicitRoot Value of -C, if given.
/// @return -C, else the enclosing git working tree, else the current directory.
[[nodiscard]] std::filesystem::path resolveRepoRoot(
    const std::optional<std::filesystem::path>& explicitRoot);

/// @brief Acting user: the override if non-empty, else git's user.name.
/// @return kUsageError if neither is available.
[[nodiscard]] Result<std::string> resolveActor(vcs::VcsClient& vcs,
                                               const std::optional<std::string>& override);

/// @brief Log and print a failed Result; returns its exit code.
int reportError(const Error& error, std::string_view action);

}  // namespace cadvc::commands

#endif  // CADVC_COMMANDS_COMMAND_SUPPORT_H
