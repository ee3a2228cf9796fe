// =============================================================================
// cadvc - Install Hooks Command
// =============================================================================
// Writes the five git hook scripts that forward to `cadvc hook <event>`.
// Existing hooks not written by cadvc are left alone unless --force is given.
// =============================================================================

#ifndef CADVC_COMMANDS_INSTALL_HOOKS_COMMAND_H
#define CADVC_COMMANDS_INSTALL_HOOKS_COMMAND_H

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace cadvc::commands {

/// @brief Line that marks a hook script as ours.
inline constexpr std::string_view kHookMarker = "# Installed by cadvc";

/// @brief Configuration options for install-hooks.
struct InstallHooksOptions {
    /// @brief Program the scripts invoke.
    std::string executable = "cadvc";

    /// @brief Replace hooks that cadvc did not write.
    bool force = false;

    std::filesystem::path repoRoot;
};

/// @brief Render the hook script for one event.
[[nodiscard]] std::string renderHookScript(std::string_view executable, std::string_view event);

/// @brief Command handler for hook installation.
class InstallHooksCommand {
public:
    explicit InstallHooksCommand(InstallHooksOptions options);

    /// @brief Install the scripts.
    /// @return 0 if every hook is in place, ErrorCode value otherwise.
    [[nodiscard]] int execute();

    [[nodiscard]] const InstallHooksOptions& options() const noexcept { return options_; }

private:
    [[nodiscard]] std::filesystem::path hooksDirectory() const;

    InstallHooksOptions options_;
};

/// @brief Create an install-hooks command from CLI options.
[[nodiscard]] std::unique_ptr<InstallHooksCommand> createInstallHooksCommand(
    const std::string& executable, bool force, const std::filesystem::path& repoRoot);

}  // namespace cadvc::commands

#endif  // CADVC_COMMANDS_INSTALL_HOOKS_COMMAND_H
