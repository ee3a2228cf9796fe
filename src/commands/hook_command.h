// =============================================================================
// cadvc - Hook Command
// =============================================================================
// Entry point the installed git hook scripts call:
//   cadvc hook <event> [git hook arguments...]
//
// Exit codes follow the hook convention (0 allow, 1 blocked, 2 fatal), not
// the ErrorCode values the other commands use.
// =============================================================================

#ifndef CADVC_COMMANDS_HOOK_COMMAND_H
#define CADVC_COMMANDS_HOOK_COMMAND_H

#include <filesystem>
#include <istream>
#include <memory>
#include <string>
#include <vector>

namespace cadvc::commands {

/// @brief Configuration options for the hook command.
struct HookOptions {
    /// @brief Git hook name.
    std::string event;

    /// @brief Arguments git passed to the hook.
    std::vector<std::string> args;

    std::filesystem::path repoRoot;
};

/// @brief Command handler for lifecycle hooks.
class HookCommand {
public:
    /// @param input Stream holding the hook's stdin.
    HookCommand(HookOptions options, std::istream& input);

    /// @brief Run the hook.
    /// @return 0 allow, 1 blocked, 2 fatal.
    [[nodiscard]] int execute();

    [[nodiscard]] const HookOptions& options() const noexcept { return options_; }

private:
    HookOptions options_;
    std::istream& input_;
};

/// @brief Create a hook command reading stdin.
[[nodiscard]] std::unique_ptr<HookCommand> createHookCommand(const std::string& event,
                                                             std::vector<std::string> args,
                                                             const std::filesystem::path& repoRoot);

}  // namespace cadvc::commands

#endif  // CADVC_COMMANDS_HOOK_COMMAND_H
