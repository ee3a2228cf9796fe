// =============================================================================
// cadvc - Lock Command
// =============================================================================
// Command handler for `lock`, `unlock` and `locks`.
// =============================================================================

#ifndef CADVC_COMMANDS_LOCK_COMMAND_H
#define CADVC_COMMANDS_LOCK_COMMAND_H

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace cadvc::commands {

/// @brief What the lock command does.
enum class LockAction : std::uint8_t {
    kLock,
    kUnlock,
    kList
};

/// @brief Configuration options for the lock command.
struct LockOptions {
    LockAction action = LockAction::kLock;

    /// @brief Archive to lock or unlock (unused for kList).
    std::filesystem::path archivePath;

    /// @brief Steal on lock, break someone else's lock on unlock.
    bool force = false;

    /// @brief Acting user; git's user.name when absent.
    std::optional<std::string> actor;

    std::filesystem::path repoRoot;
};

/// @brief Command handler for lock operations.
class LockCommand {
public:
    explicit LockCommand(LockOptions options);

    /// @brief Execute the lock operation.
    /// @return Exit code (0 = success, ErrorCode value otherwise).
    [[nodiscard]] int execute();

    [[nodiscard]] const LockOptions& options() const noexcept { return options_; }

private:
    LockOptions options_;
};

/// @brief Create a lock command from CLI options.
[[nodiscard]] std::unique_ptr<LockCommand> createLockCommand(LockAction action,
                                                             const std::string& archivePath,
                                                             bool force, const std::string& actor,
                                                             const std::filesystem::path& repoRoot);

}  // namespace cadvc::commands

#endif  // CADVC_COMMANDS_LOCK_COMMAND_H
