// =============================================================================
// cadvc - Verify Command
// =============================================================================
// Command handler for comparing the logical content of two archives: member
// set and per-member xxHash64. Container metadata (compression method,
// timestamps, member order) is ignored.
//
// Exit codes: 0 identical, 1 different (as cmp(1)), ErrorCode value if an
// archive cannot be read.
// =============================================================================

#ifndef CADVC_COMMANDS_VERIFY_COMMAND_H
#define CADVC_COMMANDS_VERIFY_COMMAND_H

#include <filesystem>
#include <memory>
#include <string>

namespace cadvc::commands {

/// @brief Exit code when the archives differ.
inline constexpr int kExitContentDiffers = 1;

/// @brief Configuration options for the verify command.
struct VerifyOptions {
    std::filesystem::path leftPath;
    std::filesystem::path rightPath;

    /// @brief List every differing member instead of a summary.
    bool verbose = false;
};

/// @brief Command handler for archive comparison.
class VerifyCommand {
public:
    explicit VerifyCommand(VerifyOptions options);

    /// @brief Compare the archives.
    /// @return 0 if equal, kExitContentDiffers if not.
    [[nodiscard]] int execute();

    [[nodiscard]] const VerifyOptions& options() const noexcept { return options_; }

private:
    VerifyOptions options_;
};

/// @brief Create a verify command from CLI options.
[[nodiscard]] std::unique_ptr<VerifyCommand> createVerifyCommand(const std::string& leftPath,
                                                                 const std::string& rightPath,
                                                                 bool verbose);

}  // namespace cadvc::commands

#endif  // CADVC_COMMANDS_VERIFY_COMMAND_H
