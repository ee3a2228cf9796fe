// =============================================================================
// cadvc - Export Command
// =============================================================================
// Command handler for expanding an archive into its tree.
// =============================================================================

#ifndef CADVC_COMMANDS_EXPORT_COMMAND_H
#define CADVC_COMMANDS_EXPORT_COMMAND_H

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace cadvc::commands {

// =============================================================================
// Export Options
// =============================================================================

/// @brief Configuration options for the export command.
struct ExportOptions {
    /// @brief Archive to expand.
    std::filesystem::path archivePath;

    /// @brief Destination tree; derived from the configuration if absent.
    std::optional<std::filesystem::path> treeRoot;

    /// @brief Repository root (configuration source and identity base).
    std::filesystem::path repoRoot;
};

// =============================================================================
// ExportCommand Class
// =============================================================================

/// @brief Command handler for export.
class ExportCommand {
public:
    explicit ExportCommand(ExportOptions options);

    /// @brief Execute the export.
    /// @return Exit code (0 = success, ErrorCode value otherwise).
    [[nodiscard]] int execute();

    [[nodiscard]] const ExportOptions& options() const noexcept { return options_; }

private:
    ExportOptions options_;
};

/// @brief Create an export command from CLI options.
[[nodiscard]] std::unique_ptr<ExportCommand> createExportCommand(
    const std::string& archivePath, const std::string& treeRoot,
    const std::filesystem::path& repoRoot);

}  // namespace cadvc::commands

#endif  // CADVC_COMMANDS_EXPORT_COMMAND_H
