// =============================================================================
// cadvc - Import Command
// =============================================================================
// Command handler for rebuilding an archive from its tree.
// =============================================================================

#ifndef CADVC_COMMANDS_IMPORT_COMMAND_H
#define CADVC_COMMANDS_IMPORT_COMMAND_H

#include <filesystem>
#include <memory>
#include <string>

namespace cadvc::commands {

/// @brief Configuration options for the import command.
struct ImportOptions {
    /// @brief Expanded tree to read.
    std::filesystem::path treeRoot;

    /// @brief Archive to (re)write.
    std::filesystem::path archivePath;

    /// @brief Repository root (configuration source).
    std::filesystem::path repoRoot;
};

/// @brief Command handler for import.
class ImportCommand {
public:
    explicit ImportCommand(ImportOptions options);

    /// @brief Execute the import.
    /// @return Exit code (0 = success, ErrorCode value otherwise).
    [[nodiscard]] int execute();

    [[nodiscard]] const ImportOptions& options() const noexcept { return options_; }

private:
    ImportOptions options_;
};

/// @brief Create an import command from CLI options.
[[nodiscard]] std::unique_ptr<ImportCommand> createImportCommand(
    const std::string& treeRoot, const std::string& archivePath,
    const std::filesystem::path& repoRoot);

}  // namespace cadvc::commands

#endif  // CADVC_COMMANDS_IMPORT_COMMAND_H
