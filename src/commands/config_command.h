// =============================================================================
// cadvc - Config Command
// =============================================================================
// Command handler for `config init` and `config show`.
// =============================================================================

#ifndef CADVC_COMMANDS_CONFIG_COMMAND_H
#define CADVC_COMMANDS_CONFIG_COMMAND_H

#include <cstdint>
#include <filesystem>
#include <memory>

namespace cadvc::commands {

/// @brief What the config command does.
enum class ConfigAction : std::uint8_t {
    /// @brief Write a default configuration file.
    kInit,
    /// @brief Print the effective configuration.
    kShow
};

/// @brief Configuration options for the config command.
struct ConfigOptions {
    ConfigAction action = ConfigAction::kShow;

    /// @brief Overwrite an existing configuration file on init.
    bool force = false;

    std::filesystem::path repoRoot;
};

/// @brief Command handler for repository configuration.
class ConfigCommand {
public:
    explicit ConfigCommand(ConfigOptions options);

    /// @brief Execute the config operation.
    /// @return Exit code (0 = success, ErrorCode value otherwise).
    [[nodiscard]] int execute();

    [[nodiscard]] const ConfigOptions& options() const noexcept { return options_; }

private:
    int init();
    int show();

    ConfigOptions options_;
};

/// @brief Create a config command from CLI options.
[[nodiscard]] std::unique_ptr<ConfigCommand> createConfigCommand(
    ConfigAction action, bool force, const std::filesystem::path& repoRoot);

}  // namespace cadvc::commands

#endif  // CADVC_COMMANDS_CONFIG_COMMAND_H
