// =============================================================================
// cadvc - Config Command Implementation
// =============================================================================

#include "config_command.h"

#include <iostream>

#include <fmt/format.h>

#include "cadvc/common/config.h"
#include "cadvc/common/error.h"
#include "cadvc/common/logger.h"
#include "command_support.h"

namespace cadvc::commands {

ConfigCommand::ConfigCommand(ConfigOptions options) : options_(std::move(options)) {}

int ConfigCommand::execute() {
    try {
        return options_.action == ConfigAction::kInit ? init() : show();
    } catch (const CadvcException& e) {
        CADVC_LOG_ERROR("Config command failed: {}", e.what());
        return e.exitCode();
    } catch (const std::exception& e) {
        CADVC_LOG_ERROR("Unexpected error: {}", e.what());
        return toExitCode(ErrorCode::kInternal);
    }
}

int ConfigCommand::init() {
    if (hasConfig(options_.repoRoot) && !options_.force) {
        return reportError(Error(ErrorCode::kUsageError,
                                 fmt::format("{} already exists; use --force to overwrite",
                                             configFilePath(options_.repoRoot).string())),
                           "Config init");
    }

    if (auto saved = saveConfig(options_.repoRoot, RepositoryConfig{}); !saved) {
        return reportError(saved.error(), "Config init");
    }
    std::cout << fmt::format("Wrote {}\n", (options_.repoRoot / kConfigRelPath).string());
    return 0;
}

int ConfigCommand::show() {
    const RepositoryConfig config = loadConfig(options_.repoRoot);
    if (hasConfig(options_.repoRoot)) {
        std::cout << fmt::format("# {}\n", configFilePath(options_.repoRoot).string());
    } else {
        std::cout << "# defaults (no configuration file)\n";
    }
    std::cout << serializeConfig(config) << '\n';
    return 0;
}

std::unique_ptr<ConfigCommand> createConfigCommand(ConfigAction action, bool force,
                                                   const std::filesystem::path& repoRoot) {
    ConfigOptions opts;
    opts.action = action;
    opts.force = force;
    opts.repoRoot = repoRoot;
    return std::make_unique<ConfigCommand>(std::move(opts));
}

}  // namespace cadvc::commands
