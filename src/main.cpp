// =============================================================================
// cadvc - Version control for ZIP-based CAD archives
// =============================================================================
// Main entry point for the cadvc command-line tool.
//
// This file implements the CLI framework using CLI11, providing:
// - Subcommands: export, import, lock, unlock, locks, hook, config, verify,
//   install-hooks
// - Global options: verbosity, log file, repository directory (-C)
// =============================================================================

#include <CLI/CLI.hpp>

#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "cadvc/common/error.h"
#include "cadvc/common/logger.h"
#include "cadvc/common/types.h"
#include "cadvc/lifecycle/lifecycle.h"

// Command implementations
#include "commands/command_support.h"
#include "commands/config_command.h"
#include "commands/export_command.h"
#include "commands/hook_command.h"
#include "commands/import_command.h"
#include "commands/install_hooks_command.h"
#include "commands/lock_command.h"
#include "commands/verify_command.h"

namespace {

// =============================================================================
// Version Information
// =============================================================================

constexpr const char* kVersion = "0.1.0";
constexpr const char* kDescription =
    "cadvc: keep FreeCAD .FCStd archives under git\n"
    "Expands archives into diff-friendly trees, packs binary members into\n"
    "size-capped chunk archives and coordinates exclusive edits through\n"
    "git-lfs file locks.";

// =============================================================================
// Global Options
// =============================================================================

struct GlobalOptions {
    int verbosity = 0;  // 0 = normal, 1 = debug, 2 = trace
    bool quiet = false;
    std::string logFile;
    std::string repoDir;  // -C
};

GlobalOptions gOptions;

// =============================================================================
// Subcommand Options
// =============================================================================

struct CliExportOptions {
    std::string archive;
    std::string output;
};

CliExportOptions gExportOpts;

struct CliImportOptions {
    std::string tree;
    std::string archive;
};

CliImportOptions gImportOpts;

struct CliLockOptions {
    std::string archive;
    bool force = false;
    std::string user;
};

CliLockOptions gLockOpts;
CliLockOptions gUnlockOpts;

struct CliHookOptions {
    std::string event;
    std::vector<std::string> args;
};

CliHookOptions gHookOpts;

struct CliConfigOptions {
    bool force = false;
};

CliConfigOptions gConfigOpts;

struct CliVerifyOptions {
    std::string left;
    std::string right;
    bool verbose = false;
};

CliVerifyOptions gVerifyOpts;

struct CliInstallHooksOptions {
    std::string executable = "cadvc";
    bool force = false;
};

CliInstallHooksOptions gInstallOpts;

// =============================================================================
// Command Setup Functions
// =============================================================================

void setupExportCommand(CLI::App& app) {
    auto* cmd = app.add_subcommand("export", "Expand an archive into its tree");
    cmd->add_option("archive", gExportOpts.archive, "Archive (.FCStd) to expand")
        ->required()
        ->check(CLI::ExistingFile);
    cmd->add_option("-o,--output", gExportOpts.output,
                    "Tree directory (default: derived from the configuration)");
}

void setupImportCommand(CLI::App& app) {
    auto* cmd = app.add_subcommand("import", "Rebuild an archive from its tree");
    cmd->add_option("tree", gImportOpts.tree, "Expanded tree")->required();
    cmd->add_option("archive", gImportOpts.archive, "Archive (.FCStd) to write")->required();
}

void setupLockCommands(CLI::App& app) {
    auto* lockCmd = app.add_subcommand("lock", "Take the lock on an archive");
    lockCmd->add_option("archive", gLockOpts.archive, "Archive to lock")->required();
    lockCmd->add_flag("-f,--force", gLockOpts.force, "Take the lock over from its holder");
    lockCmd->add_option("--user", gLockOpts.user, "Acting user (default: git user.name)");

    auto* unlockCmd = app.add_subcommand("unlock", "Release the lock on an archive");
    unlockCmd->add_option("archive", gUnlockOpts.archive, "Archive to unlock")->required();
    unlockCmd->add_flag("-f,--force", gUnlockOpts.force, "Release someone else's lock");
    unlockCmd->add_option("--user", gUnlockOpts.user, "Acting user (default: git user.name)");

    app.add_subcommand("locks", "List active locks");
}

void setupHookCommand(CLI::App& app) {
    auto* cmd = app.add_subcommand("hook", "Run a git hook (called by installed hook scripts)");
    cmd->add_option("event", gHookOpts.event, "Hook name")
        ->required()
        ->check(CLI::IsMember(
            {"pre-commit", "post-checkout", "post-merge", "post-rewrite", "pre-push"}));
    cmd->add_option("args", gHookOpts.args, "Arguments git passed to the hook");
}

void setupConfigCommand(CLI::App& app) {
    auto* cmd = app.add_subcommand("config", "Manage the repository configuration");
    cmd->require_subcommand(1);

    auto* init = cmd->add_subcommand("init", "Write the default configuration");
    init->add_flag("-f,--force", gConfigOpts.force, "Overwrite an existing configuration");

    cmd->add_subcommand("show", "Print the effective configuration");
}

void setupVerifyCommand(CLI::App& app) {
    auto* cmd = app.add_subcommand("verify", "Compare the content of two archives");
    cmd->add_option("left", gVerifyOpts.left, "First archive")
        ->required()
        ->check(CLI::ExistingFile);
    cmd->add_option("right", gVerifyOpts.right, "Second archive")
        ->required()
        ->check(CLI::ExistingFile);
    cmd->add_flag("--verbose", gVerifyOpts.verbose, "List every differing member");
}

void setupInstallHooksCommand(CLI::App& app) {
    auto* cmd = app.add_subcommand("install-hooks", "Install the git hooks that call cadvc");
    cmd->add_option("--executable", gInstallOpts.executable, "Program the hooks run")
        ->default_val("cadvc");
    cmd->add_flag("-f,--force", gInstallOpts.force, "Replace hooks not written by cadvc");
}

}  // namespace

// =============================================================================
// Main Entry Point
// =============================================================================

int main(int argc, char* argv[]) {
    CLI::App app{kDescription};
    app.set_version_flag("-V,--version", kVersion);

    // Global options
    app.add_flag("-v,--verbose", gOptions.verbosity, "Increase verbosity (-v, -vv for trace)");
    app.add_flag("-q,--quiet", gOptions.quiet, "Only log errors");
    app.add_option("--log-file", gOptions.logFile, "Also write the log to this file");
    app.add_option("-C", gOptions.repoDir, "Run as if started in this repository")
        ->check(CLI::ExistingDirectory);

    // Setup subcommands
    setupExportCommand(app);
    setupImportCommand(app);
    setupLockCommands(app);
    setupHookCommand(app);
    setupConfigCommand(app);
    setupVerifyCommand(app);
    setupInstallHooksCommand(app);

    // Require a subcommand
    app.require_subcommand(1);

    // Parse arguments
    CLI11_PARSE(app, argc, argv);

    const bool isHook = app.got_subcommand("hook");

    // Initialize logger
    try {
        cadvc::log::Config logConfig;
        logConfig.logFile = gOptions.logFile;
        logConfig.level = cadvc::log::levelForRun(gOptions.verbosity, gOptions.quiet, isHook);
        cadvc::log::init(logConfig);
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize logger: " << e.what() << std::endl;
        return isHook ? cadvc::lifecycle::toExitCode(cadvc::lifecycle::HookStatus::kFatal)
                      : cadvc::toExitCode(cadvc::ErrorCode::kInternal);
    }

    using namespace cadvc::commands;

    int exitCode = EXIT_SUCCESS;
    try {
        const auto repoRoot =
            resolveRepoRoot(gOptions.repoDir.empty()
                                ? std::nullopt
                                : std::optional<std::filesystem::path>(gOptions.repoDir));
        CADVC_LOG_DEBUG("Repository root: {}", repoRoot.string());

        if (app.got_subcommand("export")) {
            exitCode =
                createExportCommand(gExportOpts.archive, gExportOpts.output, repoRoot)->execute();
        } else if (app.got_subcommand("import")) {
            exitCode =
                createImportCommand(gImportOpts.tree, gImportOpts.archive, repoRoot)->execute();
        } else if (app.got_subcommand("lock")) {
            exitCode = createLockCommand(LockAction::kLock, gLockOpts.archive, gLockOpts.force,
                                         gLockOpts.user, repoRoot)
                           ->execute();
        } else if (app.got_subcommand("unlock")) {
            exitCode = createLockCommand(LockAction::kUnlock, gUnlockOpts.archive,
                                         gUnlockOpts.force, gUnlockOpts.user, repoRoot)
                           ->execute();
        } else if (app.got_subcommand("locks")) {
            exitCode = createLockCommand(LockAction::kList, "", false, "", repoRoot)->execute();
        } else if (isHook) {
            exitCode = createHookCommand(gHookOpts.event, gHookOpts.args, repoRoot)->execute();
        } else if (app.got_subcommand("config")) {
            auto* config = app.get_subcommand("config");
            const auto action =
                config->got_subcommand("init") ? ConfigAction::kInit : ConfigAction::kShow;
            exitCode = createConfigCommand(action, gConfigOpts.force, repoRoot)->execute();
        } else if (app.got_subcommand("verify")) {
            exitCode =
                createVerifyCommand(gVerifyOpts.left, gVerifyOpts.right, gVerifyOpts.verbose)
                    ->execute();
        } else if (app.got_subcommand("install-hooks")) {
            exitCode = createInstallHooksCommand(gInstallOpts.executable, gInstallOpts.force,
                                                 repoRoot)
                           ->execute();
        }
    } catch (const cadvc::CadvcException& ex) {
        CADVC_LOG_ERROR("Error: {}", ex.what());
        exitCode = isHook ? cadvc::lifecycle::toExitCode(cadvc::lifecycle::HookStatus::kFatal)
                          : ex.exitCode();
    } catch (const std::exception& ex) {
        CADVC_LOG_ERROR("Unexpected error: {}", ex.what());
        exitCode = isHook ? cadvc::lifecycle::toExitCode(cadvc::lifecycle::HookStatus::kFatal)
                          : cadvc::toExitCode(cadvc::ErrorCode::kInternal);
    }

    cadvc::log::flush();
    return exitCode;
}
