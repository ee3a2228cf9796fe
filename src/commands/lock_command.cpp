// =============================================================================
// cadvc - Lock Command Implementation
// =============================================================================

#include "lock_command.h"

#include <iostream>

#include <fmt/format.h>

#include "cadvc/common/config.h"
#include "cadvc/common/error.h"
#include "cadvc/common/logger.h"
#include "cadvc/lock/lock_backend.h"
#include "cadvc/lock/lock_coordinator.h"
#include "cadvc/vcs/vcs_client.h"
#include "command_support.h"

namespace cadvc::commands {

LockCommand::LockCommand(LockOptions options) : options_(std::move(options)) {}

int LockCommand::execute() {
    try {
        vcs::GitClient git(options_.repoRoot);
        lock::GitLfsLockBackend backend(git);
        lock::LockCoordinator coordinator(loadConfig(options_.repoRoot), options_.repoRoot,
                                          backend, git);

        if (options_.action == LockAction::kList) {
            auto records = coordinator.listActive();
            if (!records) {
                return reportError(records.error(), "Listing locks");
            }
            for (const auto& record : *records) {
                std::cout << fmt::format("{}\t{}\t{}\n", record.archive.value_or(record.markerPath),
                                         record.owner, record.lockId);
            }
            return 0;
        }

        auto actor = resolveActor(git, options_.actor);
        if (!actor) {
            return reportError(actor.error(), "Resolving user");
        }

        const std::string identity = coordinator.identityOf(options_.archivePath);

        if (options_.action == LockAction::kLock) {
            auto held = coordinator.acquire(options_.archivePath, *actor, options_.force);
            if (!held) {
                if (held.error().code() == ErrorCode::kAlreadyLocked) {
                    std::cerr << fmt::format("{} is locked by {}; use --force to take it over\n",
                                             identity,
                                             held.error().lockOwner().value_or(
                                                 std::string(kUnknownLockOwner)));
                    return held.error().exitCode();
                }
                return reportError(held.error(), "Lock");
            }
            std::cout << fmt::format("Locked {}\n", identity);
            return 0;
        }

        auto released = coordinator.release(options_.archivePath, *actor, options_.force);
        if (!released) {
            return reportError(released.error(), "Unlock");
        }
        std::cout << fmt::format("Unlocked {}\n", identity);
        return 0;

    } catch (const CadvcException& e) {
        CADVC_LOG_ERROR("Lock command failed: {}", e.what());
        return e.exitCode();
    } catch (const std::exception& e) {
        CADVC_LOG_ERROR("Unexpected error: {}", e.what());
        return toExitCode(ErrorCode::kInternal);
    }
}

std::unique_ptr<LockCommand> createLockCommand(LockAction action, const std::string& archivePath,
                                               bool force, const std::string& actor,
                                               const std::filesystem::path& repoRoot) {
    LockOptions opts;
    opts.action = action;
    if (!archivePath.empty()) {
        opts.archivePath = resolveUserPath(archivePath);
    }
    opts.force = force;
    if (!actor.empty()) {
        opts.actor = actor;
    }
    opts.repoRoot = repoRoot;
    return std::make_unique<LockCommand>(std::move(opts));
}

}  // namespace cadvc::commands
