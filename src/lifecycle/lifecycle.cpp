// =============================================================================
// cadvc - Lifecycle Hooks Implementation
// =============================================================================

#include "cadvc/lifecycle/lifecycle.h"

#include <algorithm>

#include <fmt/format.h>

#include "cadvc/common/error.h"
#include "cadvc/common/logger.h"
#include "cadvc/format/zip_archive.h"
#include "cadvc/lock/lock_coordinator.h"
#include "cadvc/transform/archive_transformer.h"
#include "cadvc/vcs/vcs_client.h"

namespace cadvc::lifecycle {

namespace fs = std::filesystem;

namespace {

void sortUnique(std::vector<ArchiveIdentity>& values) {
    std::sort(values.begin(), values.end());
    values.erase(std::unique(values.begin(), values.end()), values.end());
}

const std::string& argAt(const std::vector<std::string>& args, std::size_t index,
                         std::string_view event) {
    if (index >= args.size()) {
        throw UsageError(
            fmt::format("{} expects at least {} argument(s), got {}", event, index + 1, args.size()));
    }
    return args[index];
}

}  // namespace

// =============================================================================
// Events
// =============================================================================

std::string_view eventName(LifecycleEvent event) noexcept {
    switch (event) {
        case LifecycleEvent::kPreCommit:
            return "pre-commit";
        case LifecycleEvent::kPostCheckout:
            return "post-checkout";
        case LifecycleEvent::kPostMerge:
            return "post-merge";
        case LifecycleEvent::kPostRewrite:
            return "post-rewrite";
        case LifecycleEvent::kPrePush:
            return "pre-push";
    }
    return "unknown";
}

std::optional<LifecycleEvent> parseEvent(std::string_view name) noexcept {
    for (const auto event : kAllEvents) {
        if (eventName(event) == name) {
            return event;
        }
    }
    return std::nullopt;
}

// =============================================================================
// Push Refs
// =============================================================================

bool PushRefUpdate::isDeletion() const noexcept {
    return vcs::isNullObjectId(localSha);
}

bool PushRefUpdate::isNewBranch() const noexcept {
    return vcs::isNullObjectId(remoteSha);
}

std::vector<PushRefUpdate> parsePushRefs(std::string_view input) {
    std::vector<PushRefUpdate> refs;

    for (const auto& line : vcs::splitLines(input)) {
        std::vector<std::string> fields;
        std::size_t pos = 0;
        while (pos < line.size()) {
            const auto start = line.find_first_not_of(" \t", pos);
            if (start == std::string::npos) {
                break;
            }
            const auto end = std::min(line.find_first_of(" \t", start), line.size());
            fields.push_back(line.substr(start, end - start));
            pos = end;
        }
        if (fields.size() < 4) {
            CADVC_LOG_DEBUG("Ignoring push ref line '{}'", line);
            continue;
        }
        refs.push_back(PushRefUpdate{std::move(fields[0]), std::move(fields[1]),
                                     std::move(fields[2]), std::move(fields[3])});
    }
    return refs;
}

// =============================================================================
// Dispatcher
// =============================================================================

LifecycleDispatcher::LifecycleDispatcher(fs::path repoRoot, vcs::VcsClient& vcs,
                                         lock::LockBackend& locks, std::ostream& diagnostics)
    : repoRoot_(std::move(repoRoot)), vcs_(vcs), locks_(locks), diag_(diagnostics) {}

HookStatus LifecycleDispatcher::dispatch(const HookInvocation& invocation) noexcept {
    const std::string_view name = eventName(invocation.event);
    try {
        const RepositoryConfig config = config_.has_value() ? *config_ : loadConfig(repoRoot_);
        const HookStatus status = run(invocation, config);
        CADVC_LOG_DEBUG("{} finished with status {}", name, toExitCode(status));
        return status;
    } catch (const CadvcException& ex) {
        CADVC_LOG_ERROR("{} hook failed: {}", name, ex.what());
        diag_ << fmt::format("Error: {} hook failed: {}\n", name, ex.what());
    } catch (const std::exception& ex) {
        CADVC_LOG_ERROR("{} hook failed unexpectedly: {}", name, ex.what());
        diag_ << fmt::format("Error: {} hook failed: {}\n", name, ex.what());
    }
    return HookStatus::kFatal;
}

HookStatus LifecycleDispatcher::run(const HookInvocation& invocation,
                                    const RepositoryConfig& config) {
    const auto& args = invocation.args;
    const std::string_view name = eventName(invocation.event);

    switch (invocation.event) {
        case LifecycleEvent::kPreCommit:
            return preCommit(config, invocation.actor);
        case LifecycleEvent::kPostCheckout:
            return postCheckout(config, argAt(args, 0, name), argAt(args, 1, name),
                                argAt(args, 2, name));
        case LifecycleEvent::kPostMerge:
            return postMerge(config, args.empty() ? std::string("0") : args.front());
        case LifecycleEvent::kPostRewrite:
            return postRewrite(config, argAt(args, 0, name), invocation.stdinData);
        case LifecycleEvent::kPrePush:
            return prePush(config, args, invocation.stdinData, invocation.actor);
    }
    throw CadvcException(ErrorCode::kInternal, "Unhandled lifecycle event");
}

// =============================================================================
// pre-commit
// =============================================================================

HookStatus LifecycleDispatcher::preCommit(const RepositoryConfig& config,
                                          const std::optional<std::string>& actor) {
    const auto staged = unwrapOrThrow(vcs_.stagedModifiedFiles());

    std::vector<ArchiveIdentity> archives;
    bool dirty = false;
    for (const auto& rel : staged) {
        if (!hasArchiveExtension(rel)) {
            continue;
        }
        archives.push_back(rel);

        const fs::path archive = repoRoot_ / rel;
        std::error_code ec;
        if (!fs::is_regular_file(archive, ec)) {
            continue;
        }
        const auto size = fs::file_size(archive, ec);
        if (!ec && size > kEmptyArchiveThreshold) {
            diag_ << fmt::format("Error: {} is not empty ({} bytes)\n", rel, size);
            diag_ << fmt::format("  Export it with `cadvc export {}` before committing\n", rel);
            dirty = true;
        }
    }
    if (dirty) {
        return HookStatus::kBlocked;
    }

    if (!config.requireLock) {
        return HookStatus::kAllow;
    }
    if (!actor.has_value() || actor->empty()) {
        diag_ << "Error: git config user.name is not set; cannot check locks\n";
        return HookStatus::kBlocked;
    }

    for (const auto& changeFile : changeFilesIn(staged)) {
        if (auto identity = transform::readChangeFile(changeFile)) {
            archives.push_back(std::move(*identity));
        }
    }
    sortUnique(archives);
    return requireLocks(config, *actor, archives, "commit");
}

// =============================================================================
// post-checkout / post-merge / post-rewrite
// =============================================================================

HookStatus LifecycleDispatcher::postCheckout(const RepositoryConfig& config,
                                             const std::string& oldRef, const std::string& newRef,
                                             const std::string& checkoutFlag) {
    runLfsPassthrough("post-checkout", {oldRef, newRef, checkoutFlag}, {});

    if (vcs_.isRebaseInProgress()) {
        CADVC_LOG_DEBUG("Rebase in progress; post-rewrite will import");
        return HookStatus::kAllow;
    }
    if (checkoutFlag != "1") {
        return HookStatus::kAllow;
    }

    // A fresh clone checks out from the null commit: everything is new
    if (vcs::isNullObjectId(oldRef)) {
        return importChanged(config, scanChangeFiles());
    }
    return importChanged(config, changeFilesIn(unwrapOrThrow(vcs_.changedFiles(oldRef, newRef))));
}

HookStatus LifecycleDispatcher::postMerge(const RepositoryConfig& config,
                                          const std::string& squashFlag) {
    runLfsPassthrough("post-merge", {squashFlag}, {});

    if (!vcs_.refExists("ORIG_HEAD")) {
        CADVC_LOG_DEBUG("No ORIG_HEAD; nothing to import");
        return HookStatus::kAllow;
    }
    return importChanged(config,
                         changeFilesIn(unwrapOrThrow(vcs_.changedFiles("ORIG_HEAD", "HEAD"))));
}

HookStatus LifecycleDispatcher::postRewrite(const RepositoryConfig& config, const std::string& kind,
                                            const std::string& rewritten) {
    runLfsPassthrough("post-rewrite", {kind}, rewritten);

    if (kind != "rebase") {
        return HookStatus::kAllow;
    }
    return importChanged(config, scanChangeFiles());
}

void LifecycleDispatcher::runLfsPassthrough(const std::string& hook,
                                            const std::vector<std::string>& args,
                                            const std::string& stdinData) {
    if (auto passed = vcs_.runLfsHook(hook, args, stdinData); !passed) {
        diag_ << fmt::format("Warning: git-lfs {} failed: {}\n", hook, passed.error().message());
    }
    if (auto pulled = vcs_.lfsPull(); !pulled) {
        CADVC_LOG_WARNING("git lfs pull failed: {}", pulled.error().message());
        diag_ << fmt::format("Warning: git lfs pull failed: {}\n", pulled.error().message());
    }
}

HookStatus LifecycleDispatcher::importChanged(const RepositoryConfig& config,
                                              const std::vector<fs::path>& changeFiles) {
    transform::ArchiveTransformer transformer(config, repoRoot_);
    std::size_t failed = 0;

    for (const auto& changeFile : changeFiles) {
        std::error_code ec;
        if (!fs::is_regular_file(changeFile, ec)) {
            continue;
        }
        const auto identity = transform::readChangeFile(changeFile);
        if (!identity || !format::isSafeMemberName(*identity)) {
            CADVC_LOG_WARNING("{} does not name an archive inside the repository",
                              changeFile.string());
            continue;
        }

        diag_ << fmt::format("Importing {}... ", *identity);
        auto imported = transformer.importArchive(changeFile.parent_path(), repoRoot_ / *identity);
        if (imported) {
            diag_ << "done\n";
        } else {
            diag_ << fmt::format("failed: {}\n", imported.error().message());
            ++failed;
        }
    }

    if (failed > 0) {
        diag_ << fmt::format("Error: {} archive(s) could not be rebuilt\n", failed);
        return HookStatus::kBlocked;
    }
    return HookStatus::kAllow;
}

std::vector<fs::path> LifecycleDispatcher::scanChangeFiles() const {
    std::vector<fs::path> found;

    auto it = fs::recursive_directory_iterator(repoRoot_,
                                               fs::directory_options::skip_permission_denied);
    for (; it != fs::recursive_directory_iterator(); ++it) {
        const auto& entry = *it;
        if (entry.is_directory() && entry.path().filename() == ".git") {
            it.disable_recursion_pending();
            continue;
        }
        if (entry.is_regular_file() && entry.path().filename().string() == kChangeFileName) {
            found.push_back(entry.path());
        }
    }

    std::sort(found.begin(), found.end());
    return found;
}

std::vector<fs::path> LifecycleDispatcher::changeFilesIn(
    const std::vector<std::string>& relPaths) const {
    std::vector<fs::path> found;
    for (const auto& rel : relPaths) {
        const fs::path path(rel);
        if (path.filename().string() == kChangeFileName) {
            found.push_back(repoRoot_ / path);
        }
    }
    return found;
}

// =============================================================================
// pre-push
// =============================================================================

HookStatus LifecycleDispatcher::prePush(const RepositoryConfig& config,
                                        const std::vector<std::string>& args,
                                        const std::string& refLines,
                                        const std::optional<std::string>& actor) {
    const auto refs = parsePushRefs(refLines);

    if (auto passed = vcs_.runLfsHook("pre-push", args, refLines); !passed) {
        diag_ << fmt::format("Warning: git-lfs pre-push failed: {}\n", passed.error().message());
    }

    if (!config.requireLock || refs.empty()) {
        return HookStatus::kAllow;
    }
    if (!actor.has_value() || actor->empty()) {
        diag_ << "Error: git config user.name is not set; cannot check locks\n";
        return HookStatus::kBlocked;
    }

    std::vector<std::string> pushed;
    for (const auto& ref : refs) {
        if (ref.isDeletion()) {
            continue;
        }
        const std::optional<std::string> remote =
            ref.isNewBranch() ? std::nullopt : std::optional<std::string>(ref.remoteSha);
        auto files = unwrapOrThrow(vcs_.pushedFiles(ref.localSha, remote));
        pushed.insert(pushed.end(), files.begin(), files.end());
    }

    std::vector<ArchiveIdentity> archives;
    for (const auto& changeFile : changeFilesIn(pushed)) {
        if (auto identity = transform::readChangeFile(changeFile)) {
            archives.push_back(std::move(*identity));
        }
    }
    sortUnique(archives);
    return requireLocks(config, *actor, archives, "push");
}

// =============================================================================
// Lock Checks
// =============================================================================

HookStatus LifecycleDispatcher::requireLocks(const RepositoryConfig& config,
                                             const std::string& actor,
                                             const std::vector<ArchiveIdentity>& archives,
                                             std::string_view action) {
    if (archives.empty()) {
        return HookStatus::kAllow;
    }

    lock::LockCoordinator coordinator(config, repoRoot_, locks_, vcs_);
    const auto records = unwrapOrThrow(coordinator.listActive());

    bool missing = false;
    for (const auto& archive : archives) {
        if (coordinator.isLockedBy(records, archive, actor)) {
            continue;
        }
        diag_ << fmt::format("Error: {} does not hold the lock on {}\n", actor, archive);
        diag_ << fmt::format("  Run `cadvc lock {}` before you {}\n", archive, action);
        missing = true;
    }
    return missing ? HookStatus::kBlocked : HookStatus::kAllow;
}

}  // namespace cadvc::lifecycle
