// =============================================================================
// cadvc - Lifecycle Hooks
// =============================================================================
// Entry points for the five git hooks cadvc installs. Each event is handled
// independently and always terminates with a HookStatus:
//
//   pre-commit     Staged archives must be in exported (near-empty) form; with
//                  lock enforcement, every staged archive must be locked by
//                  the actor.
//   post-checkout  git-lfs hook + pull, then re-import the archives whose
//   post-merge     .changefile changed (old..new, ORIG_HEAD..HEAD, or a
//   post-rewrite   whole-tree scan after a rebase).
//   pre-push       git-lfs pre-push; with lock enforcement, every archive
//                  whose .changefile is in the pushed range must be locked by
//                  the actor.
//
// Configuration problems and unexpected exceptions are caught at the event
// boundary and reported as kFatal.
// =============================================================================

#ifndef CADVC_LIFECYCLE_LIFECYCLE_H
#define CADVC_LIFECYCLE_LIFECYCLE_H

#include <cstdint>
#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "cadvc/common/config.h"
#include "cadvc/common/types.h"

namespace cadvc::vcs {
class VcsClient;
}  // namespace cadvc::vcs

namespace cadvc::lock {
class LockBackend;
}  // namespace cadvc::lock

namespace cadvc::lifecycle {

// =============================================================================
// Events and Status
// =============================================================================

/// @brief Hook exit status.
enum class HookStatus : int {
    /// @brief Let the git operation proceed.
    kAllow = 0,
    /// @brief Refused by policy (dirty archive, missing lock, failed import).
    kBlocked = 1,
    /// @brief Internal failure.
    kFatal = 2
};

/// @brief Git hook events cadvc handles.
enum class LifecycleEvent : std::uint8_t {
    kPreCommit,
    kPostCheckout,
    kPostMerge,
    kPostRewrite,
    kPrePush
};

/// @brief All events, in installation order.
inline constexpr LifecycleEvent kAllEvents[] = {
    LifecycleEvent::kPreCommit, LifecycleEvent::kPostCheckout, LifecycleEvent::kPostMerge,
    LifecycleEvent::kPostRewrite, LifecycleEvent::kPrePush};

/// @brief Git hook name of an event ("pre-commit", ...).
[[nodiscard]] std::string_view eventName(LifecycleEvent event) noexcept;

/// @brief Parse a git hook name.
[[nodiscard]] std::optional<LifecycleEvent> parseEvent(std::string_view name) noexcept;

/// @brief Process exit code for a status.
[[nodiscard]] constexpr int toExitCode(HookStatus status) noexcept {
    return static_cast<int>(status);
}

// =============================================================================
// Push Refs
// =============================================================================

/// @brief One `<local ref> <local sha> <remote ref> <remote sha>` line.
struct PushRefUpdate {
    std::string localRef;
    std::string localSha;
    std::string remoteRef;
    std::string remoteSha;

    /// @brief True when the push deletes the remote ref.
    [[nodiscard]] bool isDeletion() const noexcept;

    /// @brief True when the remote ref does not exist yet.
    [[nodiscard]] bool isNewBranch() const noexcept;
};

/// @brief Parse pre-push stdin; lines with fewer than four fields are skipped.
[[nodiscard]] std::vector<PushRefUpdate> parsePushRefs(std::string_view input);

// =============================================================================
// Invocation
// =============================================================================

/// @brief Everything a hook run receives from git and the CLI.
struct HookInvocation {
    LifecycleEvent event = LifecycleEvent::kPreCommit;

    /// @brief Positional hook arguments as git passes them.
    std::vector<std::string> args;

    /// @brief Hook stdin (pre-push ref lines, post-rewrite rewritten list).
    std::string stdinData;

    /// @brief Acting identity; std::nullopt if it could not be determined.
    std::optional<std::string> actor;
};

// =============================================================================
// Dispatcher
// =============================================================================

/// @brief Runs lifecycle events against one repository.
///
/// Usage:
/// @code
/// vcs::GitClient git(root);
/// lock::GitLfsLockBackend backend(git);
/// LifecycleDispatcher hooks(root, git, backend, std::cerr);
/// return toExitCode(hooks.dispatch(invocation));
/// @endcode
class LifecycleDispatcher {
public:
    /// @param repoRoot Repository root.
    /// @param vcs Version control client; must outlive the dispatcher.
    /// @param locks Lock primitive; must outlive the dispatcher.
    /// @param diagnostics Stream for user-facing messages (stderr in hooks).
    LifecycleDispatcher(std::filesystem::path repoRoot, vcs::VcsClient& vcs,
                        lock::LockBackend& locks, std::ostream& diagnostics);

    /// @brief Run one event; never throws.
    [[nodiscard]] HookStatus dispatch(const HookInvocation& invocation) noexcept;

    /// @brief Configuration override; loaded from the repository otherwise.
    void setConfig(RepositoryConfig config) { config_ = std::move(config); }

private:
    HookStatus run(const HookInvocation& invocation, const RepositoryConfig& config);

    HookStatus preCommit(const RepositoryConfig& config, const std::optional<std::string>& actor);
    HookStatus postCheckout(const RepositoryConfig& config, const std::string& oldRef,
                            const std::string& newRef, const std::string& checkoutFlag);
    HookStatus postMerge(const RepositoryConfig& config, const std::string& squashFlag);
    HookStatus postRewrite(const RepositoryConfig& config, const std::string& kind,
                           const std::string& rewritten);
    HookStatus prePush(const RepositoryConfig& config, const std::vector<std::string>& args,
                       const std::string& refLines, const std::optional<std::string>& actor);

    /// @brief git-lfs passthrough hook followed by `git lfs pull`; failures warn.
    void runLfsPassthrough(const std::string& hook, const std::vector<std::string>& args,
                           const std::string& stdinData);

    /// @brief Re-import the archive of every listed change file.
    /// @return kBlocked if any import failed, after all were attempted.
    HookStatus importChanged(const RepositoryConfig& config,
                             const std::vector<std::filesystem::path>& changeFiles);

    /// @brief Every .changefile under the repository, outside .git.
    [[nodiscard]] std::vector<std::filesystem::path> scanChangeFiles() const;

    /// @brief Change files among repository-relative paths.
    [[nodiscard]] std::vector<std::filesystem::path> changeFilesIn(
        const std::vector<std::string>& relPaths) const;

    /// @brief Block unless actor holds a lock on every archive.
    HookStatus requireLocks(const RepositoryConfig& config, const std::string& actor,
                            const std::vector<ArchiveIdentity>& archives, std::string_view action);

    std::filesystem::path repoRoot_;
    vcs::VcsClient& vcs_;
    lock::LockBackend& locks_;
    std::ostream& diag_;
    std::optional<RepositoryConfig> config_;
};

}  // namespace cadvc::lifecycle

#endif  // CADVC_LIFECYCLE_LIFECYCLE_H
