// =============================================================================
// cadvc - Version Control Client
// =============================================================================
// The narrow slice of git that the lifecycle hooks and the lock coordinator
// need: which files a commit, checkout or push touches, the acting user
// name, staging, and passthrough to git-lfs's own hooks.
//
// VcsClient is the seam tests replace with a scripted fake; GitClient drives
// the git command line through io::runProcess with a bounded deadline.
//
// All file lists are repository-relative POSIX paths as printed by git.
// =============================================================================

#ifndef CADVC_VCS_VCS_CLIENT_H
#define CADVC_VCS_VCS_CLIENT_H

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "cadvc/common/error.h"
#include "cadvc/common/types.h"
#include "cadvc/io/subprocess.h"

namespace cadvc::vcs {

/// @brief Object id git uses for "no commit" in hook arguments.
inline constexpr std::string_view kNullObjectId = "0000000000000000000000000000000000000000";

/// @brief Object id of the empty tree, the diff base before the first commit.
inline constexpr std::string_view kEmptyTreeObjectId = "4b825dc642cb6eb9a060e54bf8d69288fbee4904";

/// @brief True for an all-zero object id of any length.
[[nodiscard]] bool isNullObjectId(std::string_view objectId) noexcept;

/// @brief Split command output into non-empty lines (CR stripped).
[[nodiscard]] std::vector<std::string> splitLines(std::string_view text);

// =============================================================================
// VcsClient Interface
// =============================================================================

/// @brief Version control operations used by cadvc.
class VcsClient {
public:
    virtual ~VcsClient() = default;

    /// @brief Repository working tree root.
    [[nodiscard]] virtual const std::filesystem::path& repoRoot() const noexcept = 0;

    /// @brief Files staged as changed relative to HEAD, excluding additions.
    [[nodiscard]] virtual Result<std::vector<std::string>> stagedModifiedFiles() = 0;

    /// @brief Files that differ between two commits.
    [[nodiscard]] virtual Result<std::vector<std::string>> changedFiles(
        const std::string& oldRef, const std::string& newRef) = 0;

    /// @brief Files touched by the commits a push would send.
    /// @param localSha Tip being pushed.
    /// @param remoteSha Current remote tip; std::nullopt for a new branch,
    ///        in which case every commit not on any remote counts.
    [[nodiscard]] virtual Result<std::vector<std::string>> pushedFiles(
        const std::string& localSha, const std::optional<std::string>& remoteSha) = 0;

    /// @brief Configured user.name, or std::nullopt if unset.
    [[nodiscard]] virtual Result<std::optional<std::string>> userName() = 0;

    /// @brief Stage a path.
    [[nodiscard]] virtual VoidResult add(const std::filesystem::path& path) = 0;

    /// @brief True while a rebase is stopped or running.
    [[nodiscard]] virtual bool isRebaseInProgress() = 0;

    /// @brief True if a ref (e.g. ORIG_HEAD) resolves to a commit.
    [[nodiscard]] virtual bool refExists(const std::string& ref) = 0;

    /// @brief Run one of git-lfs's own hooks (`git lfs <hook> args...`).
    [[nodiscard]] virtual VoidResult runLfsHook(const std::string& hook,
                                                const std::vector<std::string>& args,
                                                const std::string& stdinData) = 0;

    /// @brief Fetch and check out large objects (`git lfs pull`).
    [[nodiscard]] virtual VoidResult lfsPull() = 0;
};

// =============================================================================
// GitClient
// =============================================================================

/// @brief VcsClient backed by the git command line.
class GitClient : public VcsClient {
public:
    /// @brief Construct for a working tree.
    /// @param repoRoot Working tree root; every command runs there.
    /// @param timeout Deadline for each command.
    explicit GitClient(std::filesystem::path repoRoot,
                       std::chrono::milliseconds timeout = kDefaultCommandTimeout);

    [[nodiscard]] const std::filesystem::path& repoRoot() const noexcept override {
        return repoRoot_;
    }

    [[nodiscard]] Result<std::vector<std::string>> stagedModifiedFiles() override;
    [[nodiscard]] Result<std::vector<std::string>> changedFiles(const std::string& oldRef,
                                                                const std::string& newRef) override;
    [[nodiscard]] Result<std::vector<std::string>> pushedFiles(
        const std::string& localSha, const std::optional<std::string>& remoteSha) override;
    [[nodiscard]] Result<std::optional<std::string>> userName() override;
    [[nodiscard]] VoidResult add(const std::filesystem::path& path) override;
    [[nodiscard]] bool isRebaseInProgress() override;
    [[nodiscard]] bool refExists(const std::string& ref) override;
    [[nodiscard]] VoidResult runLfsHook(const std::string& hook,
                                        const std::vector<std::string>& args,
                                        const std::string& stdinData) override;
    [[nodiscard]] VoidResult lfsPull() override;

    /// @brief Run `git args...` in the working tree.
    /// @return The process outcome whatever its exit status; kTimeout if the
    ///         deadline expired, kNotFound if git is not installed.
    [[nodiscard]] Result<io::ProcessResult> run(const std::vector<std::string>& args,
                                                const std::string& stdinData = {}) const;

    /// @brief Run `git args...` and require exit status 0.
    /// @return stdout, or kIOError carrying git's stderr.
    [[nodiscard]] Result<std::string> capture(const std::vector<std::string>& args,
                                              const std::string& stdinData = {}) const;

    /// @brief Locate the working tree containing a directory.
    /// @return The `git rev-parse --show-toplevel` path, or kNotFound.
    [[nodiscard]] static Result<std::filesystem::path> discoverRoot(
        const std::filesystem::path& start,
        std::chrono::milliseconds timeout = kDefaultCommandTimeout);

    [[nodiscard]] std::chrono::milliseconds timeout() const noexcept { return timeout_; }

private:
    std::filesystem::path repoRoot_;
    std::chrono::milliseconds timeout_;
};

}  // namespace cadvc::vcs

#endif  // CADVC_VCS_VCS_CLIENT_H
