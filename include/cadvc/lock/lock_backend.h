// =============================================================================
// cadvc - Lock Primitive Backend
// =============================================================================
// The replicated lock service cadvc delegates consensus to. The backend only
// transports requests and returns the primitive's verdict plus its raw text;
// interpreting that text (who holds a lock, what the listing means) is the
// coordinator's job.
//
// GitLfsLockBackend speaks `git lfs lock | unlock | locks`. git-lfs
// authenticates the caller itself, so the actor argument is informational
// there; test backends use it to emulate per-user servers.
// =============================================================================

#ifndef CADVC_LOCK_LOCK_BACKEND_H
#define CADVC_LOCK_LOCK_BACKEND_H

#include <string>

#include "cadvc/common/error.h"

namespace cadvc::vcs {
class GitClient;
}  // namespace cadvc::vcs

namespace cadvc::lock {

/// @brief Verdict of one lock primitive call.
struct PrimitiveReply {
    /// @brief True if the primitive granted the request.
    bool accepted = false;

    /// @brief Output text (listing on success, diagnostics on refusal).
    std::string text;
};

// =============================================================================
// LockBackend Interface
// =============================================================================

/// @brief Transport to a lock primitive that addresses repository paths.
///
/// Every call returns a PrimitiveReply when the primitive answered, and an
/// error (kTimeout, kNotFound, kIOError) when it could not be reached.
class LockBackend {
public:
    virtual ~LockBackend() = default;

    /// @brief Request the lock on a repository-relative path.
    [[nodiscard]] virtual Result<PrimitiveReply> lock(const std::string& path,
                                                      const std::string& actor) = 0;

    /// @brief Release the lock on a path; force also releases other users' locks.
    [[nodiscard]] virtual Result<PrimitiveReply> unlock(const std::string& path,
                                                        const std::string& actor, bool force) = 0;

    /// @brief Current lock listing, one `<path> <owner> <id>` line per lock.
    [[nodiscard]] virtual Result<PrimitiveReply> listLocks() = 0;
};

// =============================================================================
// GitLfsLockBackend
// =============================================================================

/// @brief LockBackend over the git-lfs locking API.
class GitLfsLockBackend : public LockBackend {
public:
    /// @param git Client for the working tree; must outlive the backend.
    explicit GitLfsLockBackend(const vcs::GitClient& git) noexcept : git_(git) {}

    [[nodiscard]] Result<PrimitiveReply> lock(const std::string& path,
                                              const std::string& actor) override;
    [[nodiscard]] Result<PrimitiveReply> unlock(const std::string& path, const std::string& actor,
                                                bool force) override;
    [[nodiscard]] Result<PrimitiveReply> listLocks() override;

private:
    const vcs::GitClient& git_;
};

}  // namespace cadvc::lock

#endif  // CADVC_LOCK_LOCK_BACKEND_H
