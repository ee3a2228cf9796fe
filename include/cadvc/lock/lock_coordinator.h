// =============================================================================
// cadvc - Lock Coordinator
// =============================================================================
// At-most-one-writer per archive. The lock target is not the archive but its
// proxy marker `<ExpandedTree>/.lockfile`, whose content records the archive
// identity. The forward mapping archive -> marker is the only mapping used;
// listings recover the archive by reading the marker, never by guessing.
//
// Owner attribution for refused requests parses the primitive's free-form
// error text. This is a heuristic: when no owner can be found the refusal is
// attributed to "another user".
// =============================================================================

#ifndef CADVC_LOCK_LOCK_COORDINATOR_H
#define CADVC_LOCK_LOCK_COORDINATOR_H

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "cadvc/common/config.h"
#include "cadvc/common/error.h"
#include "cadvc/common/types.h"
#include "cadvc/lock/lock_backend.h"
#include "cadvc/transform/archive_transformer.h"

namespace cadvc::vcs {
class VcsClient;
}  // namespace cadvc::vcs

namespace cadvc::lock {

// =============================================================================
// Lock Records
// =============================================================================

/// @brief One active lock as reported by the primitive.
struct LockRecord {
    /// @brief Locked path as the primitive reports it (a marker file).
    std::string markerPath;

    /// @brief Lock holder.
    std::string owner;

    /// @brief Primitive's lock id (empty if not reported).
    std::string lockId;

    /// @brief Archive recorded in the marker, if the marker is readable.
    std::optional<ArchiveIdentity> archive;
};

/// @brief Parse a `<path> <owner> <id> [extra...]` listing.
/// @note Fields are tab separated when the line has tabs, whitespace
///       separated otherwise. Blank lines, `--` separator lines and lines
///       with fewer than two fields are skipped; extra fields are ignored.
[[nodiscard]] std::vector<LockRecord> parseLockListing(std::string_view text);

/// @brief Best-effort holder name from a refusal message.
/// @return The word after "locked by" / "owned by" / "by", or "another user".
[[nodiscard]] std::string extractLockOwner(std::string_view text);

/// @brief Map a refusal message to kAlreadyLocked (with owner), kNotLocked
///        or kIOError.
[[nodiscard]] Error classifyRefusal(std::string_view text, std::string_view path);

// =============================================================================
// Lock Coordinator Class
// =============================================================================

/// @brief Acquires, releases and queries archive locks for an explicit actor.
///
/// Usage:
/// @code
/// LockCoordinator locks(loadConfig(root), root, backend, git);
/// if (auto held = locks.acquire("parts/gear.FCStd", "alice", false); !held) {
///     // held.error().code() == ErrorCode::kAlreadyLocked,
///     // held.error().lockOwner() == "bob"
/// }
/// @endcode
class LockCoordinator {
public:
    /// @param config Repository configuration (decides the marker location).
    /// @param repoRoot Repository root.
    /// @param backend Lock primitive; must outlive the coordinator.
    /// @param vcs Used to stage new markers; must outlive the coordinator.
    LockCoordinator(RepositoryConfig config, std::filesystem::path repoRoot, LockBackend& backend,
                    vcs::VcsClient& vcs);

    /// @brief Take the lock on an archive.
    /// @param archive Archive path, absolute or repository-relative.
    /// @param actor Acting identity.
    /// @param force Steal: release whoever holds it, then lock.
    /// @return kAlreadyLocked (with owner), kTimeout, kUsageError for an
    ///         empty actor, or kIOError.
    /// @note Creates and stages the marker if it does not exist yet.
    [[nodiscard]] VoidResult acquire(const std::filesystem::path& archive,
                                     const std::string& actor, bool force);

    /// @brief Give up the lock on an archive.
    /// @param force Also release a lock held by someone else.
    /// @return kNotLocked if no lock is held, kAlreadyLocked if another actor
    ///         holds it and force is off, kTimeout or kIOError.
    [[nodiscard]] VoidResult release(const std::filesystem::path& archive,
                                     const std::string& actor, bool force);

    /// @brief All active locks.
    [[nodiscard]] Result<std::vector<LockRecord>> listActive();

    /// @brief True if actor currently holds the archive's lock.
    [[nodiscard]] Result<bool> isLockedBy(const std::filesystem::path& archive,
                                          const std::string& actor);

    /// @brief Check a lock listing without querying the primitive again.
    [[nodiscard]] bool isLockedBy(const std::vector<LockRecord>& records,
                                  const std::filesystem::path& archive,
                                  const std::string& actor) const;

    /// @brief Repository-relative POSIX path of the archive's marker.
    [[nodiscard]] std::string markerPathFor(const std::filesystem::path& archive) const;

    /// @brief Repository-relative POSIX identity of an archive.
    [[nodiscard]] ArchiveIdentity identityOf(const std::filesystem::path& archive) const {
        return mapper_.identityOf(archive);
    }

    [[nodiscard]] const std::filesystem::path& repoRoot() const noexcept { return repoRoot_; }

private:
    /// @brief Create and stage the marker if missing.
    VoidResult ensureMarker(const std::filesystem::path& archive);

    /// @brief Name the holder of a refusal that did not, from the lock listing.
    Error attributeRefusal(Error refusal, const std::string& markerPath,
                           const ArchiveIdentity& identity);

    transform::ArchiveTransformer mapper_;
    std::filesystem::path repoRoot_;
    LockBackend& backend_;
    vcs::VcsClient& vcs_;
};

}  // namespace cadvc::lock

#endif  // CADVC_LOCK_LOCK_COORDINATOR_H
