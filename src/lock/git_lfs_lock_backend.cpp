// =============================================================================
// cadvc - git-lfs Lock Backend Implementation
// =============================================================================

#include "cadvc/lock/lock_backend.h"

#include <vector>

#include "cadvc/common/logger.h"
#include "cadvc/vcs/vcs_client.h"

namespace cadvc::lock {

namespace {

Result<PrimitiveReply> toReply(Result<io::ProcessResult> result) {
    if (!result) {
        return std::unexpected(result.error());
    }
    PrimitiveReply reply;
    reply.accepted = result->succeeded();
    reply.text = reply.accepted ? std::move(result->stdoutText) : result->combinedOutput();
    return reply;
}

}  // namespace

Result<PrimitiveReply> GitLfsLockBackend::lock(const std::string& path, const std::string& actor) {
    CADVC_LOG_DEBUG("git lfs lock {} (as {})", path, actor);
    return toReply(git_.run({"lfs", "lock", path}));
}

Result<PrimitiveReply> GitLfsLockBackend::unlock(const std::string& path, const std::string& actor,
                                                 bool force) {
    CADVC_LOG_DEBUG("git lfs unlock {}{} (as {})", force ? "--force " : "", path, actor);
    std::vector<std::string> args{"lfs", "unlock"};
    if (force) {
        args.emplace_back("--force");
    }
    args.push_back(path);
    return toReply(git_.run(args));
}

Result<PrimitiveReply> GitLfsLockBackend::listLocks() {
    return toReply(git_.run({"lfs", "locks"}));
}

}  // namespace cadvc::lock
