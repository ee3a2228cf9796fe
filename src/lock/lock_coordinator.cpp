// =============================================================================
// cadvc - Lock Coordinator Implementation
// =============================================================================

#include "cadvc/lock/lock_coordinator.h"

#include <algorithm>
#include <cctype>

#include <fmt/format.h>

#include "cadvc/algo/glob.h"
#include "cadvc/common/logger.h"
#include "cadvc/io/file_io.h"
#include "cadvc/vcs/vcs_client.h"

namespace cadvc::lock {

namespace fs = std::filesystem;

namespace {

constexpr std::string_view kBlank = " \t\r\n";

std::string_view trim(std::string_view text) noexcept {
    const auto first = text.find_first_not_of(kBlank);
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(kBlank);
    return text.substr(first, last - first + 1);
}

std::string toLower(std::string_view text) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

std::vector<std::string> splitFields(std::string_view line) {
    std::vector<std::string> fields;
    const bool tabbed = line.find('\t') != std::string_view::npos;
    const std::string_view separators = tabbed ? "\t" : " \t";

    std::size_t pos = 0;
    while (pos < line.size()) {
        const auto end = std::min(line.find_first_of(separators, pos), line.size());
        const auto field = trim(line.substr(pos, end - pos));
        if (!field.empty()) {
            fields.emplace_back(field);
        }
        pos = end + 1;
    }
    return fields;
}

std::optional<ArchiveIdentity> readMarkerIdentity(const fs::path& marker) {
    std::error_code ec;
    if (!fs::is_regular_file(marker, ec)) {
        return std::nullopt;
    }
    auto text = tryExecute([&] { return io::readFileText(marker); });
    if (!text) {
        CADVC_LOG_DEBUG("Cannot read marker {}: {}", marker.string(), text.error().message());
        return std::nullopt;
    }
    const auto identity = trim(*text);
    if (identity.empty()) {
        return std::nullopt;
    }
    return ArchiveIdentity(identity);
}

}  // namespace

// =============================================================================
// Listing and Refusal Parsing
// =============================================================================

std::vector<LockRecord> parseLockListing(std::string_view text) {
    std::vector<LockRecord> records;

    for (const auto& line : vcs::splitLines(text)) {
        const auto content = trim(line);
        if (content.empty() || content.starts_with("--")) {
            continue;
        }
        auto fields = splitFields(content);
        if (fields.size() < 2) {
            continue;
        }

        LockRecord record;
        record.markerPath = std::move(fields[0]);
        record.owner = std::move(fields[1]);
        if (fields.size() > 2) {
            std::string_view id = fields[2];
            if (id.starts_with("ID:")) {
                id.remove_prefix(3);
            }
            record.lockId = std::string(id);
        }
        records.push_back(std::move(record));
    }
    return records;
}

std::string extractLockOwner(std::string_view text) {
    const std::string lower = toLower(text);

    for (std::string_view key : {"locked by ", "owned by ", " by "}) {
        const auto at = lower.find(key);
        if (at == std::string::npos) {
            continue;
        }
        std::string_view rest = trim(text.substr(at + key.size()));
        rest = rest.substr(0, std::min(rest.find_first_of(kBlank), rest.size()));
        while (!rest.empty() && std::string_view("'\"`").find(rest.front()) != std::string_view::npos) {
            rest.remove_prefix(1);
        }
        while (!rest.empty() &&
               std::string_view(".,:;'\"`)").find(rest.back()) != std::string_view::npos) {
            rest.remove_suffix(1);
        }
        if (!rest.empty()) {
            return std::string(rest);
        }
    }
    return std::string(kUnknownLockOwner);
}

Error classifyRefusal(std::string_view text, std::string_view path) {
    const std::string lower = toLower(text);

    if (lower.find("not locked") != std::string::npos ||
        lower.find("lock not found") != std::string::npos ||
        lower.find("no matching locks") != std::string::npos) {
        return Error(ErrorCode::kNotLocked, fmt::format("{} is not locked", path));
    }

    if (lower.find("already locked") != std::string::npos ||
        lower.find("lock exists") != std::string::npos ||
        lower.find("locked by") != std::string::npos ||
        lower.find("owned by") != std::string::npos) {
        std::string owner = extractLockOwner(text);
        Error error(ErrorCode::kAlreadyLocked, fmt::format("{} is locked by {}", path, owner));
        error.withLockOwner(std::move(owner));
        return error;
    }

    return Error(ErrorCode::kIOError,
                 fmt::format("Lock request for {} refused: {}", path, trim(text)));
}

// =============================================================================
// LockCoordinator Implementation
// =============================================================================

LockCoordinator::LockCoordinator(RepositoryConfig config, fs::path repoRoot, LockBackend& backend,
                                 vcs::VcsClient& vcs)
    : mapper_(std::move(config), repoRoot),
      repoRoot_(std::move(repoRoot)),
      backend_(backend),
      vcs_(vcs) {}

std::string LockCoordinator::markerPathFor(const fs::path& archive) const {
    return algo::posixRelative(mapper_.treeRootFor(archive) / kLockFileName, repoRoot_);
}

VoidResult LockCoordinator::ensureMarker(const fs::path& archive) {
    const fs::path marker = repoRoot_ / markerPathFor(archive);

    std::error_code ec;
    if (fs::exists(marker, ec)) {
        return makeVoidSuccess();
    }

    auto created = tryExecute([&] {
        fs::create_directories(marker.parent_path());
        io::writeFileText(marker, identityOf(archive) + "\n");
    });
    if (!created) {
        return created;
    }
    CADVC_LOG_INFO("Created lock marker {}", marker.string());

    return vcs_.add(marker);
}

VoidResult LockCoordinator::acquire(const fs::path& archive, const std::string& actor, bool force) {
    if (actor.empty()) {
        return makeVoidError(ErrorCode::kUsageError, "No acting user; set git config user.name");
    }
    if (auto marker = ensureMarker(archive); !marker) {
        return marker;
    }

    const std::string path = markerPathFor(archive);

    if (force) {
        auto stolen = backend_.unlock(path, actor, true);
        if (!stolen) {
            return std::unexpected(stolen.error());
        }
        if (!stolen->accepted) {
            CADVC_LOG_WARNING("Force release of {} failed: {}", path, trim(stolen->text));
        }
    }

    auto reply = backend_.lock(path, actor);
    if (!reply) {
        return std::unexpected(reply.error());
    }
    if (reply->accepted) {
        CADVC_LOG_INFO("{} locked {}", actor, identityOf(archive));
        return makeVoidSuccess();
    }

    Error refusal = attributeRefusal(classifyRefusal(reply->text, identityOf(archive)), path,
                                     identityOf(archive));
    if (refusal.code() == ErrorCode::kAlreadyLocked && refusal.lockOwner() == actor) {
        CADVC_LOG_INFO("{} already holds {}", actor, identityOf(archive));
        return makeVoidSuccess();
    }
    return std::unexpected(std::move(refusal));
}

VoidResult LockCoordinator::release(const fs::path& archive, const std::string& actor, bool force) {
    const std::string path = markerPathFor(archive);

    auto reply = backend_.unlock(path, actor, force);
    if (!reply) {
        return std::unexpected(reply.error());
    }
    if (!reply->accepted) {
        return std::unexpected(attributeRefusal(classifyRefusal(reply->text, identityOf(archive)),
                                                path, identityOf(archive)));
    }

    CADVC_LOG_INFO("{} released {}", actor, identityOf(archive));
    return makeVoidSuccess();
}

Error LockCoordinator::attributeRefusal(Error refusal, const std::string& markerPath,
                                        const ArchiveIdentity& identity) {
    // git-lfs only says "Lock exists"; the listing knows who holds it
    if (refusal.code() != ErrorCode::kAlreadyLocked ||
        refusal.lockOwner() != std::string(kUnknownLockOwner)) {
        return refusal;
    }

    auto records = listActive();
    if (!records) {
        CADVC_LOG_DEBUG("Cannot look up holder of {}: {}", identity, records.error().message());
        return refusal;
    }
    for (const auto& record : *records) {
        if (record.markerPath == markerPath) {
            Error named(ErrorCode::kAlreadyLocked,
                        fmt::format("{} is locked by {}", identity, record.owner));
            named.withLockOwner(record.owner);
            return named;
        }
    }
    return refusal;
}

Result<std::vector<LockRecord>> LockCoordinator::listActive() {
    auto reply = backend_.listLocks();
    if (!reply) {
        return std::unexpected(reply.error());
    }
    if (!reply->accepted) {
        return makeError<std::vector<LockRecord>>(
            ErrorCode::kIOError, fmt::format("Cannot list locks: {}", trim(reply->text)));
    }

    auto records = parseLockListing(reply->text);
    for (auto& record : records) {
        record.archive = readMarkerIdentity(repoRoot_ / record.markerPath);
    }
    return records;
}

Result<bool> LockCoordinator::isLockedBy(const fs::path& archive, const std::string& actor) {
    auto records = listActive();
    if (!records) {
        return std::unexpected(records.error());
    }
    return isLockedBy(*records, archive, actor);
}

bool LockCoordinator::isLockedBy(const std::vector<LockRecord>& records, const fs::path& archive,
                                 const std::string& actor) const {
    const std::string marker = markerPathFor(archive);
    return std::any_of(records.begin(), records.end(), [&](const LockRecord& record) {
        return record.owner == actor && record.markerPath == marker;
    });
}

}  // namespace cadvc::lock
