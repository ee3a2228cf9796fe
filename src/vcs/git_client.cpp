// =============================================================================
// cadvc - Git Client Implementation
// =============================================================================

#include "cadvc/vcs/vcs_client.h"

#include <algorithm>

#include <fmt/format.h>

#include "cadvc/algo/glob.h"
#include "cadvc/common/logger.h"

namespace cadvc::vcs {

namespace fs = std::filesystem;

bool isNullObjectId(std::string_view objectId) noexcept {
    return !objectId.empty() &&
           std::all_of(objectId.begin(), objectId.end(), [](char c) { return c == '0'; });
}

std::vector<std::string> splitLines(std::string_view text) {
    std::vector<std::string> lines;
    std::size_t start = 0;
    while (start <= text.size()) {
        std::size_t end = text.find('\n', start);
        if (end == std::string_view::npos) {
            end = text.size();
        }
        std::string_view line = text.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        if (!line.empty()) {
            lines.emplace_back(line);
        }
        start = end + 1;
    }
    return lines;
}

namespace {

/// @brief Sorted, de-duplicated line list.
std::vector<std::string> uniqueLines(std::string_view text) {
    auto lines = splitLines(text);
    std::sort(lines.begin(), lines.end());
    lines.erase(std::unique(lines.begin(), lines.end()), lines.end());
    return lines;
}

std::string trimmed(std::string_view text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return std::string(text.substr(first, last - first + 1));
}

}  // namespace

// =============================================================================
// GitClient Implementation
// =============================================================================

GitClient::GitClient(fs::path repoRoot, std::chrono::milliseconds timeout)
    : repoRoot_(std::move(repoRoot)), timeout_(timeout) {}

Result<io::ProcessResult> GitClient::run(const std::vector<std::string>& args,
                                         const std::string& stdinData) const {
    std::vector<std::string> argv;
    argv.reserve(args.size() + 1);
    argv.emplace_back("git");
    argv.insert(argv.end(), args.begin(), args.end());

    io::ProcessOptions options;
    options.workingDirectory = repoRoot_;
    options.stdinData = stdinData;
    options.timeout = timeout_;

    auto result = io::runProcess(argv, options);
    if (!result) {
        return result;
    }
    if (result->timedOut) {
        return makeError<io::ProcessResult>(
            ErrorCode::kTimeout, fmt::format("'{}' did not finish within {} s",
                                             io::formatCommandLine(argv),
                                             std::chrono::duration_cast<std::chrono::seconds>(
                                                 timeout_)
                                                 .count()));
    }
    return result;
}

Result<std::string> GitClient::capture(const std::vector<std::string>& args,
                                       const std::string& stdinData) const {
    auto result = run(args, stdinData);
    if (!result) {
        return std::unexpected(result.error());
    }
    if (!result->succeeded()) {
        return makeError<std::string>(
            ErrorCode::kIOError,
            fmt::format("git {} failed ({}): {}", args.empty() ? "" : args.front(),
                        result->exitCode, trimmed(result->combinedOutput())));
    }
    return std::move(result->stdoutText);
}

Result<std::vector<std::string>> GitClient::stagedModifiedFiles() {
    // Refresh stat info first so touched-but-unchanged files do not show up
    if (auto refreshed = run({"update-index", "-q", "--refresh"}); !refreshed) {
        CADVC_LOG_DEBUG("update-index --refresh failed: {}", refreshed.error().message());
    }

    // An unborn branch has no HEAD to compare the index with
    const std::string base =
        refExists("HEAD") ? std::string("HEAD") : std::string(kEmptyTreeObjectId);
    auto out = capture({"diff-index", "--cached", "--name-only", "--diff-filter=CDMRTUXB", base});
    if (!out) {
        return std::unexpected(out.error());
    }
    return uniqueLines(*out);
}

Result<std::vector<std::string>> GitClient::changedFiles(const std::string& oldRef,
                                                         const std::string& newRef) {
    auto out = capture({"diff-tree", "--no-commit-id", "--name-only", "-r", oldRef, newRef});
    if (!out) {
        return std::unexpected(out.error());
    }
    return uniqueLines(*out);
}

Result<std::vector<std::string>> GitClient::pushedFiles(const std::string& localSha,
                                                        const std::optional<std::string>& remoteSha) {
    std::vector<std::string> args{"log", "--name-only", "--format="};
    if (remoteSha.has_value()) {
        args.push_back(fmt::format("{}..{}", *remoteSha, localSha));
    } else {
        args.push_back(localSha);
        args.emplace_back("--not");
        args.emplace_back("--remotes");
    }

    auto out = capture(args);
    if (!out) {
        return std::unexpected(out.error());
    }
    return uniqueLines(*out);
}

Result<std::optional<std::string>> GitClient::userName() {
    auto result = run({"config", "--get", "user.name"});
    if (!result) {
        return std::unexpected(result.error());
    }
    // Exit status 1 means the key is not set
    if (result->exitCode == 1) {
        return std::optional<std::string>{};
    }
    if (!result->succeeded()) {
        return makeError<std::optional<std::string>>(
            ErrorCode::kIOError,
            fmt::format("git config failed: {}", trimmed(result->stderrText)));
    }
    std::string name = trimmed(result->stdoutText);
    if (name.empty()) {
        return std::optional<std::string>{};
    }
    return std::optional<std::string>{std::move(name)};
}

VoidResult GitClient::add(const fs::path& path) {
    const std::string target =
        path.is_absolute() ? algo::posixRelative(path, repoRoot_) : path.generic_string();
    auto out = capture({"add", "--", target});
    if (!out) {
        return std::unexpected(out.error());
    }
    return makeVoidSuccess();
}

bool GitClient::isRebaseInProgress() {
    for (const char* marker : {"rebase-merge", "rebase-apply"}) {
        auto out = capture({"rev-parse", "--git-path", marker});
        fs::path location;
        if (out) {
            location = fs::path(trimmed(*out));
            if (location.is_relative()) {
                location = repoRoot_ / location;
            }
        } else {
            location = repoRoot_ / ".git" / marker;
        }
        std::error_code ec;
        if (fs::exists(location, ec)) {
            return true;
        }
    }
    return false;
}

bool GitClient::refExists(const std::string& ref) {
    auto result = run({"rev-parse", "--verify", "--quiet", ref + "^{commit}"});
    return result && result->succeeded();
}

VoidResult GitClient::runLfsHook(const std::string& hook, const std::vector<std::string>& args,
                                 const std::string& stdinData) {
    std::vector<std::string> lfsArgs{"lfs", hook};
    lfsArgs.insert(lfsArgs.end(), args.begin(), args.end());
    auto out = capture(lfsArgs, stdinData);
    if (!out) {
        return std::unexpected(out.error());
    }
    return makeVoidSuccess();
}

VoidResult GitClient::lfsPull() {
    auto out = capture({"lfs", "pull"});
    if (!out) {
        return std::unexpected(out.error());
    }
    return makeVoidSuccess();
}

Result<fs::path> GitClient::discoverRoot(const fs::path& start, std::chrono::milliseconds timeout) {
    GitClient git(start, timeout);
    auto out = git.capture({"rev-parse", "--show-toplevel"});
    if (!out) {
        return makeError<fs::path>(
            out.error().code() == ErrorCode::kIOError ? ErrorCode::kNotFound : out.error().code(),
            fmt::format("{} is not inside a git working tree", start.string()));
    }
    return fs::path(trimmed(*out));
}

}  // namespace cadvc::vcs
