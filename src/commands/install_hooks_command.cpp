// =============================================================================
// cadvc - Install Hooks Command Implementation
// =============================================================================

#include "install_hooks_command.h"

#include <iostream>

#include <fmt/format.h>

#include "cadvc/common/error.h"
#include "cadvc/common/logger.h"
#include "cadvc/io/file_io.h"
#include "cadvc/lifecycle/lifecycle.h"
#include "cadvc/vcs/vcs_client.h"
#include "command_support.h"

namespace cadvc::commands {

namespace fs = std::filesystem;

namespace {

/// @brief Quote a word for /bin/sh.
std::string shellQuote(std::string_view word) {
    std::string quoted = "'";
    for (const char c : word) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += '\'';
    return quoted;
}

bool isOurHook(const fs::path& script) {
    auto text = tryExecute([&] { return io::readFileText(script); });
    return text && text->find(kHookMarker) != std::string::npos;
}

}  // namespace

std::string renderHookScript(std::string_view executable, std::string_view event) {
    return fmt::format("#!/bin/sh\n{}\nexec {} hook {} \"$@\"\n", kHookMarker,
                       shellQuote(executable), event);
}

InstallHooksCommand::InstallHooksCommand(InstallHooksOptions options)
    : options_(std::move(options)) {}

fs::path InstallHooksCommand::hooksDirectory() const {
    vcs::GitClient git(options_.repoRoot);
    auto out = git.capture({"rev-parse", "--git-path", "hooks"});
    if (out) {
        const auto lines = vcs::splitLines(*out);
        if (!lines.empty()) {
            fs::path dir(lines.front());
            return dir.is_absolute() ? dir : options_.repoRoot / dir;
        }
    }
    CADVC_LOG_DEBUG("git rev-parse --git-path hooks unavailable, using .git/hooks");
    return options_.repoRoot / ".git" / "hooks";
}

int InstallHooksCommand::execute() {
    try {
        const fs::path dir = hooksDirectory();
        fs::create_directories(dir);

        std::size_t skipped = 0;
        for (const auto event : lifecycle::kAllEvents) {
            const std::string name(lifecycle::eventName(event));
            const fs::path script = dir / name;

            std::error_code ec;
            if (fs::exists(script, ec) && !options_.force && !isOurHook(script)) {
                std::cerr << fmt::format("Skipping {}: existing hook not written by cadvc "
                                         "(use --force to replace)\n",
                                         script.string());
                ++skipped;
                continue;
            }

            io::writeFileText(script, renderHookScript(options_.executable, name));
            fs::permissions(script,
                            fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec |
                                fs::perms::others_read | fs::perms::others_exec,
                            fs::perm_options::replace);
            std::cout << fmt::format("Installed {}\n", script.string());
        }

        if (skipped > 0) {
            return toExitCode(ErrorCode::kUsageError);
        }
        return 0;

    } catch (const CadvcException& e) {
        CADVC_LOG_ERROR("Installing hooks failed: {}", e.what());
        return e.exitCode();
    } catch (const fs::filesystem_error& e) {
        CADVC_LOG_ERROR("Installing hooks failed: {}", e.what());
        return toExitCode(errorCodeFromSystem(e.code()));
    } catch (const std::exception& e) {
        CADVC_LOG_ERROR("Unexpected error: {}", e.what());
        return toExitCode(ErrorCode::kInternal);
    }
}

std::unique_ptr<InstallHooksCommand> createInstallHooksCommand(const std::string& executable,
                                                               bool force,
                                                               const fs::path& repoRoot) {
    InstallHooksOptions opts;
    if (!executable.empty()) {
        opts.executable = executable;
    }
    opts.force = force;
    opts.repoRoot = repoRoot;
    return std::make_unique<InstallHooksCommand>(std::move(opts));
}

}  // namespace cadvc::commands
