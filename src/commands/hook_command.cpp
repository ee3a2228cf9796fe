// =============================================================================
// cadvc - Hook Command Implementation
// =============================================================================

#include "hook_command.h"

#include <iostream>
#include <iterator>

#include <fmt/format.h>

#include "cadvc/common/error.h"
#include "cadvc/common/logger.h"
#include "cadvc/lifecycle/lifecycle.h"
#include "cadvc/lock/lock_backend.h"
#include "cadvc/vcs/vcs_client.h"

namespace cadvc::commands {

namespace {

/// @brief Events whose hook receives data on stdin.
bool readsStdin(lifecycle::LifecycleEvent event) noexcept {
    return event == lifecycle::LifecycleEvent::kPrePush ||
           event == lifecycle::LifecycleEvent::kPostRewrite;
}

/// @brief Events that check locks for the acting user.
bool needsActor(lifecycle::LifecycleEvent event) noexcept {
    return event == lifecycle::LifecycleEvent::kPreCommit ||
           event == lifecycle::LifecycleEvent::kPrePush;
}

}  // namespace

HookCommand::HookCommand(HookOptions options, std::istream& input)
    : options_(std::move(options)), input_(input) {}

int HookCommand::execute() {
    using lifecycle::HookStatus;

    const auto event = lifecycle::parseEvent(options_.event);
    if (!event.has_value()) {
        std::cerr << fmt::format("Error: unknown hook '{}'\n", options_.event);
        return lifecycle::toExitCode(HookStatus::kFatal);
    }

    try {
        lifecycle::HookInvocation invocation;
        invocation.event = *event;
        invocation.args = options_.args;
        if (readsStdin(*event)) {
            invocation.stdinData.assign(std::istreambuf_iterator<char>(input_),
                                        std::istreambuf_iterator<char>());
        }

        vcs::GitClient git(options_.repoRoot);
        if (needsActor(*event)) {
            auto name = git.userName();
            if (name) {
                invocation.actor = *name;
            } else {
                CADVC_LOG_WARNING("Cannot read user.name: {}", name.error().message());
            }
        }

        lock::GitLfsLockBackend backend(git);
        lifecycle::LifecycleDispatcher dispatcher(options_.repoRoot, git, backend, std::cerr);
        return lifecycle::toExitCode(dispatcher.dispatch(invocation));

    } catch (const std::exception& e) {
        CADVC_LOG_ERROR("{} hook failed: {}", options_.event, e.what());
        std::cerr << fmt::format("Error: {} hook failed: {}\n", options_.event, e.what());
        return lifecycle::toExitCode(HookStatus::kFatal);
    }
}

std::unique_ptr<HookCommand> createHookCommand(const std::string& event,
                                               std::vector<std::string> args,
                                               const std::filesystem::path& repoRoot) {
    HookOptions opts;
    opts.event = event;
    opts.args = std::move(args);
    opts.repoRoot = repoRoot;
    return std::make_unique<HookCommand>(std::move(opts), std::cin);
}

}  // namespace cadvc::commands
