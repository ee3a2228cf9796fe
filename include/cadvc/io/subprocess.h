// =============================================================================
// cadvc - Subprocess Execution
// =============================================================================
// Runs an external command (git, git-lfs) with captured output and a hard
// deadline. A child that outlives its deadline is killed with SIGKILL.
//
// Error Mapping:
// - Binary not found on PATH -> kNotFound
// - Binary not executable    -> kPermissionDenied
// - Any other launch failure -> kIOError
//
// A timed-out run is not an error at this level; the result carries
// timedOut = true and callers decide how to report it.
// =============================================================================

#ifndef CADVC_IO_SUBPROCESS_H
#define CADVC_IO_SUBPROCESS_H

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "cadvc/common/error.h"
#include "cadvc/common/types.h"

namespace cadvc::io {

/// @brief Options for a single process run.
struct ProcessOptions {
    /// @brief Working directory of the child; inherits ours when absent.
    std::optional<std::filesystem::path> workingDirectory;

    /// @brief Bytes written to the child's stdin before it is closed.
    std::string stdinData;

    /// @brief Wall-clock deadline for the whole run.
    std::chrono::milliseconds timeout = kDefaultCommandTimeout;
};

/// @brief Outcome of a process run.
struct ProcessResult {
    /// @brief Exit status, or 128 + signal number if the child was signalled.
    int exitCode = -1;

    std::string stdoutText;
    std::string stderrText;

    /// @brief True if the deadline expired and the child was killed.
    bool timedOut = false;

    /// @brief True if the child exited with status 0 before the deadline.
    [[nodiscard]] bool succeeded() const noexcept { return !timedOut && exitCode == 0; }

    /// @brief stderr followed by stdout, for error-text heuristics.
    [[nodiscard]] std::string combinedOutput() const { return stderrText + stdoutText; }
};

/// @brief Run a command and wait for it.
/// @param argv Program followed by its arguments; looked up on PATH.
/// @param options Working directory, stdin data and deadline.
/// @return The run outcome, or kNotFound / kPermissionDenied / kIOError if
///         the program could not be started.
[[nodiscard]] Result<ProcessResult> runProcess(const std::vector<std::string>& argv,
                                               const ProcessOptions& options = {});

/// @brief Render argv as a single line for log and error messages.
[[nodiscard]] std::string formatCommandLine(const std::vector<std::string>& argv);

}  // namespace cadvc::io

#endif  // CADVC_IO_SUBPROCESS_H
