// =============================================================================
// cadvc - Logger Module
// =============================================================================
// Quill logging for the cadvc command and its git hooks.
//
// main() calls init() once with the level picked by levelForRun(). Library
// code and tests that never call init() get a console logger at warning
// level on first use, so hook runs and unit tests stay quiet unless something
// goes wrong.
//
// Usage:
//   cadvc::log::init({.logFile = "", .level = cadvc::log::levelForRun(1, false, true)});
//   CADVC_LOG_INFO("Exported {} members", count);
// =============================================================================

#ifndef CADVC_COMMON_LOGGER_H
#define CADVC_COMMON_LOGGER_H

#include <string>

#include <quill/LogMacros.h>
#include <quill/Logger.h>

namespace cadvc::log {

/// @brief Minimum severity written to the sinks.
enum class Level {
    kTrace = 0,  ///< Child process exit status and stderr (-vv)
    kDebug,      ///< Commands run and per-stage detail (-v)
    kInfo,       ///< One line per export, import or lock change
    kWarning,    ///< Skipped members, unsafe change files, lock-server trouble
    kError       ///< The operation failed
};

/// @brief Sinks and level for one cadvc invocation.
struct Config {
    /// @brief Also append to this file. Empty disables the file sink.
    std::string logFile;

    Level level = Level::kInfo;

    bool enableConsole = true;

    std::string loggerName = "cadvc";
};

/// @brief Level for a run from the global -v/-q flags.
/// @param verbosity Number of -v flags.
/// @param quiet -q was given; wins over -v.
/// @param isHook Hooks default to warning so git's own output stays readable.
[[nodiscard]] Level levelForRun(int verbosity, bool quiet, bool isHook) noexcept;

/// @brief Start the backend and create the logger. Later calls are ignored.
void init(const Config& config);

/// @brief The process logger, created at warning level if init() was not called.
[[nodiscard]] quill::Logger* logger();

[[nodiscard]] bool isInitialized() noexcept;

/// @brief Block until queued messages are written. Called before exit.
void flush();

}  // namespace cadvc::log

#define CADVC_LOG_TRACE(fmt, ...) \
    LOG_TRACE_L1(cadvc::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#define CADVC_LOG_DEBUG(fmt, ...) \
    LOG_DEBUG(cadvc::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#define CADVC_LOG_INFO(fmt, ...) \
    LOG_INFO(cadvc::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#define CADVC_LOG_WARNING(fmt, ...) \
    LOG_WARNING(cadvc::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#define CADVC_LOG_ERROR(fmt, ...) \
    LOG_ERROR(cadvc::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#endif  // CADVC_COMMON_LOGGER_H
