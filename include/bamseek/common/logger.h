// =============================================================================
// bamseek - Logger Module
// =============================================================================
// Process-wide Quill logger for the library.
//
// Nothing is logged until init() installs a logger. The BAMSEEK_LOG_* macros
// check for it on every call, so the tracker, BGZF source and scanner log
// unconditionally and stay silent in hosts that never configure logging.
//
// Usage:
//   bamseek::log::Config config;
//   config.logFile = "scan.log";
//   config.level = bamseek::log::levelFromString("debug");
//   bamseek::log::init(config);
//   ...
//   bamseek::log::shutdown();
// =============================================================================

#ifndef BAMSEEK_COMMON_LOGGER_H
#define BAMSEEK_COMMON_LOGGER_H

#include <string>
#include <string_view>

#include <quill/LogMacros.h>
#include <quill/Logger.h>

namespace bamseek::log {

/// @brief Severity threshold, ordered from most to least verbose.
enum class Level {
    kTrace = 0,
    kDebug,
    kInfo,
    kWarning,
    kError,
    kCritical
};

/// @brief Where and how much to log.
struct Config {
    /// @brief Log file path, truncated on init. Empty disables file output.
    std::string logFile;

    Level level = Level::kInfo;

    /// @brief Also write to stdout. Forced on when logFile is empty.
    bool enableConsole = true;

    std::string loggerName = "bamseek";
};

/// @brief Start the Quill backend and install the library logger.
/// @note A second call before shutdown() keeps the first configuration.
void init(const Config& config);

/// @brief The installed logger, or nullptr when logging is off.
[[nodiscard]] quill::Logger* logger() noexcept;

/// @brief Drain pending messages, stop the backend and uninstall the logger.
void shutdown();

/// @brief Parse a level name case-insensitively.
/// @note Accepts "warn" and "fatal" as aliases; anything unknown is kInfo.
[[nodiscard]] Level levelFromString(std::string_view name) noexcept;

}  // namespace bamseek::log

#define BAMSEEK_LOG_IMPL(macro, fmt, ...)                                \
    do {                                                                 \
        if (quill::Logger* bamseekLogger_ = bamseek::log::logger()) {    \
            macro(bamseekLogger_, fmt __VA_OPT__(, ) __VA_ARGS__);       \
        }                                                                \
    } while (false)

#define BAMSEEK_LOG_TRACE(fmt, ...) BAMSEEK_LOG_IMPL(LOG_TRACE_L1, fmt __VA_OPT__(, ) __VA_ARGS__)

#define BAMSEEK_LOG_DEBUG(fmt, ...) BAMSEEK_LOG_IMPL(LOG_DEBUG, fmt __VA_OPT__(, ) __VA_ARGS__)

#define BAMSEEK_LOG_INFO(fmt, ...) BAMSEEK_LOG_IMPL(LOG_INFO, fmt __VA_OPT__(, ) __VA_ARGS__)

#define BAMSEEK_LOG_WARNING(fmt, ...) BAMSEEK_LOG_IMPL(LOG_WARNING, fmt __VA_OPT__(, ) __VA_ARGS__)

#define BAMSEEK_LOG_ERROR(fmt, ...) BAMSEEK_LOG_IMPL(LOG_ERROR, fmt __VA_OPT__(, ) __VA_ARGS__)

#define BAMSEEK_LOG_CRITICAL(fmt, ...) \
    BAMSEEK_LOG_IMPL(LOG_CRITICAL, fmt __VA_OPT__(, ) __VA_ARGS__)

#endif  // BAMSEEK_COMMON_LOGGER_H
