#pragma once

#include "sociograph/common/ILoggerBackend.h"
#include <fmt/format.h>
#include <memory>
#include <source_location>
#include <string>
#include <vector>

namespace sociograph {

/**
 * @brief Centralized logging facade with dependency injection support
 *
 * Usage patterns:
 * 1. Default mode: messages go to the spdlog console backend
 * 2. Custom mode: the host injects its own ILoggerBackend
 * 3. Capture mode: messages are additionally kept in memory for inspection
 *
 * Example:
 * @code
 * sociograph::Logger::initialize();
 * sociograph::Logger::enableCapture(true);
 * LOG_INFO("Layout finished after {} steps", steps);
 * auto lines = sociograph::Logger::getCapturedLogs("Layout");
 * @endcode
 */
class Logger {
public:
    /**
     * @brief Inject custom logger backend
     * @param backend Host logger backend (ownership transferred)
     */
    static void setBackend(std::unique_ptr<ILoggerBackend> backend);

    /**
     * @brief Initialize default logger (stdout only)
     */
    static void initialize();

    /**
     * @brief Initialize default logger with file output
     * @param logDir Directory for log files
     * @param logToFile Enable file logging
     */
    static void initialize(const std::string& logDir, bool logToFile = true);

    /**
     * @brief Set minimum log level
     */
    static void setLevel(LogLevel level);

    // Logging methods
    static void trace(const std::string& message,
                      const std::source_location& loc = std::source_location::current());
    static void debug(const std::string& message,
                      const std::source_location& loc = std::source_location::current());
    static void info(const std::string& message,
                     const std::source_location& loc = std::source_location::current());
    static void warn(const std::string& message,
                     const std::source_location& loc = std::source_location::current());
    static void error(const std::string& message,
                      const std::source_location& loc = std::source_location::current());

    /**
     * @brief Flush log buffers
     */
    static void flush();

    // ===== Log Capture API =====

    /**
     * @brief Enable or disable log capture
     *
     * While enabled, every message is also stored in memory with a
     * "[level] " prefix. Use getCapturedLogs() to retrieve them.
     */
    static void enableCapture(bool enable);

    static bool isCaptureEnabled();

    /**
     * @brief Get captured logs with optional filtering
     * @param pattern Optional substring filter (empty = all logs)
     * @param maxLines Maximum number of lines to return, newest kept (0 = unlimited)
     */
    static std::vector<std::string> getCapturedLogs(
        const std::string& pattern = "",
        size_t maxLines = 0);

    static void clearCapturedLogs();

private:
    static std::unique_ptr<ILoggerBackend> backend_;
    static void ensureBackend();
    static void dispatch(LogLevel level, const char* tag, const std::string& message,
                         const std::source_location& loc);
    static std::string extractFunctionName(const std::source_location& loc);
    static void captureLog(const std::string& message);
};

}  // namespace sociograph

// Logging macros with fmt-style format strings
#define LOG_TRACE(...) sociograph::Logger::trace(fmt::format(__VA_ARGS__), std::source_location::current())
#define LOG_DEBUG(...) sociograph::Logger::debug(fmt::format(__VA_ARGS__), std::source_location::current())
#define LOG_INFO(...)  sociograph::Logger::info(fmt::format(__VA_ARGS__), std::source_location::current())
#define LOG_WARN(...)  sociograph::Logger::warn(fmt::format(__VA_ARGS__), std::source_location::current())
#define LOG_ERROR(...) sociograph::Logger::error(fmt::format(__VA_ARGS__), std::source_location::current())
