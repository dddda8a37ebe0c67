#pragma once

#include <source_location>
#include <string>

namespace sociograph {

/// Severity of a log line. Off silences a backend entirely.
enum class LogLevel {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Critical = 5,
    Off = 6
};

/// Sink behind the Logger facade.
///
/// SpdlogBackend is installed on first use. Graph rejections, failed algorithm
/// runs and clamped layout options all reach the backend as already formatted
/// text, prefixed with the reporting function. A host or test fixture can
/// replace it through Logger::setBackend() and restore the default by passing
/// nullptr.
class ILoggerBackend {
public:
    virtual ~ILoggerBackend() = default;

    /// Receives one formatted line. loc points at the LOG_* call site.
    virtual void log(LogLevel level, const std::string& message,
                     const std::source_location& loc) = 0;

    virtual void setLevel(LogLevel level) = 0;
    virtual void flush() = 0;
};

}  // namespace sociograph
