#ifndef VIDTOOL_LOG_SINK_HPP
#define VIDTOOL_LOG_SINK_HPP

#include <string_view>

/**
 * @brief Severity levels for log messages.
 *
 * Ordered from least to most severe, so sinks can filter with a simple
 * comparison against their threshold.
 */
enum class LogLevel {
    Debug,   ///< Detailed diagnostic information (commands, cache hits)
    Info,    ///< Normal operation (job started, preset saved)
    Warning, ///< Recoverable problems (probe failure on one candidate)
    Error    ///< Failures that require attention
};

/**
 * @brief Abstract sink interface for logging.
 *
 * Implementations of ILogSink define how log messages are delivered
 * (console, rotating file, GUI bridge). The Logger class fans messages
 * out to every installed sink.
 */
struct ILogSink {
    virtual ~ILogSink() = default;

    /**
     * @brief Log a message.
     * @param level Severity level of the message.
     * @param message The message text.
     * @param tag Tag identifying the source component.
     */
    virtual void log(LogLevel level,
                     std::string_view message,
                     std::string_view tag) = 0;
};

#endif // VIDTOOL_LOG_SINK_HPP
