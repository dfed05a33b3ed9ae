/**
 * @file logger.hpp
 * @brief Provides a static, thread-safe logging facade.
 *
 * Logger is the global entry point for all logging in vidtool. It
 * delegates log messages to one or more registered ILogSink implementations.
 */

#ifndef VIDTOOL_LOGGER_HPP
#define VIDTOOL_LOGGER_HPP

#include "log_sink.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Static logging facade for vidtool.
 *
 * Worker threads of the orchestrator log concurrently, so every
 * operation takes the sink mutex.
 */
class Logger {
public:
    /**
     * @brief Add a new log sink to the logger.
     * The Logger takes ownership of the sink.
     * @param sink Unique pointer to a sink implementation.
     */
    static void add_sink(std::unique_ptr<ILogSink> sink);

    /**
     * @brief Remove all configured sinks.
     */
    static void clear_sinks();

    /**
     * @brief Log a message to all registered sinks.
     * @param level Severity level.
     * @param msg Message text.
     * @param tag Optional tag (default: "vidtool").
     */
    static void log(LogLevel level,
                    std::string_view msg,
                    std::string_view tag = "vidtool");

    /**
     * @brief Converts a LogLevel enum to its string representation.
     */
    static const char* level_to_string(const LogLevel level) {
        switch (level) {
            case LogLevel::Debug:   return "DEBUG";
            case LogLevel::Info:    return "INFO";
            case LogLevel::Warning: return "WARN";
            case LogLevel::Error:   return "ERROR";
        }
        return "";
    }

    /**
     * @brief Converts a level name to its LogLevel.
     *
     * Case-insensitive. "NONE" and unknown names yield std::nullopt,
     * which callers use to mean "install no console sink".
     */
    static std::optional<LogLevel> string_to_level(std::string level);

private:
    ///< List of all registered sink implementations.
    static std::vector<std::unique_ptr<ILogSink>> sinks_;
    ///< Protects access to the sinks_ vector.
    static std::mutex mtx_;
};

#endif // VIDTOOL_LOGGER_HPP
