#ifndef VIDTOOL_CONSOLE_LOG_SINK_HPP
#define VIDTOOL_CONSOLE_LOG_SINK_HPP

#include "../../libvidtool/include/logger.hpp"
#include <iomanip>
#include <iostream>
#include <mutex>

/**
 * @brief Writes messages at or above log_level; warnings and errors go to stderr.
 */
class ConsoleLogSink final : public ILogSink {
public:
    LogLevel log_level = LogLevel::Error;

    void log(const LogLevel level,
             const std::string_view message,
             const std::string_view tag) override {
        if (level < log_level) return;

        // progress bars and reports own stdout during a batch
        std::ostream& out = level >= LogLevel::Warning ? std::cerr : std::cout;
        std::lock_guard lock(mtx_);
        out << '[' << std::left << std::setw(5) << Logger::level_to_string(level) << "][" << tag << "] "
            << message << std::endl;
    }

private:
    std::mutex mtx_;
};

#endif // VIDTOOL_CONSOLE_LOG_SINK_HPP
