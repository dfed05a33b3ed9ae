#ifndef VIDTOOL_FILE_LOG_SINK_HPP
#define VIDTOOL_FILE_LOG_SINK_HPP

#include "../../libvidtool/include/log_sink.hpp"
#include "../../libvidtool/include/logger.hpp"
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <mutex>
#include <string>
#include <system_error>

/**
 * @brief Appends timestamped lines to a file, rotating it past max_bytes.
 *
 * Rotation shifts vidtool.log -> vidtool.log.1 -> ... -> vidtool.log.<backups>.
 */
class FileLogSink final : public ILogSink {
public:
    static constexpr std::uintmax_t DEFAULT_MAX_BYTES = 10 * 1024 * 1024;
    static constexpr int DEFAULT_BACKUPS = 3;

    explicit FileLogSink(std::filesystem::path filename,
                         const bool append = true,
                         const std::uintmax_t max_bytes = DEFAULT_MAX_BYTES,
                         const int backups = DEFAULT_BACKUPS)
        : path_(std::move(filename)), max_bytes_(max_bytes), backups_(backups) {
        std::error_code ec;
        if (path_.has_parent_path()) std::filesystem::create_directories(path_.parent_path(), ec);
        out_.open(path_, append ? std::ios::app : std::ios::trunc);
        written_ = append ? std::filesystem::file_size(path_, ec) : 0;
        if (ec) written_ = 0;
    }

    void log(const LogLevel level,
             const std::string_view message,
             const std::string_view tag) override {
        std::lock_guard lock(mtx_);
        if (!out_.is_open()) return;

        std::string line = timestamp();
        line += " [";
        line += Logger::level_to_string(level);
        line += "]";
        if (!tag.empty()) {
            line += "[";
            line += tag;
            line += "]";
        }
        line += " ";
        line += message;
        line += "\n";

        if (max_bytes_ > 0 && written_ + line.size() > max_bytes_ && written_ > 0) rotate();

        out_ << line;
        out_.flush();
        written_ += line.size();
    }

private:
    static std::string timestamp() {
        const auto now = std::chrono::system_clock::now();
        const std::time_t t = std::chrono::system_clock::to_time_t(now);
        std::tm tm{};
        localtime_r(&t, &tm);
        std::ostringstream oss;
        oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
        return oss.str();
    }

    void rotate() {
        out_.close();
        std::error_code ec;
        const auto numbered = [this](const int n) {
            return std::filesystem::path(path_.string() + "." + std::to_string(n));
        };
        std::filesystem::remove(numbered(backups_), ec);
        for (int n = backups_ - 1; n >= 1; --n) {
            if (std::filesystem::exists(numbered(n), ec)) std::filesystem::rename(numbered(n), numbered(n + 1), ec);
        }
        if (backups_ > 0) {
            std::filesystem::rename(path_, numbered(1), ec);
        }
        out_.open(path_, std::ios::trunc);
        written_ = 0;
    }

    std::filesystem::path path_;
    std::uintmax_t max_bytes_;
    int backups_;
    std::uintmax_t written_ = 0;
    std::ofstream out_;
    std::mutex mtx_;
};

#endif // VIDTOOL_FILE_LOG_SINK_HPP
