#include "report_generator.hpp"
#include <algorithm>
#include <chrono>
#include <cstdio>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <regex>
#include <sstream>
#include <string>

#include <sys/ioctl.h>
#include <unistd.h>

using vidtool::BatchResult;
using vidtool::JobOutcome;
using vidtool::JobStatus;

static bool is_stderr_a_tty() {
    return isatty(fileno(stderr)) != 0;
}

unsigned get_terminal_width() {
    winsize w{};
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_col > 0)
        return w.ws_col;
    return 80;
}

static std::string strip_ansi(const std::string& s) {
    static const std::regex ansi_pattern("\033\\[[0-9;]*m");
    return std::regex_replace(s, ansi_pattern, "");
}

static std::string csv_escape(const std::string& data) {
    if (data.find_first_of(",\"\n\r") == std::string::npos) {
        return data;
    }
    std::string result;
    result.reserve(data.size() + 4);
    result.push_back('"');
    for (char c : data) {
        if (c == '"') {
            result.push_back('"'); // escape quote with another quote
        }
        result.push_back(c);
    }
    result.push_back('"');
    return result;
}

static std::string status_label(const JobStatus status, const bool colors) {
    std::string label;
    const char* color = "";
    switch (status) {
        case JobStatus::Succeeded: label = "OK";        color = "\033[1;32m"; break;
        case JobStatus::Failed:    label = "FAIL";      color = "\033[1;31m"; break;
        case JobStatus::Skipped:   label = "SKIPPED";   color = "\033[1;33m"; break;
        case JobStatus::Cancelled: label = "CANCELLED"; color = "\033[1;36m"; break;
        default:                   label = std::string(vidtool::to_string(status)); break;
    }
    return colors && *color ? color + label + "\033[0m" : label;
}

/// First line of a detail; the rest is tool output shown separately.
static std::string headline(const std::string& detail) {
    const auto nl = detail.find('\n');
    return nl == std::string::npos ? detail : detail.substr(0, nl);
}

static std::string seconds_string(const std::chrono::milliseconds d) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << static_cast<double>(d.count()) / 1000.0;
    return oss.str();
}

void print_console_report(const BatchResult& result, const unsigned workers) {
    const unsigned term_width = get_terminal_width();
    const bool use_colors = is_stderr_a_tty();

    size_t max_output = 10;
    size_t max_time = 9;
    size_t max_result = 11;
    size_t max_error = 7;
    for (const auto& o : result.outcomes) {
        max_output = std::max(max_output, o.output.filename().string().size() + 2);
        max_time   = std::max(max_time, seconds_string(o.duration).size() + 2);
        max_result = std::max(max_result, strip_ansi(status_label(o.status, false)).size() + 2);
        max_error  = std::max(max_error, std::min<size_t>(headline(o.detail).size(), 60));
    }
    max_output = std::min<size_t>(max_output, 48);

    const unsigned fixed_cols_width = static_cast<unsigned>(max_output + max_time + max_result + max_error);
    const unsigned file_col_width = term_width > fixed_cols_width + 15
                                ? term_width - fixed_cols_width
                                : 15;

    auto truncate = [](const std::string& s, const size_t max_len) {
        if (max_len < 4) return s.substr(0, max_len);
        return s.size() <= max_len ? s : s.substr(0, max_len - 3) + "...";
    };

    std::cerr << "\n"
              << std::left << std::setw(file_col_width) << "File"
              << std::setw(max_output) << "Output"
              << std::setw(max_time)   << "Time(s)"
              << std::setw(max_result) << "Result"
              << "Error"
              << "\n";

    std::uintmax_t total_before = 0;
    std::uintmax_t total_after = 0;
    for (const auto& o : result.outcomes) {
        const std::string label = status_label(o.status, use_colors);
        // setw counts escape bytes, pad by the visible width instead
        const size_t pad = max_result - std::min(max_result, strip_ansi(label).size());
        std::cerr << std::left << std::setw(file_col_width) << truncate(o.source.filename().string(), file_col_width - 1)
                  << std::setw(max_output) << truncate(o.output.filename().string(), max_output - 2)
                  << std::setw(max_time)   << seconds_string(o.duration)
                  << label << std::string(pad, ' ')
                  << truncate(headline(o.detail), 60)
                  << "\n";
        if (o.status == JobStatus::Succeeded) {
            total_before += o.source_size;
            total_after += o.output_size;
        }
    }

    const auto& c = result.counts;
    std::cerr << "\nSucceeded: " << c.succeeded
              << "  Failed: " << c.failed
              << "  Skipped: " << c.skipped
              << "  Cancelled: " << c.cancelled << "\n";
    if (total_before > 0) {
        std::cerr << "Size of converted files: " << (total_before / 1024) << " KB -> "
                  << (total_after / 1024) << " KB\n";
    }
    std::cerr << "Total time: " << seconds_string(result.duration) << " s (" << workers << " worker"
              << (workers > 1U ? "s" : "") << ")\n";

    for (const auto& o : result.outcomes) {
        if (o.status != JobStatus::Failed) continue;
        std::cerr << "\n--- " << o.source.string() << " ---\n";
        if (!o.command.empty()) std::cerr << o.command << "\n";
        std::cerr << o.detail << "\n";
    }
}

bool export_csv_report(const BatchResult& result, const std::filesystem::path& output_path) {
    std::ofstream out(output_path);
    if (!out) return false;

    out << "Index,File,Output,Result,Before(KB),After(KB),Time(s),Command,Error\n";

    for (const auto& o : result.outcomes) {
        out << (o.index + 1) << ","
            << csv_escape(o.source.string()) << ","
            << csv_escape(o.output.string()) << ","
            << csv_escape(std::string(vidtool::to_string(o.status))) << ","
            << (o.source_size / 1024) << ","
            << (o.output_size / 1024) << ","
            << seconds_string(o.duration) << ","
            << csv_escape(o.command) << ","
            << csv_escape(o.detail) << "\n";
    }

    const auto& c = result.counts;
    out << "\n\nSucceeded,Failed,Skipped,Cancelled,Total time(s),Interrupted\n";
    out << c.succeeded << "," << c.failed << "," << c.skipped << "," << c.cancelled << ","
        << seconds_string(result.duration) << ","
        << (result.cancelled ? "yes" : "no") << "\n";
    return static_cast<bool>(out);
}
