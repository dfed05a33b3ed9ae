#ifndef VIDTOOL_REPORT_GENERATOR_HPP
#define VIDTOOL_REPORT_GENERATOR_HPP

#include "../../../libvidtool/include/job.hpp"
#include <filesystem>

/**
 * @brief Width of the terminal attached to stdout, 80 if unknown.
 */
unsigned get_terminal_width();

/**
 * @brief Print the per-job table, the aggregate counts, and the
 * diagnostics of every failed job to stderr.
 */
void print_console_report(const vidtool::BatchResult& result, unsigned workers);

/**
 * @brief Write one CSV row per job plus a totals section.
 * @return false if the file could not be written.
 */
bool export_csv_report(const vidtool::BatchResult& result,
                       const std::filesystem::path& output_path);

#endif // VIDTOOL_REPORT_GENERATOR_HPP
