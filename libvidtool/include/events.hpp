#ifndef VIDTOOL_EVENTS_HPP
#define VIDTOOL_EVENTS_HPP

#include "job.hpp"
#include <filesystem>
#include <string>
#include <chrono>
#include <cstddef>

namespace vidtool {

/**
 * @brief Events published while selecting files and running a batch.
 *
 * These lightweight structs are used with EventBus and EventLog to notify
 * subscribers (CLI, report generator, GUI) about progress, errors, and
 * results. One event is emitted per Job state transition.
 */

// --- Selection ---

/**
 * @brief Emitted when a candidate is excluded because it could not be probed.
 */
struct SelectionWarningEvent {
    std::filesystem::path path; ///< Excluded candidate
    std::string message;        ///< Probe error description
};

// --- Batch ---

/**
 * @brief Emitted once, before the first job is planned.
 */
struct BatchStartEvent {
    std::size_t total = 0; ///< Number of jobs in the batch
};

/**
 * @brief Emitted when a job leaves Pending and its process is about to be spawned.
 */
struct JobStartEvent {
    std::size_t index = 0;         ///< Position of the job in the selection
    std::filesystem::path source;  ///< Input file
    std::filesystem::path output;  ///< Final output path
    std::string command;           ///< Display form of the tool invocation
};

/**
 * @brief Emitted while the transcode tool reports progress.
 */
struct JobProgressEvent {
    std::size_t index = 0;                 ///< Position of the job in the selection
    double percent = 0.0;                  ///< 0-100, relative to the source duration
    std::chrono::milliseconds out_time{0}; ///< Media time written so far
};

/**
 * @brief Emitted when a job settles in a terminal status.
 */
struct JobCompleteEvent {
    std::size_t index = 0;                 ///< Position of the job in the selection
    std::filesystem::path source;          ///< Input file
    std::filesystem::path output;          ///< Output path (may be empty if never resolved)
    JobStatus status = JobStatus::Pending; ///< Terminal status
    std::string detail;                    ///< Error or skip reason, tool diagnostics on failure
    std::chrono::milliseconds duration{0}; ///< Wall time spent on the job
};

/**
 * @brief Running aggregate, emitted after each JobCompleteEvent.
 */
struct BatchProgressEvent {
    BatchCounts counts;    ///< Settled jobs per status
    std::size_t total = 0; ///< Number of jobs in the batch
};

/**
 * @brief Emitted once all jobs have settled.
 */
struct BatchCompleteEvent {
    BatchCounts counts;                    ///< Final per-status counts
    bool cancelled = false;                ///< True if a stop was requested
    std::chrono::milliseconds duration{0}; ///< Wall time of the whole batch
};

} // namespace vidtool

#endif // VIDTOOL_EVENTS_HPP
