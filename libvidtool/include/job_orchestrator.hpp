/**
 * @file job_orchestrator.hpp
 * @brief Top-level driver of a transcode batch.
 *
 * This file contains the JobOrchestrator class, which turns a selection
 * into Jobs, runs them on a bounded set of worker slots, and reports
 * their progress and outcome.
 */

#ifndef VIDTOOL_JOB_ORCHESTRATOR_HPP
#define VIDTOOL_JOB_ORCHESTRATOR_HPP

#include "event_bus.hpp"
#include "event_log.hpp"
#include "job.hpp"
#include "media_prober.hpp"
#include "path_templater.hpp"
#include "process_runner.hpp"
#include "thread_pool.hpp"
#include "transcode_options.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <stop_token>
#include <string_view>
#include <vector>

namespace vidtool {

/**
 * @brief Decides whether an existing output may be overwritten (prompt policy).
 * @return true to overwrite, false to skip the job.
 */
using CollisionHandler = std::function<bool(const std::filesystem::path& source,
                                            const std::filesystem::path& output)>;

/**
 * @brief Orchestrates planning, execution and reporting of a batch.
 *
 * @details Two phases:
 * - plan(): probe every source on the worker slots, then, in selection
 *   order, resolve its output path and build its command. Rejections
 *   settle the job as Skipped (or Failed for an unprobeable source)
 *   before anything is spawned.
 * - execute(): run the Pending jobs, one transcode process per worker
 *   slot. Output goes to a temporary sibling that is renamed into place
 *   on success and removed otherwise.
 *
 * A Job is only touched by the task running it. Outcomes accumulate in a
 * BatchResult guarded by a mutex; observers read snapshot() or the
 * append-only events() log instead of shared fields.
 */
class JobOrchestrator {
public:
    /**
     * @param prober Shared with the Selector so descriptors are probed once.
     * @param runner Spawns the transcode tool.
     * @param ffmpeg Absolute path of the transcode tool.
     * @param bus EventBus used to publish progress and results.
     * @param workers Number of worker slots (0 is treated as 1).
     */
    JobOrchestrator(MediaProber& prober,
                    IProcessRunner& runner,
                    std::filesystem::path ffmpeg,
                    EventBus& bus,
                    unsigned workers = 1);

    JobOrchestrator(const JobOrchestrator&) = delete;
    JobOrchestrator& operator=(const JobOrchestrator&) = delete;

    void set_collision_handler(CollisionHandler handler);

    /// Plan and report without spawning; planned jobs end Skipped ("dry run").
    void set_dry_run(bool dry_run) noexcept { dry_run_ = dry_run; }

    /**
     * @brief Build one Job per file, in order.
     *
     * @throws OptionConflict if @p transcode is contradictory.
     * @throws TemplateError if the naming pattern itself is invalid.
     */
    const std::vector<Job>& plan(const std::vector<std::filesystem::path>& files,
                                 const TranscodeOptions& transcode,
                                 const OutputOptions& output);

    /**
     * @brief Run every planned job and settle the batch.
     *
     * A failed job never aborts the batch. After a stop request, jobs not
     * yet started are Cancelled and the running ones are terminated.
     */
    BatchResult execute();

    /// plan() followed by execute().
    BatchResult run(const std::vector<std::filesystem::path>& files,
                    const TranscodeOptions& transcode,
                    const OutputOptions& output);

    /**
     * @brief Request cancellation of the batch.
     *
     * Thread-safe; may be called from a signal handler or any thread.
     */
    void request_stop() noexcept;

    [[nodiscard]] bool is_stopped() const noexcept {
        return stop_flag_.load(std::memory_order_relaxed);
    }

    /// Every event published by this orchestrator, in order.
    [[nodiscard]] const EventLog& events() const noexcept { return log_; }

    /// Copy of the outcomes settled so far.
    [[nodiscard]] BatchResult snapshot() const;

    [[nodiscard]] const std::vector<Job>& jobs() const noexcept { return jobs_; }

    /// Max number of tool output bytes kept per job.
    static constexpr std::size_t DIAGNOSTIC_BYTES = 64 * 1024;
    /// Number of trailing tool output lines quoted in a failure detail.
    static constexpr std::size_t DIAGNOSTIC_LINES = 15;

private:
    void plan_job(Job& job,
                  const std::shared_ptr<const MediaDescriptor>& descriptor,
                  const TranscodeOptions& transcode,
                  const OutputOptions& output,
                  const std::set<std::string>& claimed);

    /// Runs on a worker slot.
    void run_job(Job& job);

    /**
     * @brief Spawn the tool writing to @p temp.
     * @return false if the process was interrupted by a stop request.
     * @throws JobError on failure.
     */
    bool spawn_transcode(Job& job, const std::filesystem::path& temp);

    void settle(Job& job, JobStatus status, std::string detail, std::chrono::milliseconds duration);

    bool confirm_overwrite(const std::filesystem::path& source, const std::filesystem::path& output);

    /// Record @p event in the log, then publish it on the bus, as one step.
    template <typename Event>
    void emit(const Event& event) {
        std::lock_guard lock(emit_mtx_);
        log_.append(event);
        event_bus_.publish(event);
    }

    MediaProber& prober_;                 ///< Descriptor source
    IProcessRunner& runner_;              ///< Spawns the transcode tool
    std::filesystem::path ffmpeg_;        ///< Transcode tool
    EventBus& event_bus_;                 ///< Bus for publishing events
    EventLog log_;                        ///< Append-only copy of the published events
    std::mutex emit_mtx_;                 ///< Log and bus see events in the same order
    bool dry_run_ = false;                ///< If true, nothing is spawned

    std::vector<Job> jobs_;               ///< Owned jobs, in selection order
    std::atomic<bool> stop_flag_{false};  ///< Flag to signal interruption
    std::stop_source stop_source_;        ///< Terminates running processes

    CollisionHandler collision_handler_;
    std::mutex collision_mtx_;            ///< Serializes the collision handler

    mutable std::mutex result_mtx_;       ///< Protects result_
    BatchResult result_;
    std::mutex report_mtx_;               ///< Keeps aggregate events in settle order

    ThreadPool pool_;                     ///< Worker slots
};

/**
 * @brief Extract the media time from a transcode progress line ("... time=00:01:02.50 ...").
 */
std::optional<std::chrono::milliseconds> parse_progress_time(std::string_view line);

} // namespace vidtool

#endif // VIDTOOL_JOB_ORCHESTRATOR_HPP
