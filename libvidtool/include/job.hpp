/**
 * @file job.hpp
 * @brief Unit of batch work and its lifecycle.
 */

#ifndef VIDTOOL_JOB_HPP
#define VIDTOOL_JOB_HPP

#include "command_spec.hpp"
#include "media_descriptor.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vidtool {

/**
 * @brief Lifecycle state of a Job.
 *
 * Pending -> Running -> {Succeeded, Failed, Cancelled}, or
 * Pending -> {Skipped, Cancelled, Failed}. Terminal states never change.
 */
enum class JobStatus {
    Pending,
    Running,
    Succeeded,
    Failed,
    Skipped,
    Cancelled
};

std::string_view to_string(JobStatus status) noexcept;

[[nodiscard]] bool is_terminal(JobStatus status) noexcept;

/// @return True if @p from may move to @p to.
[[nodiscard]] bool is_valid_transition(JobStatus from, JobStatus to) noexcept;

/**
 * @brief Number of settled jobs per terminal status.
 */
struct BatchCounts {
    std::size_t succeeded = 0;
    std::size_t failed = 0;
    std::size_t skipped = 0;
    std::size_t cancelled = 0;

    void add(JobStatus status) noexcept;
    [[nodiscard]] std::size_t settled() const noexcept { return succeeded + failed + skipped + cancelled; }

    bool operator==(const BatchCounts&) const = default;
};

/**
 * @brief One source file to be transcoded.
 */
class Job {
public:
    Job(std::size_t index, std::filesystem::path source);

    /**
     * @brief Move to @p next, recording @p detail.
     * @throws std::logic_error if the transition is not allowed.
     */
    void transition(JobStatus next, std::string detail = {});

    [[nodiscard]] std::size_t index() const noexcept { return index_; }
    [[nodiscard]] const std::filesystem::path& source() const noexcept { return source_; }
    [[nodiscard]] JobStatus status() const noexcept { return status_; }
    [[nodiscard]] const std::string& detail() const noexcept { return detail_; }

    [[nodiscard]] const std::shared_ptr<const MediaDescriptor>& descriptor() const noexcept { return descriptor_; }
    void set_descriptor(std::shared_ptr<const MediaDescriptor> descriptor) { descriptor_ = std::move(descriptor); }

    [[nodiscard]] const std::filesystem::path& output() const noexcept { return output_; }
    void set_output(std::filesystem::path output) { output_ = std::move(output); }

    [[nodiscard]] const std::optional<CommandSpec>& command() const noexcept { return command_; }
    void set_command(CommandSpec command) { command_ = std::move(command); }

private:
    std::size_t index_;
    std::filesystem::path source_;
    JobStatus status_ = JobStatus::Pending;
    std::string detail_;
    std::shared_ptr<const MediaDescriptor> descriptor_;
    std::filesystem::path output_;
    std::optional<CommandSpec> command_;
};

/**
 * @brief Final record of one job.
 */
struct JobOutcome {
    std::size_t index = 0;
    std::filesystem::path source;
    std::filesystem::path output;
    JobStatus status = JobStatus::Pending;
    std::string detail;
    std::string command;                    ///< Display form, empty if never built
    std::uintmax_t source_size = 0;
    std::uintmax_t output_size = 0;         ///< 0 unless Succeeded
    std::chrono::milliseconds duration{0};
};

/**
 * @brief Outcome of a whole batch, in selection order.
 */
struct BatchResult {
    std::vector<JobOutcome> outcomes;
    BatchCounts counts;
    bool cancelled = false;
    std::chrono::milliseconds duration{0};

    [[nodiscard]] bool all_succeeded() const noexcept {
        return !cancelled && counts.failed == 0 && counts.cancelled == 0;
    }
};

} // namespace vidtool

#endif // VIDTOOL_JOB_HPP
