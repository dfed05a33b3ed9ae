#include "../../include/job.hpp"

#include <stdexcept>

namespace vidtool {

std::string_view to_string(const JobStatus status) noexcept {
    switch (status) {
        case JobStatus::Pending:   return "pending";
        case JobStatus::Running:   return "running";
        case JobStatus::Succeeded: return "succeeded";
        case JobStatus::Failed:    return "failed";
        case JobStatus::Skipped:   return "skipped";
        case JobStatus::Cancelled: return "cancelled";
    }
    return "pending";
}

bool is_terminal(const JobStatus status) noexcept {
    return status != JobStatus::Pending && status != JobStatus::Running;
}

bool is_valid_transition(const JobStatus from, const JobStatus to) noexcept {
    switch (from) {
        case JobStatus::Pending:
            return to != JobStatus::Pending && to != JobStatus::Succeeded;
        case JobStatus::Running:
            return to == JobStatus::Succeeded || to == JobStatus::Failed || to == JobStatus::Cancelled;
        default:
            return false;
    }
}

void BatchCounts::add(const JobStatus status) noexcept {
    switch (status) {
        case JobStatus::Succeeded: ++succeeded; break;
        case JobStatus::Failed:    ++failed; break;
        case JobStatus::Skipped:   ++skipped; break;
        case JobStatus::Cancelled: ++cancelled; break;
        default: break;
    }
}

Job::Job(const std::size_t index, std::filesystem::path source)
    : index_(index), source_(std::move(source)) {}

void Job::transition(const JobStatus next, std::string detail) {
    if (!is_valid_transition(status_, next)) {
        throw std::logic_error("Job " + std::to_string(index_) + ": illegal transition "
                               + std::string(to_string(status_)) + " -> " + std::string(to_string(next)));
    }
    status_ = next;
    if (!detail.empty()) detail_ = std::move(detail);
}

} // namespace vidtool
