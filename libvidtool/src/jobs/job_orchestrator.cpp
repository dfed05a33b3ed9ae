#include "../../include/job_orchestrator.hpp"
#include "../../include/command_builder.hpp"
#include "../../include/errors.hpp"
#include "../../include/events.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"

#include <algorithm>
#include <cstdio>
#include <future>
#include <set>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace vidtool {

namespace {
    using Clock = std::chrono::steady_clock;

    std::chrono::milliseconds since(const Clock::time_point start) {
        return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
    }

    std::uintmax_t safe_size(const fs::path& p) {
        std::error_code ec;
        const auto s = fs::file_size(p, ec);
        return ec ? 0 : s;
    }

    /// Last @p count non-empty lines of @p text.
    std::string tail_lines(const std::string& text, const std::size_t count) {
        std::vector<std::string> lines;
        std::istringstream in(text);
        std::string line;
        while (std::getline(in, line)) {
            if (!line.empty() && line.back() == '\r') line.pop_back();
            // progress lines are rewritten in place with \r, keep the last state only
            if (const auto cr = line.rfind('\r'); cr != std::string::npos) line.erase(0, cr + 1);
            if (!line.empty()) lines.push_back(std::move(line));
        }
        const std::size_t first = lines.size() > count ? lines.size() - count : 0;
        std::string out;
        for (std::size_t i = first; i < lines.size(); ++i) {
            if (!out.empty()) out += '\n';
            out += lines[i];
        }
        return out;
    }

    std::string key_of(const fs::path& p) {
        std::error_code ec;
        const auto c = fs::weakly_canonical(p, ec);
        return ec ? fs::absolute(p).lexically_normal().string() : c.string();
    }
} // namespace

std::optional<std::chrono::milliseconds> parse_progress_time(const std::string_view line) {
    const auto pos = line.rfind("time=");
    if (pos == std::string_view::npos) return std::nullopt;

    int h = 0;
    int m = 0;
    double s = 0.0;
    const std::string value(line.substr(pos + 5, 16));
    if (std::sscanf(value.c_str(), "%d:%d:%lf", &h, &m, &s) != 3 || h < 0 || m < 0 || s < 0.0) {
        return std::nullopt;
    }
    const double total = h * 3600.0 + m * 60.0 + s;
    return std::chrono::milliseconds(static_cast<long long>(total * 1000.0 + 0.5));
}

JobOrchestrator::JobOrchestrator(MediaProber& prober,
                                 IProcessRunner& runner,
                                 fs::path ffmpeg,
                                 EventBus& bus,
                                 const unsigned workers)
    : prober_(prober),
      runner_(runner),
      ffmpeg_(std::move(ffmpeg)),
      event_bus_(bus),
      pool_(workers) {}

void JobOrchestrator::set_collision_handler(CollisionHandler handler) {
    std::lock_guard lock(collision_mtx_);
    collision_handler_ = std::move(handler);
}

void JobOrchestrator::request_stop() noexcept {
    stop_flag_.store(true, std::memory_order_relaxed);
    stop_source_.request_stop();
}

BatchResult JobOrchestrator::snapshot() const {
    std::lock_guard lock(result_mtx_);
    return result_;
}

bool JobOrchestrator::confirm_overwrite(const fs::path& source, const fs::path& output) {
    std::lock_guard lock(collision_mtx_);
    if (!collision_handler_) return false;
    return collision_handler_(source, output);
}

const std::vector<Job>& JobOrchestrator::plan(const std::vector<fs::path>& files,
                                              const TranscodeOptions& transcode,
                                              const OutputOptions& output) {
    // invocation-level errors abort before any job exists
    transcode.validate();
    NamingPattern::parse(output.pattern);

    jobs_.clear();
    jobs_.reserve(files.size());
    for (std::size_t i = 0; i < files.size(); ++i) jobs_.emplace_back(i, files[i]);

    {
        std::lock_guard lock(result_mtx_);
        result_ = BatchResult{};
        result_.outcomes.resize(jobs_.size());
        for (const auto& job : jobs_) {
            result_.outcomes[job.index()].index = job.index();
            result_.outcomes[job.index()].source = job.source();
        }
    }

    // probes are the slow part, run them on the worker slots
    std::vector<std::future<std::shared_ptr<const MediaDescriptor>>> probes;
    probes.reserve(jobs_.size());
    for (const auto& job : jobs_) {
        probes.push_back(pool_.enqueue([this, source = job.source()](const std::stop_token&) {
            if (is_stopped()) return std::shared_ptr<const MediaDescriptor>{};
            return prober_.probe(source, stop_source_.get_token());
        }));
    }

    std::set<std::string> claimed;
    for (auto& job : jobs_) {
        std::shared_ptr<const MediaDescriptor> descriptor;
        try {
            descriptor = probes[job.index()].get();
        } catch (const VidtoolError& e) {
            if (is_stopped()) continue; // probe interrupted by the stop, settled as Cancelled by execute()
            Logger::log(LogLevel::Error, "Cannot probe " + job.source().string() + ": " + e.what(), "Orchestrator");
            job.transition(JobStatus::Failed, e.what());
            continue;
        }
        if (!descriptor) continue; // stopped, settled as Cancelled by execute()

        plan_job(job, descriptor, transcode, output, claimed);
        if (job.status() != JobStatus::Pending) continue;

        if (!claimed.insert(key_of(job.output())).second) {
            Logger::log(LogLevel::Warning, "Output already claimed by an earlier job: " + job.output().string(), "Orchestrator");
            job.transition(JobStatus::Skipped, "output already claimed by an earlier job: " + job.output().string());
        }
    }
    return jobs_;
}

void JobOrchestrator::plan_job(Job& job,
                               const std::shared_ptr<const MediaDescriptor>& descriptor,
                               const TranscodeOptions& transcode,
                               const OutputOptions& output,
                               const std::set<std::string>& claimed) {
    job.set_descriptor(descriptor);
    try {
        const PathResolution resolved = resolve_output_path(
            job.source(), *descriptor, output,
            [&claimed](const fs::path& p) { return claimed.contains(key_of(p)); });
        job.set_output(resolved.path);

        if (resolved.needs_decision && !confirm_overwrite(job.source(), resolved.path)) {
            Logger::log(LogLevel::Info, "Not overwriting " + resolved.path.string(), "Orchestrator");
            job.transition(JobStatus::Skipped, "output exists: " + resolved.path.string());
            return;
        }
        if (resolved.exists) {
            Logger::log(LogLevel::Debug, "Will overwrite " + resolved.path.string(), "Orchestrator");
        }

        job.set_command(build_command(*descriptor, transcode, resolved.path));
    } catch (const TemplateError& e) {
        Logger::log(LogLevel::Warning, "Skipping " + job.source().string() + ": " + e.what(), "Orchestrator");
        job.transition(JobStatus::Skipped, e.what());
    } catch (const OptionConflict& e) {
        Logger::log(LogLevel::Warning, "Skipping " + job.source().string() + ": " + e.what(), "Orchestrator");
        job.transition(JobStatus::Skipped, e.what());
    }
}

BatchResult JobOrchestrator::execute() {
    const auto start = Clock::now();
    emit(BatchStartEvent{jobs_.size()});
    Logger::log(LogLevel::Info, "Starting batch of " + std::to_string(jobs_.size()) + " job(s)", "Orchestrator");

    for (auto& job : jobs_) {
        pool_.enqueue([this, &job](const std::stop_token&) { run_job(job); });
    }
    pool_.wait_idle();

    BatchCompleteEvent done;
    {
        std::lock_guard lock(result_mtx_);
        result_.cancelled = is_stopped();
        result_.duration = since(start);
        done = BatchCompleteEvent{result_.counts, result_.cancelled, result_.duration};
    }
    emit(done);
    Logger::log(LogLevel::Info,
                "Batch finished: " + std::to_string(done.counts.succeeded) + " succeeded, "
                + std::to_string(done.counts.failed) + " failed, "
                + std::to_string(done.counts.skipped) + " skipped, "
                + std::to_string(done.counts.cancelled) + " cancelled", "Orchestrator");
    return snapshot();
}

BatchResult JobOrchestrator::run(const std::vector<fs::path>& files,
                                 const TranscodeOptions& transcode,
                                 const OutputOptions& output) {
    plan(files, transcode, output);
    return execute();
}

void JobOrchestrator::run_job(Job& job) {
    const auto start = Clock::now();

    // settled during planning
    if (is_terminal(job.status())) {
        settle(job, job.status(), job.detail(), std::chrono::milliseconds{0});
        return;
    }
    if (is_stopped()) {
        settle(job, JobStatus::Cancelled, "cancelled before start", std::chrono::milliseconds{0});
        return;
    }
    if (dry_run_) {
        Logger::log(LogLevel::Info, "[DRY-RUN] " + job.command()->to_display_string(ffmpeg_.filename().string()), "Orchestrator");
        settle(job, JobStatus::Skipped, "dry run", std::chrono::milliseconds{0});
        return;
    }

    job.transition(JobStatus::Running);
    emit(JobStartEvent{job.index(), job.source(), job.output(),
                       job.command()->to_display_string(ffmpeg_.string())});
    Logger::log(LogLevel::Info, "Transcoding " + job.source().string() + " -> " + job.output().string(), "Orchestrator");

    std::error_code ec;
    fs::create_directories(job.output().parent_path(), ec);
    const fs::path temp = make_temp_sibling(job.output());

    try {
        if (!spawn_transcode(job, temp)) {
            remove_quietly(temp, "Orchestrator");
            settle(job, JobStatus::Cancelled, "cancelled", since(start));
            return;
        }
        if (const auto err = move_into_place(temp, job.output()); !err.empty()) {
            throw JobError(JobError::Kind::OutputWriteFailed, err);
        }
        prober_.cache().invalidate(fs::absolute(job.output()).lexically_normal());
        settle(job, JobStatus::Succeeded, {}, since(start));
    } catch (const std::exception& e) {
        remove_quietly(temp, "Orchestrator");
        if (is_stopped()) {
            settle(job, JobStatus::Cancelled, "cancelled", since(start));
        } else {
            Logger::log(LogLevel::Error, "Failed: " + job.source().string() + " (" + e.what() + ")", "Orchestrator");
            settle(job, JobStatus::Failed, e.what(), since(start));
        }
    }
}

bool JobOrchestrator::spawn_transcode(Job& job, const fs::path& temp) {
    const double duration_ms = job.descriptor() ? job.descriptor()->duration_seconds * 1000.0 : 0.0;
    const std::size_t index = job.index();

    ProcessRequest request;
    request.program = ffmpeg_;
    request.args = job.command()->with_output(temp).to_arguments();
    request.capture_stderr = true;
    request.max_output_bytes = DIAGNOSTIC_BYTES;
    request.on_line = [this, index, duration_ms](const std::string_view line) {
        const auto t = parse_progress_time(line);
        if (!t) return;
        const double percent = duration_ms > 0.0
            ? std::min(100.0, static_cast<double>(t->count()) * 100.0 / duration_ms)
            : 0.0;
        emit(JobProgressEvent{index, percent, *t});
    };

    const ProcessOutcome outcome = runner_.run(request, stop_source_.get_token());

    if (outcome.interrupted) return false;
    if (outcome.term_signal != 0 || outcome.timed_out) {
        throw JobError(JobError::Kind::Killed,
                       (outcome.timed_out ? std::string("timed out")
                                          : "killed by signal " + std::to_string(outcome.term_signal))
                       + "\n" + tail_lines(outcome.output, DIAGNOSTIC_LINES));
    }
    if (outcome.exit_code != 0) {
        throw JobError(JobError::Kind::NonZeroExit,
                       "exit code " + std::to_string(outcome.exit_code)
                       + "\n" + tail_lines(outcome.output, DIAGNOSTIC_LINES));
    }
    if (safe_size(temp) == 0) {
        throw JobError(JobError::Kind::OutputWriteFailed, "tool produced an empty or missing output");
    }
    return true;
}

void JobOrchestrator::settle(Job& job, const JobStatus status, std::string detail,
                             const std::chrono::milliseconds duration) {
    if (job.status() != status) job.transition(status, detail);

    JobOutcome outcome;
    outcome.index = job.index();
    outcome.source = job.source();
    outcome.output = job.output();
    outcome.status = status;
    outcome.detail = std::move(detail);
    outcome.command = job.command() ? job.command()->to_display_string(ffmpeg_.filename().string()) : std::string{};
    outcome.source_size = job.descriptor() ? job.descriptor()->size_bytes : safe_size(job.source());
    outcome.output_size = status == JobStatus::Succeeded ? safe_size(job.output()) : 0;
    outcome.duration = duration;

    std::lock_guard report_lock(report_mtx_);
    BatchProgressEvent progress;
    {
        std::lock_guard lock(result_mtx_);
        result_.outcomes[job.index()] = outcome;
        result_.counts.add(status);
        progress = BatchProgressEvent{result_.counts, jobs_.size()};
    }
    emit(JobCompleteEvent{outcome.index, outcome.source, outcome.output, status, outcome.detail, duration});
    emit(progress);
}

} // namespace vidtool
