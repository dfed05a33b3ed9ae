#include "../../include/media_prober.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"

#include <system_error>

namespace fs = std::filesystem;

namespace vidtool {

std::optional<FileStamp> stat_file_stamp(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) return std::nullopt;
    FileStamp stamp;
    stamp.size = fs::file_size(path, ec);
    if (ec) return std::nullopt;
    stamp.mtime = fs::last_write_time(path, ec);
    if (ec) return std::nullopt;
    return stamp;
}

std::shared_ptr<const MediaDescriptor> DescriptorCache::lookup(const fs::path& key, const FileStamp& stamp) const {
    std::lock_guard lock(mtx_);
    const auto it = entries_.find(key.string());
    if (it == entries_.end() || !(it->second.stamp == stamp)) return nullptr;
    return it->second.descriptor;
}

void DescriptorCache::store(const fs::path& key, const FileStamp& stamp,
                            std::shared_ptr<const MediaDescriptor> descriptor) {
    std::lock_guard lock(mtx_);
    entries_[key.string()] = Entry{stamp, std::move(descriptor)};
}

void DescriptorCache::invalidate(const fs::path& key) {
    std::lock_guard lock(mtx_);
    entries_.erase(key.string());
}

void DescriptorCache::clear() {
    std::lock_guard lock(mtx_);
    entries_.clear();
}

std::size_t DescriptorCache::size() const {
    std::lock_guard lock(mtx_);
    return entries_.size();
}

MediaProber::MediaProber(IProcessRunner& runner,
                         fs::path ffprobe,
                         const std::chrono::milliseconds timeout,
                         StampSource stamps)
    : runner_(runner),
      ffprobe_(std::move(ffprobe)),
      timeout_(timeout),
      stamps_(std::move(stamps)) {}

std::vector<std::string> MediaProber::probe_arguments(const fs::path& path) {
    return {"-v", "quiet", "-print_format", "json", "-show_format", "-show_streams", path.string()};
}

std::shared_ptr<const MediaDescriptor> MediaProber::probe(const fs::path& path, std::stop_token stop) {
    const auto stamp = stamps_(path);
    if (!stamp) {
        throw ProbeError(ProbeError::Kind::NotFound, "File not found or not readable: " + path.string());
    }

    std::error_code ec;
    const fs::path key = fs::absolute(path, ec).lexically_normal();
    const fs::path& cache_key = ec ? path : key;

    if (auto cached = cache_.lookup(cache_key, *stamp)) {
        Logger::log(LogLevel::Debug, "Cache hit: " + path.string(), "Prober");
        return cached;
    }

    ProcessRequest request;
    request.program = ffprobe_;
    request.args = probe_arguments(path);
    request.timeout = timeout_;

    Logger::log(LogLevel::Debug, "Probing " + path.string(), "Prober");
    const ProcessOutcome outcome = runner_.run(request, std::move(stop));

    if (outcome.timed_out) {
        throw ProbeError(ProbeError::Kind::ToolTimeout,
                         "Probe of " + path.string() + " timed out after "
                         + std::to_string(timeout_.count()) + " ms");
    }
    if (outcome.interrupted) {
        throw ProbeError(ProbeError::Kind::ToolFailed, "Probe of " + path.string() + " was interrupted");
    }
    if (!outcome.succeeded()) {
        const std::string how = outcome.term_signal != 0
            ? "killed by signal " + std::to_string(outcome.term_signal)
            : "exit code " + std::to_string(outcome.exit_code);
        throw ProbeError(ProbeError::Kind::ToolFailed, "Probe of " + path.string() + " failed (" + how + ")");
    }

    auto descriptor = std::make_shared<const MediaDescriptor>(parse_probe_output(outcome.output, path));
    cache_.store(cache_key, *stamp, descriptor);
    return descriptor;
}

} // namespace vidtool
