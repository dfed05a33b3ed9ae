/**
 * @file media_prober.hpp
 * @brief Obtains MediaDescriptors from the probe tool, with a per-session cache.
 */

#ifndef VIDTOOL_MEDIA_PROBER_HPP
#define VIDTOOL_MEDIA_PROBER_HPP

#include "media_descriptor.hpp"
#include "process_runner.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <unordered_map>
#include <vector>

namespace vidtool {

/**
 * @brief Identity of a file's content as far as the cache is concerned.
 */
struct FileStamp {
    std::filesystem::file_time_type mtime{};
    std::uintmax_t size = 0;

    bool operator==(const FileStamp&) const = default;
};

/// Returns the current stamp of a file, std::nullopt if it is not a readable regular file.
using StampSource = std::function<std::optional<FileStamp>(const std::filesystem::path&)>;

/**
 * @brief Default StampSource based on std::filesystem.
 */
std::optional<FileStamp> stat_file_stamp(const std::filesystem::path& path);

/**
 * @brief Thread-safe descriptor cache keyed by absolute path.
 *
 * An entry is only returned while the file's stamp matches the one
 * recorded when it was stored.
 */
class DescriptorCache {
public:
    [[nodiscard]] std::shared_ptr<const MediaDescriptor> lookup(const std::filesystem::path& key,
                                                                const FileStamp& stamp) const;

    void store(const std::filesystem::path& key,
               const FileStamp& stamp,
               std::shared_ptr<const MediaDescriptor> descriptor);

    void invalidate(const std::filesystem::path& key);
    void clear();

    [[nodiscard]] std::size_t size() const;

private:
    struct Entry {
        FileStamp stamp;
        std::shared_ptr<const MediaDescriptor> descriptor;
    };

    mutable std::mutex mtx_;
    std::unordered_map<std::string, Entry> entries_;
};

/**
 * @brief Metadata Prober.
 *
 * @details Runs `ffprobe -v quiet -print_format json -show_format
 * -show_streams <file>` through an IProcessRunner and parses the result.
 * Descriptors are shared and immutable; the same path probed twice
 * without modification is only spawned once.
 */
class MediaProber {
public:
    static constexpr std::chrono::seconds DEFAULT_TIMEOUT{30};

    MediaProber(IProcessRunner& runner,
                std::filesystem::path ffprobe,
                std::chrono::milliseconds timeout = DEFAULT_TIMEOUT,
                StampSource stamps = stat_file_stamp);

    /**
     * @brief Describe @p path.
     *
     * @throws ProbeError{NotFound} if the file is missing or not a regular file.
     * @throws ProbeError{ToolTimeout} if the tool exceeds the timeout.
     * @throws ProbeError{ToolFailed} on a non-zero exit or interruption.
     * @throws ProbeError{MalformedOutput} if the output cannot be parsed.
     */
    std::shared_ptr<const MediaDescriptor> probe(const std::filesystem::path& path,
                                                 std::stop_token stop = {});

    [[nodiscard]] DescriptorCache& cache() noexcept { return cache_; }

    /// Arguments passed to the probe tool for @p path.
    static std::vector<std::string> probe_arguments(const std::filesystem::path& path);

private:
    IProcessRunner& runner_;
    std::filesystem::path ffprobe_;
    std::chrono::milliseconds timeout_;
    StampSource stamps_;
    DescriptorCache cache_;
};

} // namespace vidtool

#endif // VIDTOOL_MEDIA_PROBER_HPP
