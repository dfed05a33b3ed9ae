/**
 * @file media_descriptor.hpp
 * @brief Normalized description of a media file's container and streams.
 */

#ifndef VIDTOOL_MEDIA_DESCRIPTOR_HPP
#define VIDTOOL_MEDIA_DESCRIPTOR_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vidtool {

/**
 * @brief Elementary stream category. The declaration order is the order
 * in which streams appear in a MediaDescriptor.
 */
enum class StreamKind {
    Video,
    Audio,
    Subtitle,
    Data,
    Attachment
};

/// @return "video", "audio", "subtitle", "data" or "attachment".
std::string_view to_string(StreamKind kind) noexcept;

/// @return The kind for a probe tool codec_type, std::nullopt if unknown.
std::optional<StreamKind> stream_kind_from_string(std::string_view codec_type) noexcept;

/**
 * @brief One elementary stream as reported by the probe tool.
 */
struct StreamDescriptor {
    int index = 0;                      ///< Stream index inside the container
    StreamKind kind = StreamKind::Data; ///< Stream category
    std::string codec_name;             ///< Decoded codec identifier ("hevc", "aac")
    std::string codec_long_name;        ///< Human-readable codec name
    int width = 0;                      ///< Video only
    int height = 0;                     ///< Video only
    std::string pixel_format;           ///< Video only
    int channels = 0;                   ///< Audio only
    std::string channel_layout;         ///< Audio only
    std::int64_t bit_rate = 0;          ///< 0 when unknown
    std::string display_aspect_ratio;   ///< Video only, may be empty

    bool operator==(const StreamDescriptor&) const = default;
};

/**
 * @brief Immutable snapshot of one file's probed properties.
 */
struct MediaDescriptor {
    std::filesystem::path path;             ///< Probed file
    std::string format_name;                ///< Container short name ("matroska,webm")
    std::string format_long_name;           ///< Container long name
    std::vector<StreamDescriptor> streams;  ///< Video, then audio, subtitle, data, attachment
    std::uintmax_t size_bytes = 0;          ///< File size
    double duration_seconds = 0.0;          ///< Container duration, 0 when unknown
    std::int64_t bit_rate = 0;              ///< Overall bit rate, 0 when unknown

    [[nodiscard]] std::vector<const StreamDescriptor*> streams_of(StreamKind kind) const;
    [[nodiscard]] bool has_stream(StreamKind kind) const;

    /// Largest width over all video streams, 0 without video.
    [[nodiscard]] int max_width() const;
    /// Largest height over all video streams, 0 without video.
    [[nodiscard]] int max_height() const;
    /// "WxH" built from max_width() and max_height().
    [[nodiscard]] std::string resolution() const;
    /// True if any video stream has an odd width or height.
    [[nodiscard]] bool has_odd_dimensions() const;
    /// Codec of the first stream of @p kind, empty if there is none.
    [[nodiscard]] std::string primary_codec(StreamKind kind) const;

    bool operator==(const MediaDescriptor&) const = default;
};

/**
 * @brief Parse the probe tool's JSON (-show_format -show_streams) output.
 *
 * Streams are ordered by kind, ties keep the reported order. A missing
 * format size falls back to the size of @p path on disk.
 *
 * @throws ProbeError{MalformedOutput} if the text is not the expected JSON.
 */
MediaDescriptor parse_probe_output(std::string_view json, const std::filesystem::path& path);

/**
 * @brief Serialize a descriptor as pretty-printed JSON (info --json).
 */
std::string descriptor_to_json(const MediaDescriptor& descriptor);

/**
 * @brief Human-readable multi-line summary (info).
 */
std::string format_info_block(const MediaDescriptor& descriptor);

} // namespace vidtool

#endif // VIDTOOL_MEDIA_DESCRIPTOR_HPP
