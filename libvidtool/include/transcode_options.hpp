/**
 * @file transcode_options.hpp
 * @brief Declarative description of what a transcode should do.
 */

#ifndef VIDTOOL_TRANSCODE_OPTIONS_HPP
#define VIDTOOL_TRANSCODE_OPTIONS_HPP

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vidtool {

/// Codec selector value that keeps a stream kind as-is.
inline constexpr std::string_view COPY_CODEC = "copy";

/// Video encoder selected by the x265 shortcut.
inline constexpr std::string_view X265_CODEC = "libx265";

/// CRF used by the x265 shortcut when none is given.
inline constexpr int X265_DEFAULT_CRF = 28;

inline constexpr int MAX_CRF = 63;

/**
 * @brief Structured transcode option set.
 *
 * An empty codec selector means "copy" (the baseline). Contradictory
 * combinations are rejected by validate(), never resolved silently.
 */
struct TranscodeOptions {
    std::optional<std::string> video_codec;  ///< Encoder name or "copy"
    std::optional<std::string> audio_codec;  ///< Encoder name or "copy"
    bool strip_video = false;
    bool strip_audio = false;
    bool strip_subtitles = false;
    bool strip_data = false;
    bool av_copy_only = false;               ///< Copy audio and video, drop everything else
    bool x265 = false;                       ///< Shortcut for libx265 with a default CRF
    std::optional<int> crf;                  ///< Constant rate factor, 0-63
    bool fix_resolution = false;             ///< Scale odd dimensions down to even ones
    bool fix_errors = false;                 ///< Ignore decode errors
    std::vector<std::string> custom_flags;   ///< Appended verbatim, last

    /**
     * @brief Reject contradictory combinations.
     * @throws OptionConflict describing the first conflict found.
     */
    void validate() const;

    /// @return True if the video stream would be re-encoded.
    [[nodiscard]] bool encodes_video() const noexcept;

    /// @return The effective video encoder, std::nullopt if video is copied or stripped.
    [[nodiscard]] std::optional<std::string> effective_video_encoder() const;

    /// @return The CRF that will be passed to the encoder, if any.
    [[nodiscard]] std::optional<int> effective_crf() const noexcept;

    bool operator==(const TranscodeOptions&) const = default;
};

/**
 * @brief Split a free-form flag string on whitespace.
 *
 * Single and double quotes group words, so "-metadata 'title=A B'" yields
 * two arguments.
 *
 * @throws OptionConflict on an unterminated quote.
 */
std::vector<std::string> split_custom_flags(std::string_view text);

} // namespace vidtool

#endif // VIDTOOL_TRANSCODE_OPTIONS_HPP
