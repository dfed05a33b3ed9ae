#include "../../include/transcode_options.hpp"
#include "../../include/errors.hpp"

#include <algorithm>
#include <cctype>

namespace vidtool {

namespace {
    bool is_blank(const std::string& s) {
        return std::ranges::all_of(s, [](const unsigned char c) { return std::isspace(c) != 0; });
    }

    bool is_copy(const std::optional<std::string>& codec) {
        return codec && *codec == COPY_CODEC;
    }
} // namespace

void TranscodeOptions::validate() const {
    if (video_codec && is_blank(*video_codec)) {
        throw OptionConflict("Video codec name is empty");
    }
    if (audio_codec && is_blank(*audio_codec)) {
        throw OptionConflict("Audio codec name is empty");
    }
    if (strip_video && video_codec) {
        throw OptionConflict("Cannot strip video and set video codec '" + *video_codec + "'");
    }
    if (strip_audio && audio_codec) {
        throw OptionConflict("Cannot strip audio and set audio codec '" + *audio_codec + "'");
    }
    if (x265 && video_codec && *video_codec != X265_CODEC) {
        throw OptionConflict("--x265 conflicts with video codec '" + *video_codec + "'");
    }
    if (x265 && strip_video) {
        throw OptionConflict("--x265 conflicts with stripping video");
    }
    if (av_copy_only && (strip_video || strip_audio)) {
        throw OptionConflict("av-copy-only conflicts with stripping audio or video");
    }
    if (av_copy_only && (video_codec || audio_codec || x265)) {
        throw OptionConflict("av-copy-only conflicts with an explicit codec");
    }
    if (crf && (*crf < 0 || *crf > MAX_CRF)) {
        throw OptionConflict("CRF " + std::to_string(*crf) + " is outside 0-" + std::to_string(MAX_CRF));
    }

    const bool video_kept_as_is = strip_video || av_copy_only || is_copy(video_codec);
    if (fix_resolution && video_kept_as_is) {
        throw OptionConflict("Resolution fix needs the video stream to be re-encoded");
    }
    if (crf && !encodes_video()) {
        throw OptionConflict("CRF needs a video encoder (--vcodec or --x265)");
    }
    if (strip_video && strip_audio && strip_subtitles && strip_data) {
        throw OptionConflict("Every stream kind is stripped, nothing would be written");
    }
}

bool TranscodeOptions::encodes_video() const noexcept {
    if (strip_video || av_copy_only) return false;
    if (x265) return true;
    return video_codec.has_value() && *video_codec != COPY_CODEC;
}

std::optional<std::string> TranscodeOptions::effective_video_encoder() const {
    if (!encodes_video()) return std::nullopt;
    if (x265) return std::string(X265_CODEC);
    return video_codec;
}

std::optional<int> TranscodeOptions::effective_crf() const noexcept {
    if (!encodes_video()) return std::nullopt;
    if (crf) return crf;
    if (x265) return X265_DEFAULT_CRF;
    return std::nullopt;
}

std::vector<std::string> split_custom_flags(const std::string_view text) {
    std::vector<std::string> out;
    std::string current;
    bool in_token = false;
    char quote = '\0';

    for (const char c : text) {
        if (quote != '\0') {
            if (c == quote) {
                quote = '\0';
            } else {
                current += c;
            }
            continue;
        }
        if (c == '\'' || c == '"') {
            quote = c;
            in_token = true;
        } else if (std::isspace(static_cast<unsigned char>(c))) {
            if (in_token) {
                out.push_back(std::move(current));
                current.clear();
                in_token = false;
            }
        } else {
            current += c;
            in_token = true;
        }
    }
    if (quote != '\0') {
        throw OptionConflict("Unterminated quote in custom flags: " + std::string(text));
    }
    if (in_token) out.push_back(std::move(current));
    return out;
}

} // namespace vidtool
