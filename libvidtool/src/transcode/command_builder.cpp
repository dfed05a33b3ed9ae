#include "../../include/command_builder.hpp"
#include "../../include/errors.hpp"

#include <array>
#include <string>

namespace vidtool {

namespace {
    enum class StreamAction {
        Copy,    ///< -c:<k> copy
        Encode,  ///< -c:<k> <encoder>
        Default, ///< no codec option, the tool picks its default encoder
        Drop     ///< -map -0:<k>
    };

    struct StreamPlan {
        StreamKind kind;
        const char* specifier;
        StreamAction action = StreamAction::Copy;
        std::string encoder;
    };

    void set_codec(StreamPlan& plan, const std::string& codec) {
        if (codec == COPY_CODEC) {
            plan.action = StreamAction::Copy;
            plan.encoder.clear();
        } else {
            plan.action = StreamAction::Encode;
            plan.encoder = codec;
        }
    }
} // namespace

CommandSpec build_command(const MediaDescriptor& descriptor,
                          const TranscodeOptions& options,
                          const std::filesystem::path& output) {
    options.validate();

    std::array<StreamPlan, 5> plans{{
        {StreamKind::Video, "v"},
        {StreamKind::Audio, "a"},
        {StreamKind::Subtitle, "s"},
        {StreamKind::Data, "d"},
        {StreamKind::Attachment, "t"},
    }};
    auto& video = plans[0];
    auto& audio = plans[1];

    // 1. av-copy-only
    if (options.av_copy_only) {
        for (auto& p : plans) {
            if (p.kind != StreamKind::Video && p.kind != StreamKind::Audio) p.action = StreamAction::Drop;
        }
    }

    // 2. codec selectors
    if (const auto encoder = options.effective_video_encoder()) {
        set_codec(video, *encoder);
    } else if (options.video_codec) {
        set_codec(video, *options.video_codec);
    }
    if (options.audio_codec) set_codec(audio, *options.audio_codec);

    // 3. strip flags
    if (options.strip_video) video.action = StreamAction::Drop;
    if (options.strip_audio) audio.action = StreamAction::Drop;
    if (options.strip_subtitles) plans[2].action = StreamAction::Drop;
    if (options.strip_data) plans[3].action = StreamAction::Drop;

    bool any_kept = false;
    for (const auto& p : plans) {
        if (p.action != StreamAction::Drop && descriptor.has_stream(p.kind)) any_kept = true;
    }
    if (!any_kept) {
        throw OptionConflict("No stream of " + descriptor.path.string() + " would be kept");
    }

    // 4. resolution fix, only for sources with an odd dimension
    std::string scale_filter;
    if (options.fix_resolution && video.action != StreamAction::Drop && descriptor.has_odd_dimensions()) {
        const int width = descriptor.max_width() & ~1;
        const int height = descriptor.max_height() & ~1;
        scale_filter = "scale=" + std::to_string(width) + ":" + std::to_string(height);
        if (video.action == StreamAction::Copy) video.action = StreamAction::Default;
    }

    CommandSpec spec;
    spec.input = descriptor.path;
    spec.output = output;
    spec.overwrite = true;

    // 5. error tolerance is a decoder option and must precede the input
    if (options.fix_errors) {
        spec.input_flags = {"-err_detect", "ignore_err"};
    }

    auto& out = spec.output_flags;
    out.insert(out.end(), {"-map", "0"});
    for (const auto& p : plans) {
        if (p.action == StreamAction::Drop && descriptor.has_stream(p.kind)) {
            out.insert(out.end(), {"-map", std::string("-0:") + p.specifier});
        }
    }
    for (const auto& p : plans) {
        if (!descriptor.has_stream(p.kind)) continue;
        // attachments are always stream-copied by the tool
        if (p.kind == StreamKind::Attachment) continue;
        const std::string option = std::string("-c:") + p.specifier;
        if (p.action == StreamAction::Copy) {
            out.insert(out.end(), {option, std::string(COPY_CODEC)});
        } else if (p.action == StreamAction::Encode) {
            out.insert(out.end(), {option, p.encoder});
        }
    }
    if (const auto crf = options.effective_crf(); crf && video.action == StreamAction::Encode) {
        out.insert(out.end(), {"-crf", std::to_string(*crf)});
    }
    if (!scale_filter.empty()) {
        out.insert(out.end(), {"-vf", scale_filter});
    }

    // 6. custom flags, last so they can override anything above
    out.insert(out.end(), options.custom_flags.begin(), options.custom_flags.end());
    return spec;
}

} // namespace vidtool
