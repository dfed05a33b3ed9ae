#include "../../include/media_descriptor.hpp"
#include "../../include/errors.hpp"

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace pt = boost::property_tree;
namespace fs = std::filesystem;

namespace vidtool {

std::string_view to_string(const StreamKind kind) noexcept {
    switch (kind) {
        case StreamKind::Video:      return "video";
        case StreamKind::Audio:      return "audio";
        case StreamKind::Subtitle:   return "subtitle";
        case StreamKind::Data:       return "data";
        case StreamKind::Attachment: return "attachment";
    }
    return "data";
}

std::optional<StreamKind> stream_kind_from_string(const std::string_view codec_type) noexcept {
    if (codec_type == "video") return StreamKind::Video;
    if (codec_type == "audio") return StreamKind::Audio;
    if (codec_type == "subtitle") return StreamKind::Subtitle;
    if (codec_type == "data") return StreamKind::Data;
    if (codec_type == "attachment") return StreamKind::Attachment;
    return std::nullopt;
}

std::vector<const StreamDescriptor*> MediaDescriptor::streams_of(const StreamKind kind) const {
    std::vector<const StreamDescriptor*> out;
    for (const auto& s : streams) {
        if (s.kind == kind) out.push_back(&s);
    }
    return out;
}

bool MediaDescriptor::has_stream(const StreamKind kind) const {
    return std::ranges::any_of(streams, [kind](const StreamDescriptor& s) { return s.kind == kind; });
}

int MediaDescriptor::max_width() const {
    int w = 0;
    for (const auto* s : streams_of(StreamKind::Video)) w = std::max(w, s->width);
    return w;
}

int MediaDescriptor::max_height() const {
    int h = 0;
    for (const auto* s : streams_of(StreamKind::Video)) h = std::max(h, s->height);
    return h;
}

std::string MediaDescriptor::resolution() const {
    return std::to_string(max_width()) + "x" + std::to_string(max_height());
}

bool MediaDescriptor::has_odd_dimensions() const {
    return std::ranges::any_of(streams, [](const StreamDescriptor& s) {
        return s.kind == StreamKind::Video && (s.width % 2 != 0 || s.height % 2 != 0);
    });
}

std::string MediaDescriptor::primary_codec(const StreamKind kind) const {
    for (const auto& s : streams) {
        if (s.kind == kind) return s.codec_name;
    }
    return {};
}

MediaDescriptor parse_probe_output(const std::string_view json, const fs::path& path) {
    pt::ptree root;
    try {
        std::istringstream in{std::string(json)};
        pt::read_json(in, root);
    } catch (const pt::json_parser_error& e) {
        throw ProbeError(ProbeError::Kind::MalformedOutput,
                         "Unparsable probe output for " + path.string() + ": " + e.what());
    }

    const auto format = root.get_child_optional("format");
    if (!format) {
        throw ProbeError(ProbeError::Kind::MalformedOutput,
                         "Probe output for " + path.string() + " has no format section");
    }

    MediaDescriptor d;
    d.path = path;
    d.format_name = format->get<std::string>("format_name", "");
    d.format_long_name = format->get<std::string>("format_long_name", "");
    d.duration_seconds = format->get<double>("duration", 0.0);
    d.bit_rate = format->get<std::int64_t>("bit_rate", 0);
    d.size_bytes = format->get<std::uintmax_t>("size", 0);
    if (d.size_bytes == 0) {
        std::error_code ec;
        const auto sz = fs::file_size(path, ec);
        d.size_bytes = ec ? 0 : sz;
    }

    if (const auto streams = root.get_child_optional("streams")) {
        int position = 0;
        for (const auto& [key, node] : *streams) {
            StreamDescriptor s;
            s.index = node.get<int>("index", position);
            // unknown codec types are carried as opaque data streams
            s.kind = stream_kind_from_string(node.get<std::string>("codec_type", "")).value_or(StreamKind::Data);
            s.codec_name = node.get<std::string>("codec_name", "");
            s.codec_long_name = node.get<std::string>("codec_long_name", "");
            s.width = node.get<int>("width", node.get<int>("coded_width", 0));
            s.height = node.get<int>("height", node.get<int>("coded_height", 0));
            s.pixel_format = node.get<std::string>("pix_fmt", "");
            s.channels = node.get<int>("channels", 0);
            s.channel_layout = node.get<std::string>("channel_layout", "");
            s.bit_rate = node.get<std::int64_t>("bit_rate", 0);
            s.display_aspect_ratio = node.get<std::string>("display_aspect_ratio", "");
            d.streams.push_back(std::move(s));
            ++position;
        }
    }

    std::ranges::stable_sort(d.streams, [](const StreamDescriptor& a, const StreamDescriptor& b) {
        return static_cast<int>(a.kind) < static_cast<int>(b.kind);
    });
    return d;
}

std::string descriptor_to_json(const MediaDescriptor& descriptor) {
    pt::ptree root;
    root.put("file", descriptor.path.string());
    root.put("format_name", descriptor.format_name);
    root.put("format_long_name", descriptor.format_long_name);
    root.put("size", descriptor.size_bytes);
    root.put("duration", descriptor.duration_seconds);
    root.put("bit_rate", descriptor.bit_rate);
    root.put("resolution", descriptor.resolution());

    pt::ptree streams;
    for (const auto& s : descriptor.streams) {
        pt::ptree node;
        node.put("index", s.index);
        node.put("kind", std::string(to_string(s.kind)));
        node.put("codec_name", s.codec_name);
        node.put("codec_long_name", s.codec_long_name);
        if (s.kind == StreamKind::Video) {
            node.put("width", s.width);
            node.put("height", s.height);
            node.put("pix_fmt", s.pixel_format);
            if (!s.display_aspect_ratio.empty()) node.put("display_aspect_ratio", s.display_aspect_ratio);
        } else if (s.kind == StreamKind::Audio) {
            node.put("channels", s.channels);
            node.put("channel_layout", s.channel_layout);
        }
        if (s.bit_rate > 0) node.put("bit_rate", s.bit_rate);
        streams.push_back({"", node});
    }
    root.add_child("streams", streams);

    std::ostringstream out;
    pt::write_json(out, root, true);
    return out.str();
}

namespace {
    std::string runtime_string(const double seconds) {
        const auto total_ms = static_cast<long long>(seconds * 1000.0 + 0.5);
        const long long h = total_ms / 3'600'000;
        const long long m = (total_ms / 60'000) % 60;
        const double s = static_cast<double>(total_ms % 60'000) / 1000.0;
        std::ostringstream out;
        out << h << ":" << std::setw(2) << std::setfill('0') << m << ":"
            << std::setw(6) << std::fixed << std::setprecision(3) << s;
        return out.str();
    }

    std::string bit_rate_string(const std::int64_t bit_rate) {
        return bit_rate > 0 ? std::to_string(bit_rate) : "N/A";
    }
} // namespace

std::string format_info_block(const MediaDescriptor& d) {
    std::ostringstream out;
    out << d.path.string() << " - " << d.format_name << " - " << d.format_long_name
        << ", Runtime = " << runtime_string(d.duration_seconds) << "\n";

    if (d.has_odd_dimensions()) {
        out << "Warning: Resolution (" << d.resolution() << ") is not divisible by 2.\n";
    }

    for (const StreamKind kind : {StreamKind::Video, StreamKind::Audio, StreamKind::Subtitle,
                                  StreamKind::Data, StreamKind::Attachment}) {
        const auto streams = d.streams_of(kind);
        if (streams.empty()) continue;

        std::string label(to_string(kind));
        label[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(label[0])));
        out << streams.size() << " " << label << (streams.size() > 1 ? " streams" : " stream");
        if (kind == StreamKind::Video) out << ": " << d.resolution();
        out << "\n";

        for (const auto* s : streams) {
            out << "  #" << s->index << " " << to_string(s->kind) << ": "
                << (s->codec_long_name.empty() ? s->codec_name : s->codec_long_name);
            if (kind == StreamKind::Video) {
                out << " - " << s->width << " x " << s->height;
                if (!s->display_aspect_ratio.empty()) out << " - DAR: " << s->display_aspect_ratio;
                out << " - bitrate: " << bit_rate_string(s->bit_rate);
            } else if (kind == StreamKind::Audio) {
                if (s->channels > 0) out << " - channels: " << s->channels;
                out << " - bitrate: " << bit_rate_string(s->bit_rate);
            }
            out << "\n";
        }
    }
    return out.str();
}

} // namespace vidtool
