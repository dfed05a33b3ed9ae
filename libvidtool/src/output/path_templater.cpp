#include "../../include/path_templater.hpp"
#include "../../include/errors.hpp"
#include "../../include/file_utils.hpp"

#include <cmath>
#include <cstdio>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace vidtool {

namespace {
    constexpr int MAX_INCREMENT = 999;

    std::string sanitize(const std::string& value) {
        std::string out = value;
        for (char& c : out) {
            const auto u = static_cast<unsigned char>(c);
            if (u < 0x20 || c == '/' || c == '\\' || c == ':' || c == '*' || c == '?'
                || c == '"' || c == '<' || c == '>' || c == '|') {
                c = '_';
            }
        }
        return out;
    }

    bool same_file(const fs::path& a, const fs::path& b) {
        std::error_code ec_a;
        std::error_code ec_b;
        const auto ca = fs::weakly_canonical(a, ec_a);
        const auto cb = fs::weakly_canonical(b, ec_b);
        if (ec_a || ec_b) return fs::absolute(a).lexically_normal() == fs::absolute(b).lexically_normal();
        return ca == cb;
    }
} // namespace

std::string_view to_string(const CollisionPolicy policy) noexcept {
    switch (policy) {
        case CollisionPolicy::Force:     return "force";
        case CollisionPolicy::NoClobber: return "no-clobber";
        case CollisionPolicy::Prompt:    return "prompt";
        case CollisionPolicy::Increment: return "increment";
    }
    return "prompt";
}

NamingPattern NamingPattern::parse(const std::string_view text) {
    static const std::pair<std::string_view, Placeholder> vocabulary[] = {
        {"stem", Placeholder::Stem},
        {"parent", Placeholder::Parent},
        {"ext", Placeholder::Ext},
        {"suffix", Placeholder::Suffix},
        {"resolution", Placeholder::Resolution},
        {"width", Placeholder::Width},
        {"height", Placeholder::Height},
        {"vcodec", Placeholder::VCodec},
        {"acodec", Placeholder::ACodec},
        {"duration", Placeholder::Duration},
    };

    if (text.empty()) {
        throw TemplateError(TemplateError::Kind::MalformedPattern, "Naming pattern is empty");
    }

    NamingPattern pattern;
    pattern.text_ = std::string(text);
    std::string literal;

    const auto flush_literal = [&] {
        if (!literal.empty()) {
            pattern.segments_.push_back({std::nullopt, std::move(literal)});
            literal.clear();
        }
    };

    for (std::size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (c == '{') {
            if (i + 1 < text.size() && text[i + 1] == '{') {
                literal += '{';
                ++i;
                continue;
            }
            const auto close = text.find_first_of("{}", i + 1);
            if (close == std::string_view::npos || text[close] != '}') {
                throw TemplateError(TemplateError::Kind::MalformedPattern,
                                    "Unbalanced '{' in pattern: " + pattern.text_);
            }
            const std::string_view name = text.substr(i + 1, close - i - 1);
            std::optional<Placeholder> found;
            for (const auto& [key, value] : vocabulary) {
                if (key == name) found = value;
            }
            if (!found) {
                throw TemplateError(TemplateError::Kind::UnknownPlaceholder,
                                    "Unknown placeholder {" + std::string(name) + "} in pattern: " + pattern.text_);
            }
            flush_literal();
            pattern.segments_.push_back({found, {}});
            i = close;
        } else if (c == '}') {
            if (i + 1 < text.size() && text[i + 1] == '}') {
                literal += '}';
                ++i;
                continue;
            }
            throw TemplateError(TemplateError::Kind::MalformedPattern,
                                "Unbalanced '}' in pattern: " + pattern.text_);
        } else {
            literal += c;
        }
    }
    flush_literal();
    return pattern;
}

std::string NamingPattern::expand(const fs::path& source,
                                  const MediaDescriptor& descriptor,
                                  const std::string_view suffix) const {
    std::string out;
    for (const auto& seg : segments_) {
        if (!seg.placeholder) {
            out += seg.literal;
            continue;
        }
        std::string value;
        switch (*seg.placeholder) {
            case Placeholder::Stem:       value = source.stem().string(); break;
            case Placeholder::Parent:     value = source.parent_path().filename().string(); break;
            case Placeholder::Ext: {
                const std::string ext = source.extension().string();
                value = ext.empty() ? ext : ext.substr(1);
                break;
            }
            case Placeholder::Suffix:     value = std::string(suffix); break;
            case Placeholder::Resolution: value = descriptor.resolution(); break;
            case Placeholder::Width:      value = std::to_string(descriptor.max_width()); break;
            case Placeholder::Height:     value = std::to_string(descriptor.max_height()); break;
            case Placeholder::VCodec:     value = descriptor.primary_codec(StreamKind::Video); break;
            case Placeholder::ACodec:     value = descriptor.primary_codec(StreamKind::Audio); break;
            case Placeholder::Duration:
                value = std::to_string(static_cast<long long>(std::floor(descriptor.duration_seconds)));
                break;
        }
        out += sanitize(value);
    }
    return out;
}

std::string normalize_extension(const std::string_view extension) {
    std::string out(extension);
    if (!out.empty() && out.front() != '.') out.insert(out.begin(), '.');
    return out;
}

PathResolution apply_collision_policy(const fs::path& candidate,
                                      const CollisionPolicy policy,
                                      const PathTaken& taken) {
    const auto in_use = [&taken](const fs::path& p) {
        std::error_code ec;
        return fs::exists(p, ec) || (taken && taken(p));
    };

    if (policy != CollisionPolicy::Increment) {
        std::error_code ec;
        if (!fs::exists(candidate, ec)) return {candidate, false, false};
    } else if (!in_use(candidate)) {
        return {candidate, false, false};
    }

    switch (policy) {
        case CollisionPolicy::Force:
            return {candidate, true, false};
        case CollisionPolicy::Prompt:
            return {candidate, true, true};
        case CollisionPolicy::NoClobber:
            throw TemplateError(TemplateError::Kind::CollisionDenied,
                                "Output exists and will not be overwritten: " + candidate.string());
        case CollisionPolicy::Increment:
            break;
    }

    const fs::path dir = candidate.parent_path();
    const std::string stem = candidate.stem().string();
    const std::string ext = candidate.extension().string();
    for (int n = 1; n <= MAX_INCREMENT; ++n) {
        char counter[8];
        std::snprintf(counter, sizeof(counter), "_%03d", n);
        fs::path next = dir / (stem + counter + ext);
        if (!in_use(next)) return {std::move(next), false, false};
    }
    throw TemplateError(TemplateError::Kind::NoFreeName,
                        "No free name left for " + candidate.string());
}

PathResolution resolve_output_path(const fs::path& source,
                                   const MediaDescriptor& descriptor,
                                   const OutputOptions& options,
                                   const PathTaken& taken) {
    const NamingPattern pattern = NamingPattern::parse(options.pattern);
    const std::string expanded = pattern.expand(source, descriptor, options.suffix);

    const fs::path relative(expanded);
    if (expanded.empty() || relative.is_absolute() || relative.filename().empty()) {
        throw TemplateError(TemplateError::Kind::MalformedPattern,
                            "Pattern '" + options.pattern + "' yields an unusable name '" + expanded + "'");
    }
    for (const auto& part : relative) {
        if (part == "..") {
            throw TemplateError(TemplateError::Kind::MalformedPattern,
                                "Pattern '" + options.pattern + "' escapes the output directory");
        }
    }

    const std::string ext = options.extension.empty()
        ? source.extension().string()
        : normalize_extension(options.extension);
    const fs::path base = options.output_directory.value_or(source.parent_path());
    fs::path candidate = base / relative;
    candidate += ext;

    if (same_file(candidate, source)) {
        throw TemplateError(TemplateError::Kind::SameAsInput,
                            "Output would overwrite the source: " + source.string());
    }
    return apply_collision_policy(candidate, options.collision, taken);
}

} // namespace vidtool
