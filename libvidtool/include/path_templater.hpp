/**
 * @file path_templater.hpp
 * @brief Expansion of naming patterns into output paths, and collision policy.
 */

#ifndef VIDTOOL_PATH_TEMPLATER_HPP
#define VIDTOOL_PATH_TEMPLATER_HPP

#include "media_descriptor.hpp"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vidtool {

/**
 * @brief What to do when the resolved output already exists.
 */
enum class CollisionPolicy {
    Force,     ///< Overwrite
    NoClobber, ///< Refuse with TemplateError{CollisionDenied}
    Prompt,    ///< Report the collision and let the caller decide
    Increment  ///< Use the first free name_001 ... name_999
};

std::string_view to_string(CollisionPolicy policy) noexcept;

/**
 * @brief Output naming rules for a batch.
 */
struct OutputOptions {
    std::string pattern = "{stem}{suffix}";  ///< Naming pattern, without extension
    std::string extension;                   ///< Target extension; empty keeps the source's
    std::string suffix;                      ///< Value of {suffix}
    CollisionPolicy collision = CollisionPolicy::Prompt;
    std::optional<std::filesystem::path> output_directory; ///< Default: the source's directory
};

/**
 * @brief Parsed naming pattern: literal text and placeholders.
 *
 * Placeholders: {stem} {parent} {ext} {suffix} {resolution} {width}
 * {height} {vcodec} {acodec} {duration}. `{{` and `}}` are literal braces.
 */
class NamingPattern {
public:
    /**
     * @throws TemplateError{UnknownPlaceholder} for a name outside the vocabulary.
     * @throws TemplateError{MalformedPattern} for unbalanced braces or an empty pattern.
     */
    static NamingPattern parse(std::string_view text);

    /**
     * @brief Substitute every placeholder, in order.
     *
     * Substituted values have characters that are unsafe in file names
     * replaced by '_'. Literal text is kept as written, so it may contain
     * '/' to create subdirectories.
     */
    [[nodiscard]] std::string expand(const std::filesystem::path& source,
                                     const MediaDescriptor& descriptor,
                                     std::string_view suffix) const;

    [[nodiscard]] const std::string& text() const noexcept { return text_; }

private:
    enum class Placeholder {
        Stem, Parent, Ext, Suffix, Resolution, Width, Height, VCodec, ACodec, Duration
    };

    struct Segment {
        std::optional<Placeholder> placeholder; ///< Unset for literal text
        std::string literal;
    };

    std::string text_;
    std::vector<Segment> segments_;
};

/**
 * @brief Result of resolving an output path.
 */
struct PathResolution {
    std::filesystem::path path;
    bool exists = false;          ///< The path is taken and will be overwritten if used
    bool needs_decision = false;  ///< Prompt policy: the caller must confirm the overwrite
};

/**
 * @brief Reports paths already spoken for besides those on disk
 * (e.g. outputs claimed by earlier jobs of the same batch).
 */
using PathTaken = std::function<bool(const std::filesystem::path&)>;

/**
 * @brief Normalize an extension to "" or ".xyz".
 */
std::string normalize_extension(std::string_view extension);

/**
 * @brief Expand @p options for @p source and apply the collision policy.
 *
 * @throws TemplateError{UnknownPlaceholder, MalformedPattern} from the pattern.
 * @throws TemplateError{SameAsInput} if the result is @p source itself.
 * @throws TemplateError{CollisionDenied} under no-clobber when the path exists.
 * @throws TemplateError{NoFreeName} when increment runs out of names.
 */
PathResolution resolve_output_path(const std::filesystem::path& source,
                                   const MediaDescriptor& descriptor,
                                   const OutputOptions& options,
                                   const PathTaken& taken = {});

/**
 * @brief Apply @p policy to an already expanded @p candidate.
 *
 * Increment also steps over the names @p taken reports; the other
 * policies only look at the disk.
 */
PathResolution apply_collision_policy(const std::filesystem::path& candidate,
                                      CollisionPolicy policy,
                                      const PathTaken& taken = {});

} // namespace vidtool

#endif // VIDTOOL_PATH_TEMPLATER_HPP
