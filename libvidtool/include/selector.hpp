/**
 * @file selector.hpp
 * @brief Chooses the files that take part in a batch.
 */

#ifndef VIDTOOL_SELECTOR_HPP
#define VIDTOOL_SELECTOR_HPP

#include "event_bus.hpp"
#include "media_prober.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <regex>
#include <set>
#include <stop_token>
#include <string>
#include <vector>

namespace vidtool {

/**
 * @brief A file name pattern, matched against the last path component.
 */
struct NamePattern {
    enum class Kind {
        Glob, ///< `*`, `?`, `[...]`, `[!...]`, case-insensitive, whole name
        Regex ///< ECMAScript, searched anywhere in the name
    };

    Kind kind = Kind::Glob;
    std::string text;
};

/**
 * @brief Inclusive range; an unset bound is open.
 */
template <typename T>
struct Range {
    std::optional<T> min;
    std::optional<T> max;

    [[nodiscard]] bool is_set() const noexcept { return min.has_value() || max.has_value(); }

    [[nodiscard]] bool contains(const T& value) const noexcept {
        return (!min || value >= *min) && (!max || value <= *max);
    }
};

/**
 * @brief Conjunction of optional predicates. An unset predicate always holds.
 */
struct SelectionCriteria {
    std::optional<NamePattern> pattern;
    std::vector<NamePattern> exclude;        ///< A file matching any of these is rejected
    std::set<std::string> extensions;        ///< ".mkv" or "mkv", case-insensitive
    std::set<std::string> video_codecs;      ///< Any video stream may match, case-insensitive
    std::set<std::string> audio_codecs;      ///< Any audio stream may match, case-insensitive
    Range<int> width;                        ///< Against the widest video stream
    Range<int> height;                       ///< Against the tallest video stream
    Range<std::uintmax_t> size_bytes;
    Range<double> duration_seconds;
    std::vector<std::string> mime_prefixes;  ///< "video/", any may match

    /// @return True if evaluation needs a MediaDescriptor.
    [[nodiscard]] bool needs_probe() const noexcept;
};

/**
 * @brief A candidate excluded because it could not be probed.
 */
struct SelectionWarning {
    std::filesystem::path path;
    std::string message;
};

struct SelectionResult {
    std::vector<std::filesystem::path> files;  ///< Selected files, in selection order
    std::vector<SelectionWarning> warnings;
};

/**
 * @brief Evaluates SelectionCriteria over directory trees.
 *
 * @details Roots are visited in the given order; within a root, files are
 * sorted lexicographically by path. A root may itself be a regular file.
 * A file reachable from several roots is kept once, at its first
 * position. Cheap predicates run first; the prober is only consulted for
 * files that passed every other predicate.
 */
class Selector {
public:
    /// No recursion limit.
    static constexpr int UNLIMITED_DEPTH = -1;

    explicit Selector(MediaProber& prober, EventBus* bus = nullptr);

    /**
     * @param depth 0 lists only the root directory itself, n descends n
     *        levels, a negative value descends without limit.
     * @throws SelectionError{PathNotFound} if a root does not exist.
     * @throws SelectionError{BadPattern} if a pattern does not compile.
     */
    SelectionResult select(const std::vector<std::filesystem::path>& roots,
                           const SelectionCriteria& criteria,
                           int depth = 0,
                           std::stop_token stop = {});

private:
    MediaProber& prober_;
    EventBus* bus_;
};

/**
 * @brief Compile a NamePattern.
 * @throws SelectionError{BadPattern}
 */
std::regex compile_name_pattern(const NamePattern& pattern);

/**
 * @brief Test a file name against a compiled pattern of the given kind.
 */
bool matches_name(const std::regex& re, NamePattern::Kind kind, const std::string& file_name);

} // namespace vidtool

#endif // VIDTOOL_SELECTOR_HPP
