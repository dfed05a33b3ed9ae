/**
 * @file preset_store.hpp
 * @brief Persistent, named TranscodeOptions.
 */

#ifndef VIDTOOL_PRESET_STORE_HPP
#define VIDTOOL_PRESET_STORE_HPP

#include "transcode_options.hpp"

#include <filesystem>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace vidtool {

/**
 * @brief A named option set plus the naming defaults that usually go with it.
 */
struct Preset {
    std::string name;
    std::string description;
    TranscodeOptions options;
    std::string output_extension;  ///< Empty: no opinion
    std::string output_suffix;     ///< Empty: no opinion

    bool operator==(const Preset&) const = default;
};

/**
 * @brief Preset Store.
 *
 * @details Backed by one JSON document,
 * `{"version": "1.0", "presets": {"<name>": {...}}}`. The whole mapping
 * is kept in memory and written back after every mutation, through a
 * temporary sibling file renamed over the store, so a crash never leaves
 * a half-written store behind. A mutation whose write fails leaves the
 * in-memory mapping unchanged. A store-wide mutex serializes all access.
 */
class PresetStore {
public:
    static constexpr std::string_view FORMAT_VERSION = "1.0";

    /**
     * @brief Open (or create on first write) the store at @p file.
     *
     * @param seed_defaults When the file does not exist, populate it with
     *        the built-in presets.
     * @throws PresetError{Unreadable} if the file exists but cannot be parsed.
     */
    explicit PresetStore(std::filesystem::path file, bool seed_defaults = false);

    PresetStore(const PresetStore&) = delete;
    PresetStore& operator=(const PresetStore&) = delete;

    /// Create or overwrite @p name. @throws PresetError{InvalidName}, OptionConflict
    void save(const std::string& name, const TranscodeOptions& options);
    void save(const Preset& preset);

    /// @throws PresetError{NotFound}
    [[nodiscard]] TranscodeOptions load(const std::string& name) const;
    /// @throws PresetError{NotFound}
    [[nodiscard]] Preset get(const std::string& name) const;

    [[nodiscard]] std::set<std::string> list() const;
    [[nodiscard]] bool contains(const std::string& name) const;

    /// No-op when @p name is absent.
    void remove(const std::string& name);

    /// @throws PresetError{NotFound, AlreadyExists, InvalidName}
    void rename(const std::string& from, const std::string& to);

    /**
     * @brief Write the presets named in @p names (all if empty) as a standalone document.
     * @throws PresetError{NotFound, WriteFailed}
     */
    void export_to(const std::filesystem::path& path, const std::vector<std::string>& names = {}) const;

    /**
     * @brief Merge a document written by export_to() into the store.
     *
     * A name already present gets a " (1)", " (2)", ... suffix.
     * @return Names under which the presets were stored.
     * @throws PresetError{Unreadable}
     */
    std::vector<std::string> import_from(const std::filesystem::path& path);

    [[nodiscard]] const std::filesystem::path& file() const noexcept { return file_; }

    static std::vector<Preset> default_presets();

    /// $XDG_CONFIG_HOME/vidtool/presets.json, or ~/.config/vidtool/presets.json.
    static std::filesystem::path default_location();

private:
    /// Write @p next to the store file, then make it the in-memory state. Caller holds mtx_.
    void commit_locked(std::map<std::string, Preset> next);

    std::filesystem::path file_;
    std::map<std::string, Preset> presets_;
    mutable std::mutex mtx_;
};

} // namespace vidtool

#endif // VIDTOOL_PRESET_STORE_HPP
