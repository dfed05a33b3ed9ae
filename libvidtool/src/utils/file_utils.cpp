#include <filesystem>
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include "../../include/random_utils.hpp"
#include <algorithm>
#include <cctype>
#include <system_error>

namespace vidtool {

    std::filesystem::path make_temp_sibling(const std::filesystem::path& target) {
        const auto dir = target.parent_path();
        const std::string stem = target.stem().string();
        const std::string ext = target.extension().string();

        std::filesystem::path candidate;
        std::error_code ec;
        do {
            candidate = dir / ("." + stem + ".vidtool-" + RandomUtils::random_suffix() + ext);
        } while (std::filesystem::exists(candidate, ec));
        return candidate;
    }

    void remove_quietly(const std::filesystem::path& path, const std::string_view tag) {
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) return;
        std::filesystem::remove(path, ec);
        if (ec) {
            Logger::log(LogLevel::Warning, "Can't remove " + path.string() + " (" + ec.message() + ")", tag);
        } else {
            Logger::log(LogLevel::Debug, "Removed " + path.string(), tag);
        }
    }

    std::string move_into_place(const std::filesystem::path& temp, const std::filesystem::path& target) {
        std::error_code ec;
        std::filesystem::rename(temp, target, ec);
        if (!ec) return {};

        // cross-device: copy then drop the temporary
        std::error_code copy_ec;
        std::filesystem::copy_file(temp, target, std::filesystem::copy_options::overwrite_existing, copy_ec);
        if (copy_ec) {
            return "cannot move " + temp.string() + " to " + target.string() + ": " + copy_ec.message();
        }
        std::filesystem::remove(temp, ec);
        return {};
    }

    std::string to_lower(const std::string_view s) {
        std::string out(s);
        std::ranges::transform(out, out.begin(), [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return out;
    }

} // namespace vidtool
