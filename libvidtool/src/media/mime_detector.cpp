#include <magic.h>
#include "../../include/mime_detector.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"

std::string vidtool::MimeDetector::detect(const std::filesystem::path& path)
{
    const magic_t magic = magic_open(MAGIC_MIME_TYPE | MAGIC_ERROR);
    if (!magic) return {};
    if (magic_load(magic, nullptr) != 0)
    {
        Logger::log(LogLevel::Warning, std::string("Cannot load magic database: ") + magic_error(magic), "libmagic");
        magic_close(magic);
        return {};
    }
    const char* mime = magic_file(magic, path.string().c_str());
    std::string result = mime ? mime : "";
    magic_close(magic);
    return result;
}

bool vidtool::MimeDetector::has_prefix(const std::filesystem::path& path, const std::string_view prefix)
{
    return to_lower(detect(path)).starts_with(to_lower(prefix));
}
