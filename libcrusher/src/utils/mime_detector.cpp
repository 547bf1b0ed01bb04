#include <magic.h>
#include "../../include/mime_detector.hpp"
#include "../../include/logger.hpp"

std::string crusher::MimeDetector::detect(const std::filesystem::path& path)
{
    const magic_t magic = magic_open(MAGIC_MIME_TYPE | MAGIC_ERROR);
    if (!magic) return {};
    if (magic_load(magic, nullptr) != 0)
    {
        Logger::log(LogLevel::Debug, std::string("magic_load failed: ") + magic_error(magic), "mime");
        magic_close(magic);
        return {};
    }
    const char* mime = magic_file(magic, path.string().c_str());
    std::string result = mime ? mime : "";
    magic_close(magic);
    return result;
}

std::optional<crusher::ContentType> crusher::MimeDetector::content_type_of(const std::filesystem::path& path)
{
    if (const auto by_ext = content_type_from_path(path))
    {
        return by_ext;
    }
    const std::string mime = detect(path);
    Logger::log(LogLevel::Debug, path.string() + " detected as " + (mime.empty() ? "unknown" : mime), "mime");
    return content_type_from_mime(mime);
}
