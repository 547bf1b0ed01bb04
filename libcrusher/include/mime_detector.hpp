/**
 * @file mime_detector.hpp
 * @brief Content sniffing with libmagic.
 */

#ifndef CRUSHER_MIME_DETECTOR_HPP
#define CRUSHER_MIME_DETECTOR_HPP

#include "content_type.hpp"
#include <filesystem>
#include <optional>
#include <string>

namespace crusher {

    /**
     * @brief Detects file types for inputs without a telling extension.
     */
    class MimeDetector {
    public:
        /**
         * @brief Detect the MIME type of a file.
         *
         * @param path The filesystem path to the file.
         * @return A string representing the MIME type (e.g., "text/css"),
         * or an empty string if libmagic cannot be loaded or fails.
         */
        static std::string detect(const std::filesystem::path& path);

        /**
         * @brief Content type of a file: by extension first, then by MIME type.
         * @return The content type, or std::nullopt if neither identifies one.
         */
        static std::optional<ContentType> content_type_of(const std::filesystem::path& path);
    };

} // namespace crusher

#endif // CRUSHER_MIME_DETECTOR_HPP
