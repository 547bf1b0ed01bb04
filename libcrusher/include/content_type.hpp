/**
 * @file content_type.hpp
 * @brief Content types a crusher can be registered for, and conversions.
 */

#ifndef CRUSHER_CONTENT_TYPE_HPP
#define CRUSHER_CONTENT_TYPE_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace crusher {

    /**
     * @brief Content types understood by the crusher registry.
     *
     * The task carries its type as a plain tag ("js", "css") because that is
     * what travels over the wire; it is parsed into this enum at the registry
     * boundary.
     */
    enum class ContentType {
        Js,
        Css
    };

    /**
     * @brief Parse a content type tag.
     *
     * Accepts "js" and "css", with or without a leading dot, case-insensitive.
     * "mjs" is treated as JavaScript.
     * @return The content type, or std::nullopt for unknown tags.
     */
    std::optional<ContentType> parse_content_type(std::string_view tag);

    /// @return The canonical tag ("js" or "css").
    std::string_view content_type_to_string(ContentType type) noexcept;

    /**
     * @brief Map a libmagic MIME type to a content type.
     * @return The content type, or std::nullopt for anything else.
     */
    std::optional<ContentType> content_type_from_mime(std::string_view mime);

    /// @return The content type of a path judged by its extension only.
    std::optional<ContentType> content_type_from_path(const std::filesystem::path& path);

} // namespace crusher

#endif // CRUSHER_CONTENT_TYPE_HPP
