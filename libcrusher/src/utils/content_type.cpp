#include "../../include/content_type.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace crusher {

    namespace {

    std::string to_lower(std::string_view s) {
        std::string out(s);
        std::transform(out.begin(), out.end(), out.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return out;
    }

    } // namespace

    std::optional<ContentType> parse_content_type(std::string_view tag) {
        if (!tag.empty() && tag.front() == '.') {
            tag.remove_prefix(1);
        }
        const std::string lower = to_lower(tag);
        if (lower == "js" || lower == "mjs") return ContentType::Js;
        if (lower == "css") return ContentType::Css;
        return std::nullopt;
    }

    std::string_view content_type_to_string(const ContentType type) noexcept {
        switch (type) {
            case ContentType::Js:  return "js";
            case ContentType::Css: return "css";
        }
        return "";
    }

    std::optional<ContentType> content_type_from_mime(const std::string_view mime) {
        static constexpr std::array<std::pair<std::string_view, ContentType>, 5> kMimes = {{
            {"application/javascript", ContentType::Js},
            {"text/javascript", ContentType::Js},
            {"application/x-javascript", ContentType::Js},
            {"application/ecmascript", ContentType::Js},
            {"text/css", ContentType::Css},
        }};
        const std::string lower = to_lower(mime);
        for (const auto& [name, type] : kMimes) {
            if (lower == name) return type;
        }
        return std::nullopt;
    }

    std::optional<ContentType> content_type_from_path(const std::filesystem::path& path) {
        const auto ext = path.extension().string();
        if (ext.empty()) return std::nullopt;
        return parse_content_type(ext);
    }

} // namespace crusher
