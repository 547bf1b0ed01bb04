#include "../../include/crusher.hpp"
#include "../../include/errors.hpp"
#include <algorithm>
#include <array>

namespace crusher {

    namespace {

    constexpr std::array<std::pair<CrusherId, std::string_view>, 5> kNames = {{
        {CrusherId::Jsmin, "jsmin"},
        {CrusherId::Jscrush, "jscrush"},
        {CrusherId::Sqwish, "sqwish"},
        {CrusherId::Yui, "yui"},
        {CrusherId::Closure, "closure"},
    }};

    } // namespace

    std::string_view crusher_id_name(const CrusherId id) noexcept {
        for (const auto& [key, name] : kNames) {
            if (key == id) return name;
        }
        return "unknown";
    }

    std::optional<CrusherId> crusher_id_from_name(const std::string_view name) noexcept {
        for (const auto& [key, n] : kNames) {
            if (n == name) return key;
        }
        return std::nullopt;
    }

    bool ICrusher::accepts(const ContentType type) const noexcept {
        const auto types = get_supported_types();
        return std::find(types.begin(), types.end(), type) != types.end();
    }

    std::string ICrusher::crush(const ContentType type, const std::string_view content) const {
        if (!accepts(type)) {
            throw CrushError(ErrorKind::TypeMismatch,
                             std::string("Type is not supported: ") + std::string(get_name()) +
                             " does not accept " + std::string(content_type_to_string(type)));
        }
        return run(type, content);
    }

} // namespace crusher
