/**
 * @file jsmin_crusher.hpp
 * @brief In-process JavaScript minifier following Douglas Crockford's JSMin.
 */

#ifndef CRUSHER_JSMIN_CRUSHER_HPP
#define CRUSHER_JSMIN_CRUSHER_HPP

#include "crusher.hpp"
#include <array>

namespace crusher {

    /**
     * @brief Implements ICrusher with the JSMin algorithm.
     *
     * @details Removes comments and insignificant whitespace from JavaScript.
     * String, template and regular expression literals are copied verbatim.
     * A leading UTF-8 byte order mark is dropped.
     *
     * Unterminated comments and literals are reported with CrushError
     * (ErrorKind::TransformFailed).
     */
    class JsminCrusher final : public ICrusher {
    public:
        [[nodiscard]] CrusherId get_id() const noexcept override { return CrusherId::Jsmin; }

        [[nodiscard]] std::span<const ContentType> get_supported_types() const noexcept override {
            static constexpr std::array<ContentType, 1> kTypes = { ContentType::Js };
            return {kTypes.data(), kTypes.size()};
        }

        [[nodiscard]] CrushStrategy get_strategy() const noexcept override { return CrushStrategy::InProcess; }

    protected:
        [[nodiscard]] std::string run(ContentType type, std::string_view content) const override;
    };

} // namespace crusher

#endif // CRUSHER_JSMIN_CRUSHER_HPP
