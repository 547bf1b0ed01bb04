/**
 * @file jscrush_crusher.hpp
 * @brief In-process JavaScript packer in the style of JSCrush.
 */

#ifndef CRUSHER_JSCRUSH_CRUSHER_HPP
#define CRUSHER_JSCRUSH_CRUSHER_HPP

#include "crusher.hpp"
#include <array>

namespace crusher {

    /**
     * @brief Implements ICrusher with a self-unpacking substring packer.
     *
     * @details Repeatedly replaces the substring with the best gain by a
     * character that does not occur in the program, then emits
     *
     *     _='<packed>';for(Y in $='<keys>')with(_.split($[Y]))_=join(pop());eval(_)
     *
     * which restores and evaluates the original source. When packing does not
     * make the program shorter the input is returned unchanged.
     */
    class JscrushCrusher final : public ICrusher {
    public:
        [[nodiscard]] CrusherId get_id() const noexcept override { return CrusherId::Jscrush; }

        [[nodiscard]] std::span<const ContentType> get_supported_types() const noexcept override {
            static constexpr std::array<ContentType, 1> kTypes = { ContentType::Js };
            return {kTypes.data(), kTypes.size()};
        }

        [[nodiscard]] CrushStrategy get_strategy() const noexcept override { return CrushStrategy::InProcess; }

    protected:
        [[nodiscard]] std::string run(ContentType type, std::string_view content) const override;
    };

} // namespace crusher

#endif // CRUSHER_JSCRUSH_CRUSHER_HPP
