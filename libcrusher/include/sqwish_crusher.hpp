/**
 * @file sqwish_crusher.hpp
 * @brief In-process CSS compactor.
 */

#ifndef CRUSHER_SQWISH_CRUSHER_HPP
#define CRUSHER_SQWISH_CRUSHER_HPP

#include "crusher.hpp"
#include <array>

namespace crusher {

    /**
     * @brief Implements ICrusher for stylesheets.
     *
     * @details Removes comments, collapses whitespace, drops spaces around
     * punctuation and the last semicolon of each block. Inside declaration
     * values `#aabbcc` colours become `#abc` and units are dropped from zero
     * lengths. Quoted strings are copied verbatim and values containing one
     * are not rewritten.
     */
    class SqwishCrusher final : public ICrusher {
    public:
        [[nodiscard]] CrusherId get_id() const noexcept override { return CrusherId::Sqwish; }

        [[nodiscard]] std::span<const ContentType> get_supported_types() const noexcept override {
            static constexpr std::array<ContentType, 1> kTypes = { ContentType::Css };
            return {kTypes.data(), kTypes.size()};
        }

        [[nodiscard]] CrushStrategy get_strategy() const noexcept override { return CrushStrategy::InProcess; }

    protected:
        [[nodiscard]] std::string run(ContentType type, std::string_view content) const override;
    };

} // namespace crusher

#endif // CRUSHER_SQWISH_CRUSHER_HPP
