/**
 * @file yui_crusher.hpp
 * @brief ICrusher backed by the YUI compressor jar.
 */

#ifndef CRUSHER_YUI_CRUSHER_HPP
#define CRUSHER_YUI_CRUSHER_HPP

#include "crusher.hpp"
#include "capabilities.hpp"
#include "config.hpp"
#include <array>

namespace crusher {

    /**
     * @brief Runs `java -jar <vendor>/yui.jar --type <type> --line-break 256`.
     *
     * @details Accepts both JavaScript and CSS. When java is not available the
     * content is passed through unchanged; this degradation is explicit and
     * logged at debug level.
     */
    class YuiCrusher final : public ICrusher {
    public:
        YuiCrusher(Capabilities caps, CrusherConfig config)
            : caps_(std::move(caps)), config_(std::move(config)) {}

        [[nodiscard]] CrusherId get_id() const noexcept override { return CrusherId::Yui; }

        [[nodiscard]] std::span<const ContentType> get_supported_types() const noexcept override {
            static constexpr std::array<ContentType, 2> kTypes = { ContentType::Js, ContentType::Css };
            return {kTypes.data(), kTypes.size()};
        }

        [[nodiscard]] CrushStrategy get_strategy() const noexcept override { return CrushStrategy::ExternalProcess; }

    protected:
        [[nodiscard]] std::string run(ContentType type, std::string_view content) const override;

    private:
        Capabilities caps_;
        CrusherConfig config_;
    };

} // namespace crusher

#endif // CRUSHER_YUI_CRUSHER_HPP
