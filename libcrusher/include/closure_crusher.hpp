/**
 * @file closure_crusher.hpp
 * @brief ICrusher backed by the Google Closure Compiler.
 */

#ifndef CRUSHER_CLOSURE_CRUSHER_HPP
#define CRUSHER_CLOSURE_CRUSHER_HPP

#include "crusher.hpp"
#include "capabilities.hpp"
#include "config.hpp"
#include "remote_service.hpp"
#include <array>

namespace crusher {

    /**
     * @brief Compiles JavaScript with SIMPLE_OPTIMIZATIONS.
     *
     * @details Runs `java -jar <vendor>/closure.jar` when java is available;
     * otherwise posts the code to the closure compiler service configured in
     * CrusherConfig::closure_url. Transport errors, HTTP errors and empty
     * answers are failures.
     */
    class ClosureCrusher final : public ICrusher {
    public:
        ClosureCrusher(Capabilities caps, CrusherConfig config);

        [[nodiscard]] CrusherId get_id() const noexcept override { return CrusherId::Closure; }

        [[nodiscard]] std::span<const ContentType> get_supported_types() const noexcept override {
            static constexpr std::array<ContentType, 1> kTypes = { ContentType::Js };
            return {kTypes.data(), kTypes.size()};
        }

        [[nodiscard]] CrushStrategy get_strategy() const noexcept override {
            return caps_.has_java() ? CrushStrategy::ExternalProcess : CrushStrategy::RemoteService;
        }

    protected:
        [[nodiscard]] std::string run(ContentType type, std::string_view content) const override;

    private:
        Capabilities caps_;
        CrusherConfig config_;
        RemoteService service_;
    };

} // namespace crusher

#endif // CRUSHER_CLOSURE_CRUSHER_HPP
