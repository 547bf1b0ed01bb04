/**
 * @file crusher_registry.hpp
 * @brief Defines the registry owning every ICrusher of a process.
 */

#ifndef CRUSHER_CRUSHER_REGISTRY_HPP
#define CRUSHER_CRUSHER_REGISTRY_HPP

#include "capabilities.hpp"
#include "config.hpp"
#include "crusher.hpp"
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace crusher {

    /**
     * @brief Registry of all available crushers.
     *
     * @details Built once per process from the probed Capabilities and the
     * CrusherConfig, then treated as immutable. Lookups go through the typed
     * CrusherId enumeration; names that do not map onto it are reported with
     * the same error as a name that is simply not registered.
     */
    class CrusherRegistry {
    public:
        /**
         * @brief Construct and register all built-in crushers.
         * @param caps Probed capabilities, consumed by the jar-backed crushers.
         * @param config Configuration shared by all crushers.
         */
        CrusherRegistry(const Capabilities& caps, const CrusherConfig& config);

        /**
         * @brief Resolve an engine name for a content type tag.
         *
         * @return The crusher registered under that name. Whether it accepts the
         *         content type is checked by ICrusher::crush().
         * @throws CrushError (ErrorKind::UnknownTransform) with the message
         *         "The engine <name> does not exist" if the name is not registered
         *         or the content type tag is unknown.
         */
        [[nodiscard]] const ICrusher& resolve(std::string_view name, std::string_view extension) const;

        /// @return The crusher with that id, or nullptr.
        [[nodiscard]] const ICrusher* find(CrusherId id) const noexcept;

        /**
         * @brief Names of the crushers that accept a content type, in registration order.
         *
         * This is the query surface front-ends use to validate a pipeline before
         * dispatching it.
         */
        [[nodiscard]] std::vector<std::string> available(ContentType type) const;

        /// @return True if every name is available for type.
        [[nodiscard]] bool supports(const std::vector<std::string>& names, ContentType type) const;

        /**
         * @brief Access all registered crushers.
         */
        [[nodiscard]] const std::vector<std::unique_ptr<ICrusher>>& all() const { return crushers_; }

    private:
        ///< Owned instances of all registered crushers.
        std::vector<std::unique_ptr<ICrusher>> crushers_;
    };

} // namespace crusher

#endif // CRUSHER_CRUSHER_REGISTRY_HPP
