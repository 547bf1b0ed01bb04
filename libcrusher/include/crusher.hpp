/**
 * @file crusher.hpp
 * @brief The ICrusher interface every transform implements.
 */

#ifndef CRUSHER_CRUSHER_HPP
#define CRUSHER_CRUSHER_HPP

#include "content_type.hpp"
#include <optional>
#include <span>
#include <string>
#include <string_view>

/**
 * @namespace crusher
 * @brief The main namespace for the crusher library.
 *
 * @details This namespace holds the ICrusher interface and its concrete
 * transforms, the registry and pipeline executor that run them, the worker
 * pool that spreads tasks over worker processes, and the utilities they
 * share (logging, external processes, gzip sizing).
 */
namespace crusher {

    /**
     * @brief Every transform the registry knows, as a closed enumeration.
     *
     * Names travel as strings; they are mapped onto this enumeration at the
     * registry boundary with crusher_id_from_name().
     */
    enum class CrusherId {
        Jsmin,
        Jscrush,
        Sqwish,
        Yui,
        Closure
    };

    /// How a crusher produces its output.
    enum class CrushStrategy {
        InProcess,       ///< Pure function over the content
        ExternalProcess, ///< Delegates to an external executable
        RemoteService    ///< Calls a remote endpoint
    };

    /// @return The registered name of a crusher ("jsmin", "yui", ...).
    std::string_view crusher_id_name(CrusherId id) noexcept;

    /// @return The crusher with that exact name, or std::nullopt.
    std::optional<CrusherId> crusher_id_from_name(std::string_view name) noexcept;

    /**
     * @brief Interface for a content transform.
     *
     * A crusher maps content to content for the content types it declares.
     * Implementations are stateless with respect to the content they process
     * and may be called from several threads at once.
     *
     * Failures are reported by throwing; CrushError carries a precise
     * ErrorKind, anything else is reported as ErrorKind::TransformFailed.
     */
    class ICrusher {
    public:
        virtual ~ICrusher() = default;

        // --- self-description ---

        [[nodiscard]] virtual CrusherId get_id() const noexcept = 0;

        /// @return The registered name, see crusher_id_name().
        [[nodiscard]] std::string_view get_name() const noexcept { return crusher_id_name(get_id()); }

        /// @return Content types this crusher accepts.
        [[nodiscard]] virtual std::span<const ContentType> get_supported_types() const noexcept = 0;

        /// @return The strategy currently in effect (it may depend on probed capabilities).
        [[nodiscard]] virtual CrushStrategy get_strategy() const noexcept = 0;

        /// @return True if type is among get_supported_types().
        [[nodiscard]] bool accepts(ContentType type) const noexcept;

        // --- operations ---

        /**
         * @brief Crush content of the given type.
         * @throws CrushError (ErrorKind::TypeMismatch) if the type is not accepted;
         *         the content is never touched in that case.
         */
        [[nodiscard]] std::string crush(ContentType type, std::string_view content) const;

    protected:
        /// Transform content already known to be of an accepted type.
        [[nodiscard]] virtual std::string run(ContentType type, std::string_view content) const = 0;
    };

} // namespace crusher

#endif // CRUSHER_CRUSHER_HPP
