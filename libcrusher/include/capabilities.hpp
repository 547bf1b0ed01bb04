/**
 * @file capabilities.hpp
 * @brief One-shot probe of the optional external tools.
 */

#ifndef CRUSHER_CAPABILITIES_HPP
#define CRUSHER_CAPABILITIES_HPP

#include "config.hpp"
#include <filesystem>
#include <optional>
#include <string_view>

namespace crusher {

    /**
     * @brief What the host offers to the external-process-backed crushers.
     *
     * Probed once per process and handed to the registry by value; nothing
     * re-probes afterwards.
     */
    struct Capabilities {
        std::optional<std::filesystem::path> java; ///< Resolved java executable, if any

        [[nodiscard]] bool has_java() const noexcept { return java.has_value(); }

        /**
         * @brief Resolve the optional tools.
         *
         * An explicit config.java_path wins over the PATH search; an explicit
         * path that is not executable is reported and treated as absent.
         */
        static Capabilities probe(const CrusherConfig& config);
    };

    /**
     * @brief Search PATH for an executable file.
     * @return The first match, or std::nullopt.
     */
    std::optional<std::filesystem::path> find_executable(std::string_view name);

} // namespace crusher

#endif // CRUSHER_CAPABILITIES_HPP
