/**
 * @file errors.hpp
 * @brief Error taxonomy shared by crushers, the pipeline and the pool.
 */

#ifndef CRUSHER_ERRORS_HPP
#define CRUSHER_ERRORS_HPP

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace crusher {

    /**
     * @brief Classifies every failure a task can report back to its caller.
     *
     * The numeric values are part of the wire protocol; append only.
     */
    enum class ErrorKind : std::uint8_t {
        UnknownTransform = 1,   ///< Engine name not registered for the content type
        TypeMismatch = 2,       ///< Engine exists but does not accept the content type
        TransformFailed = 3,    ///< The crusher itself reported an error
        ProcessDiagnostic = 4,  ///< External tool wrote to its diagnostic stream
        ProcessExitCode = 5,    ///< External tool exited non-zero or was signalled
        ProcessEmptyOutput = 6, ///< External tool produced no output
        RemoteServiceFailed = 7,///< Remote service transport or HTTP failure
        GzipFailed = 8,         ///< Post-pipeline gzip sizing failed
        WorkerLost = 9          ///< The worker died before replying
    };

    /// @return Stable, human-readable name of an error kind.
    std::string_view error_kind_name(ErrorKind kind) noexcept;

    /// @return The kind for a wire value, or std::nullopt if it is out of range.
    std::optional<ErrorKind> error_kind_from_wire(std::uint8_t value) noexcept;

    /**
     * @brief Exception thrown by crushers and helpers that know their failure class.
     *
     * Anything else deriving from std::exception that escapes a crusher is
     * reported as ErrorKind::TransformFailed.
     */
    class CrushError : public std::runtime_error {
    public:
        CrushError(const ErrorKind kind, const std::string& message)
            : std::runtime_error(message), kind_(kind) {}

        [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

    private:
        ErrorKind kind_;
    };

    /**
     * @brief Error attached to a task reply.
     */
    struct TaskError {
        ErrorKind kind = ErrorKind::TransformFailed;
        std::string message;

        bool operator==(const TaskError&) const = default;
    };

} // namespace crusher

#endif // CRUSHER_ERRORS_HPP
