#include "../../include/errors.hpp"

namespace crusher {

    std::string_view error_kind_name(const ErrorKind kind) noexcept {
        switch (kind) {
            case ErrorKind::UnknownTransform:    return "unknown-transform";
            case ErrorKind::TypeMismatch:        return "type-mismatch";
            case ErrorKind::TransformFailed:     return "transform-failed";
            case ErrorKind::ProcessDiagnostic:   return "process-diagnostic";
            case ErrorKind::ProcessExitCode:     return "process-exit-code";
            case ErrorKind::ProcessEmptyOutput:  return "process-empty-output";
            case ErrorKind::RemoteServiceFailed: return "remote-service-failed";
            case ErrorKind::GzipFailed:          return "gzip-failed";
            case ErrorKind::WorkerLost:          return "worker-lost";
        }
        return "unknown";
    }

    std::optional<ErrorKind> error_kind_from_wire(const std::uint8_t value) noexcept {
        if (value < static_cast<std::uint8_t>(ErrorKind::UnknownTransform) ||
            value > static_cast<std::uint8_t>(ErrorKind::WorkerLost)) {
            return std::nullopt;
        }
        return static_cast<ErrorKind>(value);
    }

} // namespace crusher
