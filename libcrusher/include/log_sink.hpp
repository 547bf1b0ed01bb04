/**
 * @file log_sink.hpp
 * @brief Severity levels and the sink interface used by the Logger facade.
 */

#ifndef CRUSHER_LOG_SINK_HPP
#define CRUSHER_LOG_SINK_HPP

#include <string_view>

namespace crusher {

    /**
     * @brief Severity levels for log messages.
     *
     * Sinks compare against these to filter output. None is only meaningful
     * as a sink threshold and is never attached to a message.
     */
    enum class LogLevel {
        Debug,   ///< Detailed diagnostic information (wire traffic, timings)
        Info,    ///< Normal operation (workers spawned, tasks completed)
        Warning, ///< Degraded operation (missing java, worker restarts)
        Error,   ///< Failures that need attention (protocol violations)
        None     ///< Threshold that silences a sink
    };

    /**
     * @brief Abstract sink interface for logging.
     *
     * Implementations decide where messages go (console, file, observer).
     * The Logger calls log() with its internal mutex held, so a sink never
     * sees two messages concurrently.
     */
    struct ILogSink {
        virtual ~ILogSink() = default;

        /**
         * @brief Log a message.
         * @param level Severity level of the message.
         * @param message The message text.
         * @param tag Component that produced the message (e.g. "pool").
         */
        virtual void log(LogLevel level,
                         std::string_view message,
                         std::string_view tag) = 0;
    };

} // namespace crusher

#endif // CRUSHER_LOG_SINK_HPP
