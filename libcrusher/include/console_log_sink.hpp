/**
 * @file console_log_sink.hpp
 * @brief ILogSink writing to the standard streams.
 */

#ifndef CRUSHER_CONSOLE_LOG_SINK_HPP
#define CRUSHER_CONSOLE_LOG_SINK_HPP

#include "log_sink.hpp"
#include "logger.hpp"
#include <iostream>
#include <string_view>

namespace crusher {

    /**
     * @brief Console sink with a severity threshold.
     *
     * Debug and Info go to stdout, Warning and Error to stderr. Worker
     * processes construct it with to_stderr_only set because their stdout is
     * not meant for humans.
     */
    class ConsoleLogSink final : public ILogSink {
    public:
        explicit ConsoleLogSink(const LogLevel threshold = LogLevel::Error,
                                const bool to_stderr_only = false)
            : log_level(threshold), stderr_only_(to_stderr_only) {}

        LogLevel log_level;

        void log(const LogLevel level,
                 const std::string_view message,
                 const std::string_view tag) override {
            if (log_level == LogLevel::None || level < log_level) return;

            std::ostream& out = (stderr_only_ || level >= LogLevel::Warning) ? std::cerr : std::cout;
            out << "[" << Logger::level_to_string(level) << "][" << tag << "] " << message << std::endl;
        }

    private:
        bool stderr_only_;
    };

} // namespace crusher

#endif // CRUSHER_CONSOLE_LOG_SINK_HPP
