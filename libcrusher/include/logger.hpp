/**
 * @file logger.hpp
 * @brief Static, thread-safe logging facade.
 *
 * Every component logs through Logger::log(); the facade fans the message
 * out to the registered ILogSink implementations. With no sinks installed
 * logging is a no-op, which is what the library does unless the embedding
 * program (CLI, worker, tests) installs one.
 */

#ifndef CRUSHER_LOGGER_HPP
#define CRUSHER_LOGGER_HPP

#include "log_sink.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace crusher {

    /**
     * @brief Static logging facade for crusher.
     */
    class Logger {
    public:
        /**
         * @brief Add a new log sink. The Logger takes ownership of the sink.
         * @param sink Unique pointer to a sink implementation.
         */
        static void add_sink(std::unique_ptr<ILogSink> sink);

        /**
         * @brief Remove all configured sinks.
         */
        static void clear_sinks();

        /**
         * @brief Log a message to all registered sinks.
         * @param level Severity level.
         * @param msg Message text.
         * @param tag Optional tag (default: "crusher").
         */
        static void log(LogLevel level,
                        std::string_view msg,
                        std::string_view tag = "crusher");

        /**
         * @brief Converts a LogLevel enum to its string representation.
         */
        static const char* level_to_string(const LogLevel level) {
            switch (level) {
                case LogLevel::Debug:   return "DEBUG";
                case LogLevel::Info:    return "INFO";
                case LogLevel::Warning: return "WARNING";
                case LogLevel::Error:   return "ERROR";
                case LogLevel::None:    return "NONE";
            }
            return "";
        }

        /**
         * @brief Converts a string to its LogLevel enum representation.
         *
         * Case-insensitive. Unknown strings map to LogLevel::Error.
         */
        static LogLevel string_to_level(std::string_view level);

    private:
        ///< List of all registered sink implementations.
        static std::vector<std::unique_ptr<ILogSink>> sinks_;
        ///< Protects access to the sinks_ vector.
        static std::mutex mtx_;
    };

} // namespace crusher

#endif // CRUSHER_LOGGER_HPP
