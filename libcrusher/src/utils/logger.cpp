#include "../../include/logger.hpp"
#include <algorithm>
#include <cctype>
#include <string>

namespace crusher {

    std::vector<std::unique_ptr<ILogSink>> Logger::sinks_;
    std::mutex Logger::mtx_;

    void Logger::add_sink(std::unique_ptr<ILogSink> sink) {
        std::lock_guard lock(mtx_);
        if (sink) {
            sinks_.push_back(std::move(sink));
        }
    }

    void Logger::clear_sinks() {
        std::lock_guard lock(mtx_);
        sinks_.clear();
    }

    void Logger::log(const LogLevel level,
                     const std::string_view msg,
                     const std::string_view tag) {
        std::lock_guard lock(mtx_);
        for (const auto& sink : sinks_) {
            if (sink) {
                sink->log(level, msg, tag);
            }
        }
    }

    LogLevel Logger::string_to_level(const std::string_view level) {
        std::string upper(level);
        std::transform(upper.begin(), upper.end(), upper.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        if (upper == "DEBUG")
            return LogLevel::Debug;
        if (upper == "INFO")
            return LogLevel::Info;
        if (upper == "WARNING" || upper == "WARN")
            return LogLevel::Warning;
        if (upper == "NONE")
            return LogLevel::None;
        return LogLevel::Error;
    }

} // namespace crusher
