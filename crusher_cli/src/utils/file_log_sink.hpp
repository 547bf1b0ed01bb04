#ifndef CRUSHER_FILE_LOG_SINK_HPP
#define CRUSHER_FILE_LOG_SINK_HPP

#include "../../../libcrusher/include/log_sink.hpp"
#include "../../../libcrusher/include/logger.hpp"
#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>

class FileLogSink final : public crusher::ILogSink {
public:
    explicit FileLogSink(const std::filesystem::path& filename,
                         const crusher::LogLevel threshold = crusher::LogLevel::Debug,
                         const bool append = true)
        : out_(filename, append ? std::ios::app : std::ios::trunc), threshold_(threshold) {}

    [[nodiscard]] bool is_open() const { return out_.is_open(); }

    void log(const crusher::LogLevel level,
             const std::string_view message,
             const std::string_view tag) override {
        if (!out_.is_open() || level < threshold_ || threshold_ == crusher::LogLevel::None) return;

        std::lock_guard lock(mtx_);
        out_ << "[" << crusher::Logger::level_to_string(level) << "]";
        if (!tag.empty()) out_ << "[" << tag << "]";
        out_ << " " << message << "\n";
        out_.flush();
    }

private:
    std::ofstream out_;
    crusher::LogLevel threshold_;
    std::mutex mtx_;
};

#endif // CRUSHER_FILE_LOG_SINK_HPP
