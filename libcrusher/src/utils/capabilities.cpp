#include "../../include/capabilities.hpp"
#include "../../include/logger.hpp"
#include <cstdlib>
#include <string>
#include <unistd.h>

namespace crusher {

    namespace {

    bool is_executable(const std::filesystem::path& path) {
        std::error_code ec;
        return std::filesystem::is_regular_file(path, ec) && ::access(path.c_str(), X_OK) == 0;
    }

    } // namespace

    std::optional<std::filesystem::path> find_executable(const std::string_view name) {
        if (name.find('/') != std::string_view::npos) {
            std::filesystem::path direct{std::string(name)};
            return is_executable(direct) ? std::optional(direct) : std::nullopt;
        }

        const char* env = std::getenv("PATH");
        const std::string_view path = env ? env : "/usr/local/bin:/usr/bin:/bin";

        std::size_t start = 0;
        while (start <= path.size()) {
            std::size_t colon = path.find(':', start);
            if (colon == std::string_view::npos) colon = path.size();

            const std::string_view dir = path.substr(start, colon - start);
            const std::filesystem::path candidate =
                std::filesystem::path(dir.empty() ? "." : std::string(dir)) / std::string(name);
            if (is_executable(candidate)) {
                return candidate;
            }
            start = colon + 1;
        }
        return std::nullopt;
    }

    Capabilities Capabilities::probe(const CrusherConfig& config) {
        Capabilities caps;
        if (config.disable_java) {
            Logger::log(LogLevel::Debug, "java disabled by configuration", "capabilities");
            return caps;
        }

        if (!config.java_path.empty()) {
            if (is_executable(config.java_path)) {
                caps.java = config.java_path;
            } else {
                Logger::log(LogLevel::Warning,
                            "Configured java is not executable: " + config.java_path.string(),
                            "capabilities");
            }
        } else {
            caps.java = find_executable("java");
        }

        Logger::log(LogLevel::Debug,
                    caps.java ? "java found at " + caps.java->string() : std::string("java not found"),
                    "capabilities");
        return caps;
    }

} // namespace crusher
