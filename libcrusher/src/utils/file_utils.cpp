#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include "../../include/random_utils.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace crusher {

    std::string read_file(const std::filesystem::path& path) {
        std::ifstream in(path, std::ios::binary);
        if (!in) {
            throw std::runtime_error("Cannot open " + path.string());
        }
        std::string content = read_stream(in);
        if (in.bad()) {
            throw std::runtime_error("Failed to read " + path.string());
        }
        return content;
    }

    std::string read_stream(std::istream& in) {
        std::ostringstream buffer;
        buffer << in.rdbuf();
        return buffer.str();
    }

    void write_file_atomic(const std::filesystem::path& path, const std::string_view content) {
        std::error_code ec;
        const auto parent = path.has_parent_path() ? path.parent_path() : std::filesystem::path(".");
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            throw std::runtime_error("Failed to create directory " + parent.string() + " (" + ec.message() + ")");
        }

        const auto tmp = parent / ("." + path.filename().string() + "." + RandomUtils::random_suffix() + ".tmp");
        {
            std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
            if (!out) {
                throw std::runtime_error("Cannot create " + tmp.string());
            }
            out.write(content.data(), static_cast<std::streamsize>(content.size()));
            out.close();
            if (!out) {
                std::filesystem::remove(tmp, ec);
                throw std::runtime_error("Failed to write " + tmp.string());
            }
        }

        std::filesystem::rename(tmp, path, ec);
        if (ec) {
            const std::string reason = ec.message();
            std::filesystem::remove(tmp, ec);
            throw std::runtime_error("Rename failed: " + path.string() + " (" + reason + ")");
        }
        Logger::log(LogLevel::Debug, "Wrote " + path.string(), "file_utils");
    }

} // namespace crusher
