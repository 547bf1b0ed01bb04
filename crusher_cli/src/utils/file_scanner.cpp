#include "file_scanner.hpp"
#include "../cli/cli_parser.hpp"
#include "../../../libcrusher/include/logger.hpp"
#include <algorithm>
#include <regex>

namespace fs = std::filesystem;
using crusher::Logger;
using crusher::LogLevel;

static bool is_junk(const fs::path& p) {
    auto name = p.filename().string();
    if (name.starts_with("._")) {
        return true;
    }
    std::transform(name.begin(), name.end(), name.begin(), ::tolower);
    if (name == ".ds_store" || name == "desktop.ini") {
        return true;
    }
    // already minified bundles are left alone
    return name.ends_with(".min.js") || name.ends_with(".min.css");
}

namespace {
bool is_filtered(const fs::path& path, const Settings& settings) {
    const std::string path_str = path.string();

    if (!settings.exclude_patterns.empty()) {
        for (const auto& pattern : settings.exclude_patterns) {
            try {
                if (std::regex_search(path_str, std::regex(pattern))) {
                    return true;
                }
            } catch (const std::regex_error& e) {
                Logger::log(LogLevel::Warning, "Invalid exclude regex: " + pattern + " (" + e.what() + ")", "scanner");
            }
        }
    }

    if (!settings.include_patterns.empty()) {
        for (const auto& pattern : settings.include_patterns) {
            try {
                if (std::regex_search(path_str, std::regex(pattern))) {
                    return false;
                }
            } catch (const std::regex_error& e) {
                Logger::log(LogLevel::Warning, "Invalid include regex: " + pattern + " (" + e.what() + ")", "scanner");
            }
        }
        return true;
    }

    return false;
}

bool accept(const fs::path& p, const Settings& settings) {
    std::error_code ec;
    return fs::is_regular_file(p, ec) && !is_junk(p) && !is_filtered(p, settings);
}
} // namespace


std::vector<fs::path>
collect_input_files(const std::vector<fs::path>& inputs,
                    const Settings& settings) {
    std::vector<fs::path> result;

    for (const auto& in : inputs) {
        if (in == "-") {
            continue;
        }
        std::error_code ec;
        if (!fs::exists(in, ec)) {
            Logger::log(LogLevel::Error, "Input not found: " + in.string(), "scanner");
            continue;
        }
        if (fs::is_directory(in, ec)) {
            if (settings.recursive) {
                for (auto& e : fs::recursive_directory_iterator(in, fs::directory_options::skip_permission_denied)) {
                    if (accept(e.path(), settings)) result.push_back(e.path());
                }
            } else {
                for (auto& e : fs::directory_iterator(in)) {
                    if (accept(e.path(), settings)) result.push_back(e.path());
                }
            }
        } else if (accept(in, settings)) {
            result.push_back(in);
        }
    }

    std::sort(result.begin(), result.end());
    result.erase(std::unique(result.begin(), result.end()), result.end());

    Logger::log(LogLevel::Info,
                "Scanner collected " + std::to_string(result.size()) + " files",
                "scanner");
    return result;
}
