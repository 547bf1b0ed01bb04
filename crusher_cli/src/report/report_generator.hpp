#ifndef CRUSHER_REPORT_GENERATOR_HPP
#define CRUSHER_REPORT_GENERATOR_HPP

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

/**
 * @brief Outcome of one input, as shown in the console table and the CSV.
 */
struct Result {
    std::filesystem::path path;
    std::string type;                ///< "js" or "css"
    std::string engines;             ///< Pipeline as requested
    std::uintmax_t size_before = 0;
    std::uintmax_t size_after = 0;
    std::optional<std::uint64_t> gzip_size;
    double seconds = 0.0;            ///< Pipeline duration reported by the worker
    std::vector<std::pair<std::string, std::chrono::milliseconds>> engine_times;
    bool success = false;
    bool written = false;            ///< The result replaced the input or landed in the output directory
    std::string error_msg;
};

/// @return Width of the attached terminal, 80 if unknown.
unsigned get_terminal_width();

void print_console_report(const std::vector<Result>& results,
                          unsigned num_workers,
                          double total_seconds);

/**
 * @brief Write the results as CSV.
 * @return False if the file could not be written.
 */
bool export_csv_report(const std::vector<Result>& results,
                       const std::filesystem::path& output_path,
                       double total_seconds);

#endif //CRUSHER_REPORT_GENERATOR_HPP
