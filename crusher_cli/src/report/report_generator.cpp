#include "report_generator.hpp"
#include <iostream>
#include <algorithm>
#include <fstream>
#include <sstream>
#include <iomanip>
#include <regex>
#include <sys/ioctl.h>
#include <unistd.h>

static bool is_stderr_a_tty() {
    return isatty(fileno(stderr)) != 0;
}

unsigned get_terminal_width() {
    winsize w{};
    if (ioctl(STDERR_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_col > 0)
        return w.ws_col;
    return 80;
}

static std::string strip_ansi(const std::string& s) {
    static const std::regex ansi_pattern("\033\\[[0-9;]*m");
    return std::regex_replace(s, ansi_pattern, "");
}

static std::string csv_escape(const std::string& data) {
    if (data.find_first_of(",\"\n\r") == std::string::npos) {
        return data;
    }
    std::string result;
    result.reserve(data.size() + 4);
    result.push_back('"');
    for (char c : data) {
        if (c == '"') {
            result.push_back('"'); // escape quote with another quote
        }
        result.push_back(c);
    }
    result.push_back('"');
    return result;
}

static std::string fixed2(const double v) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << v;
    return oss.str();
}

static double delta_pct(const Result& r) {
    return r.success && r.size_before
               ? 100.0 * (1.0 - static_cast<double>(r.size_after) / static_cast<double>(r.size_before))
               : 0.0;
}

static std::string outcome_of(const Result& r, const bool colors) {
    if (!r.success) return colors ? "\033[1;31mFAIL\033[0m" : "FAIL";
    if (r.written) return colors ? "\033[1;32mOK (written)\033[0m" : "OK (written)";
    return colors ? "\033[1;33mOK (kept)\033[0m" : "OK (kept)";
}

static std::string engine_times_str(const Result& r, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < r.engine_times.size(); ++i) {
        out += r.engine_times[i].first + ":" + std::to_string(r.engine_times[i].second.count()) + "ms";
        if (i + 1 < r.engine_times.size()) out += sep;
    }
    return out;
}

void print_console_report(const std::vector<Result>& results,
                          const unsigned num_workers,
                          const double total_seconds) {
    const unsigned term_width = get_terminal_width();
    const bool use_colors = is_stderr_a_tty();

    size_t max_type = 6;
    size_t max_before = 12;
    size_t max_after = 12;
    size_t max_gzip = 10;
    size_t max_delta = 10;
    size_t max_time = 10;
    size_t max_result = 14;
    size_t max_error = 5;
    for (const auto& r : results) {
        max_before = std::max(max_before, std::to_string(r.size_before).size() + 1);
        max_after  = std::max(max_after,  std::to_string(r.size_after).size() + 1);
        max_delta  = std::max(max_delta,  fixed2(delta_pct(r)).size() + 2);
        max_time   = std::max(max_time,   fixed2(r.seconds).size() + 1);
        max_error  = std::max(max_error,  strip_ansi(r.error_msg).size());
    }

    const unsigned fixed_cols_width = static_cast<unsigned>(
        max_type + max_before + max_after + max_gzip + max_delta + max_time + max_result + max_error) + 8;

    const unsigned file_col_width = term_width > fixed_cols_width + 5
                                ? term_width - fixed_cols_width
                                : 10;

    auto truncate = [](const std::string& s, const size_t max_len) {
        return s.size() <= max_len ? s : s.substr(0, max_len - 3) + "...";
    };

    std::cerr << "\n"
              << std::left << std::setw(file_col_width) << "File"
              << std::setw(max_type)   << "Type"
              << std::setw(max_before) << "Before(B)"
              << std::setw(max_after)  << "After(B)"
              << std::setw(max_gzip)   << "Gzip(B)"
              << std::setw(max_delta)  << "Delta(%)"
              << std::setw(max_time)   << "Time(s)"
              << std::setw(max_result) << "Result"
              << std::setw(max_error)  << "Error"
              << "\n";

    std::uintmax_t total_original = 0;
    std::uintmax_t total_saved = 0;
    auto sorted = results;
    std::ranges::sort(sorted, [](const auto& a, const auto& b) {
        return a.path < b.path;
    });

    for (const auto& r : sorted) {
        const std::string delta = r.success ? fixed2(delta_pct(r)) + "%" : "-";
        const std::string outcome = outcome_of(r, use_colors);
        total_original += r.size_before;
        if (r.written && r.size_before > r.size_after)
            total_saved += r.size_before - r.size_after;

        const std::string padded_outcome = outcome +
            std::string(max_result > strip_ansi(outcome).size() ? max_result - strip_ansi(outcome).size() : 1, ' ');

        std::cerr << std::left << std::setw(file_col_width) << truncate(r.path.filename().string(), file_col_width - 1)
                  << std::setw(max_type)   << r.type
                  << std::setw(max_before) << r.size_before
                  << std::setw(max_after)  << (r.success ? std::to_string(r.size_after) : "-")
                  << std::setw(max_gzip)   << (r.gzip_size ? std::to_string(*r.gzip_size) : "-")
                  << std::setw(max_delta)  << delta
                  << std::setw(max_time)   << fixed2(r.seconds)
                  << padded_outcome
                  << r.error_msg
                  << "\n";

        if (!r.engine_times.empty()) {
            std::cerr << "    Pipeline: " << engine_times_str(r, " -> ") << "\n";
        }
    }

    std::cerr << "\nTotal saved space: " << (total_saved / 1024) << " KB\n";
    if (total_original > 0) {
        const double total_pct = 100.0 * (static_cast<double>(total_saved) / static_cast<double>(total_original));
        std::cerr << "Total reduction: " << fixed2(total_pct) << "%\n";
    }
    std::cerr << "Total time: " << fixed2(total_seconds) << " s (" << num_workers << " worker"
              << (num_workers > 1U ? "s" : "") << ")\n";
}

bool export_csv_report(const std::vector<Result>& results,
                       const std::filesystem::path& output_path,
                       const double total_seconds) {
    std::ofstream out(output_path);
    if (!out) return false;

    out << "File,Type,Engines,Before(B),After(B),Gzip(B),Delta(%),Time(s),Result,Timings,Error\n";

    for (const auto& r : results) {
        out << csv_escape(r.path.string()) << ","
            << csv_escape(r.type) << ","
            << csv_escape(r.engines) << ","
            << r.size_before << ","
            << (r.success ? std::to_string(r.size_after) : "") << ","
            << (r.gzip_size ? std::to_string(*r.gzip_size) : "") << ","
            << fixed2(delta_pct(r)) << ","
            << fixed2(r.seconds) << ","
            << csv_escape(outcome_of(r, false)) << ","
            << csv_escape(engine_times_str(r, " -> ")) << ","
            << csv_escape(r.error_msg) << "\n";
    }

    out << "\n\nTotal amount of time\n";
    out << fixed2(total_seconds) << " seconds\n";
    return static_cast<bool>(out);
}
