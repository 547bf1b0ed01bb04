#ifndef CRUSHER_CLI_PARSER_HPP
#define CRUSHER_CLI_PARSER_HPP

#include <string>
#include <vector>
#include <filesystem>
#include "../../../libcrusher/include/config.hpp"
#include "../../../libcrusher/include/content_type.hpp"

// forward declaration
namespace CLI { class App; }

struct Settings {
    bool recursive = false;
    bool dry_run = false;
    bool quiet = false;
    bool gzip = false;
    bool list_engines = false;

    unsigned num_workers = 0;
    std::string engines;
    std::string stdin_type;
    std::string log_level = "ERROR";
    std::filesystem::path log_file;
    std::filesystem::path output_path;
    std::filesystem::path report_path;
    std::filesystem::path worker_path;
    std::vector<std::string> include_patterns;
    std::vector<std::string> exclude_patterns;
    crusher::CrusherConfig crusher;

    std::vector<std::filesystem::path> inputs;

    bool is_pipe = false;
};

/**
 * @brief Configures the CLI11 parser with all options, flags, and arguments.
 * @param app The CLI::App instance to configure.
 * @param settings The Settings struct to map the options to.
 */
void setup_cli_parser(CLI::App& app, Settings& settings);

#endif //CRUSHER_CLI_PARSER_HPP
