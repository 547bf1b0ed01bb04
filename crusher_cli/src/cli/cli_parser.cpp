#include "cli_parser.hpp"
#include <CLI/CLI.hpp>

void setup_cli_parser(CLI::App& app, Settings& settings) {
    // setup standard help and version flags
    app.set_help_flag("-h,--help", "Show this help message and exit.");
    app.set_version_flag("--version", "0.1");

    // --- Flags (booleans) ---
    app.add_flag("-r,--recursive", settings.recursive,
                 "Recursively scan input folders.");

    app.add_flag("--dry-run", settings.dry_run,
                 "Crush and report without writing any file.");

    app.add_flag("-q,--quiet", settings.quiet,
                 "Suppress non-error console output (progress bar, results).");

    app.add_flag("--gzip", settings.gzip,
                 "Also report the gzipped size of every result.");

    app.add_flag("--list-engines", settings.list_engines,
                 "Print the engines available for each content type and exit.");

    // --- Pipeline ---
    app.add_option("-e,--engines", settings.engines,
                   "Comma separated engines applied in order, e.g. \"jsmin, yui\".\n"
                   "(Default: jsmin for JavaScript, sqwish for CSS).");

    app.add_option("-t,--type", settings.stdin_type, "Content type of stdin: js or css.")
        ->check(CLI::IsMember({"js", "css"}, CLI::ignore_case));

    // --- Output ---
    app.add_option("-o,--output", settings.output_path,
                   "Write crushed files to directory PATH instead of modifying in-place.");

    app.add_option("--report", settings.report_path,
                   "CSV report export filename.")
                   ->take_last(); // if used multiple times, take the last one

    // --- Workers ---
    settings.num_workers = crusher::default_worker_count();
    app.add_option("-w,--workers", settings.num_workers,
                   "Number of worker processes.")
                   ->default_val(settings.num_workers)
                   ->check(CLI::PositiveNumber);

    app.add_option("--worker", settings.worker_path,
                   "Path of the crusher_worker executable (default: next to crusher).");

    crusher::register_config_options(app, settings.crusher);

    // --- Logging ---
    app.add_option("--log-level", settings.log_level,
                   "Log level: ERROR, WARNING, INFO, DEBUG, NONE.")
                   ->default_val("ERROR")
                   ->check(CLI::IsMember({"ERROR", "WARNING", "INFO", "DEBUG", "NONE"}, CLI::ignore_case));

    app.add_option("--log-file", settings.log_file,
                   "Write logs to a specific file (default: no file logging).");

    app.add_option("--include", settings.include_patterns,
                   "Process only files matching regex PATTERN. (Can be used multiple times).");

    app.add_option("--exclude", settings.exclude_patterns,
                   "Do not process files matching regex PATTERN. (Can be used multiple times).");

    // --- Positional Arguments ---
    app.add_option("inputs", settings.inputs, "One or more files or directories (use '-' for stdin)")
        ->check([](const std::string& str) {
            // allow stdin or an existing path
            if (str == "-") return std::string();
            if (!std::filesystem::exists(str)) return "Input path '" + str + "' not found.";
            return std::string(); // ok
        });

    // --- Cross-validation logic ---
    app.callback([&settings]() {
        if (settings.list_engines) {
            return;
        }
        if (settings.inputs.empty()) {
            throw CLI::ValidationError("At least one input is required.");
        }

        for (const auto& path : settings.inputs) {
            if (path == "-") {
                settings.is_pipe = true;
                break;
            }
        }

        if (settings.is_pipe && settings.inputs.size() > 1) {
             throw CLI::ValidationError("Cannot use stdin ('-') with other input files.");
        }

        if (settings.is_pipe && settings.stdin_type.empty()) {
            throw CLI::ValidationError("Option '-t, --type' is required when using stdin ('-').");
        }

        if (settings.is_pipe && !settings.output_path.empty()) {
            throw CLI::ValidationError("Output is written to stdout when using stdin ('-'); drop '-o'.");
        }

        if (settings.dry_run && !settings.output_path.empty()) {
            throw CLI::ValidationError("--dry-run and -o, --output cannot be used together.");
        }
    });
}
