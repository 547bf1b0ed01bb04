#include <iostream>
#include <algorithm>
#include <filesystem>
#include <csignal>
#include <atomic>
#include <chrono>
#include <iomanip>
#include <latch>
#include <mutex>
#include <thread>
#include <CLI/CLI.hpp>
#include "utils/color.hpp"
#include "cli/cli_parser.hpp"
#include "report/report_generator.hpp"
#include "utils/file_scanner.hpp"
#include "utils/file_log_sink.hpp"
#include "../../libcrusher/include/capabilities.hpp"
#include "../../libcrusher/include/console_log_sink.hpp"
#include "../../libcrusher/include/content_type.hpp"
#include "../../libcrusher/include/crusher_registry.hpp"
#include "../../libcrusher/include/file_utils.hpp"
#include "../../libcrusher/include/logger.hpp"
#include "../../libcrusher/include/mime_detector.hpp"
#include "../../libcrusher/include/worker_pool.hpp"

// simple progress bar printer
inline void print_progress_bar(const size_t done, const size_t total, const double elapsed_seconds) {
    const unsigned term_width = get_terminal_width();
    const unsigned int bar_width = std::max(10u, term_width > 40u ? term_width - 40u : 20u);

    const double progress = total ? static_cast<double>(done) / static_cast<double>(total) : (done > 0 ? 1.0 : 0.0);
    const unsigned pos = static_cast<unsigned>(bar_width * progress);

    double percent = progress * 100.0;
    if (done < total && percent >= 99.95) {
        percent = 99.9;
    }
    if (done == total) {
        percent = 100.0;
    }

    std::cerr << "\r[";
    for (unsigned i = 0; i < bar_width; ++i) {
        if (i < pos) std::cerr << "=";
        else if (i == pos && done < total) std::cerr << ">";
        else if (i == pos && done == total) std::cerr << "=";
        else std::cerr << " ";
    }
    std::cerr << "] "
              << std::setw(5) << std::fixed << std::setprecision(1) << percent << "%"
              << " (" << done << "/" << total << ")"
              << " elapsed: " << std::fixed << std::setprecision(1) << elapsed_seconds << "s"
              << std::flush;
}

using namespace crusher;
namespace fs = std::filesystem;

static std::atomic<bool> interrupted{false};

// handle ctrl+c or termination signals
void signal_handler(int sig) {
    if (sig == SIGINT || sig == SIGTERM) {
        interrupted.store(true);
    }
}

namespace {

// one input, read and typed, ready to be dispatched
struct Job {
    fs::path path;
    ContentType type = ContentType::Js;
    std::string content;
    bool from_stdin = false;
};

std::vector<std::string> engines_for(const Settings& settings, const ContentType type) {
    if (!settings.engines.empty()) {
        return parse_engines(settings.engines);
    }
    return {type == ContentType::Css ? "sqwish" : "jsmin"};
}

// where a crushed file goes; empty for stdin and dry runs
fs::path destination_of(const Settings& settings, const Job& job) {
    if (job.from_stdin || settings.dry_run) return {};
    if (settings.output_path.empty()) return job.path;

    fs::path rel = job.path.is_relative()
                       ? job.path.lexically_normal()
                       : job.path.lexically_relative(fs::current_path());
    if (rel.empty() || rel.is_absolute() || *rel.begin() == "..") {
        rel = job.path.filename();
    }
    return settings.output_path / rel;
}

void list_engines(const CrusherRegistry& registry, const Capabilities& caps) {
    for (const auto type : {ContentType::Js, ContentType::Css}) {
        std::cout << content_type_to_string(type) << ":";
        for (const auto& name : registry.available(type)) {
            std::cout << " " << name;
        }
        std::cout << "\n";
    }
    std::cout << "java: " << (caps.has_java() ? caps.java->string() : std::string("not found")) << "\n";
}

} // namespace

int main(int argc, char* argv[]) {

    CLI::App app{"crusher: JavaScript and CSS minification on a pool of worker processes."};
    Settings settings;
    setup_cli_parser(app, settings);

    try {
        app.parse(argc, argv);
    }
    catch (const CLI::CallForHelp &e) {
        return app.exit(e);
    }
    catch (const CLI::CallForVersion &e) {
        return app.exit(e);
    }
    catch (const CLI::ParseError &e) {
        std::cerr << RED << "Parse error: " << e.what() << RESET << std::endl;
        return app.exit(e);
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    // a dead worker must surface as a closed channel, not kill the front-end
    std::signal(SIGPIPE, SIG_IGN);

    const LogLevel level = Logger::string_to_level(settings.log_level);
    Logger::clear_sinks();
    if (!settings.log_file.empty()) {
        auto file_sink = std::make_unique<FileLogSink>(settings.log_file, LogLevel::Debug, false);
        if (!file_sink->is_open()) {
            std::cerr << RED << "Error: cannot open log file " << settings.log_file.string() << RESET << std::endl;
            return 1;
        }
        Logger::add_sink(std::move(file_sink));
    }
    if (!settings.quiet) {
        // stdout carries the crushed content in pipe mode
        Logger::add_sink(std::make_unique<ConsoleLogSink>(level, true));
    }

    const Capabilities caps = Capabilities::probe(settings.crusher);
    const CrusherRegistry registry(caps, settings.crusher);

    if (settings.list_engines) {
        list_engines(registry, caps);
        return 0;
    }

    // --- gather inputs ---
    std::vector<Job> jobs;
    std::vector<Result> results;

    if (settings.is_pipe) {
        Job job;
        job.path = "<stdin>";
        job.type = parse_content_type(settings.stdin_type).value_or(ContentType::Js);
        job.content = read_stream(std::cin);
        job.from_stdin = true;
        jobs.push_back(std::move(job));
    } else {
        for (const auto& path : collect_input_files(settings.inputs, settings)) {
            const auto type = MimeDetector::content_type_of(path);
            if (!type) {
                Logger::log(LogLevel::Warning, "Skipping " + path.string() + ": not JavaScript or CSS", "main");
                continue;
            }
            Job job;
            job.path = path;
            job.type = *type;
            try {
                job.content = read_file(path);
            } catch (const std::exception& e) {
                Logger::log(LogLevel::Error, e.what(), "main");
                Result r;
                r.path = path;
                r.type = std::string(content_type_to_string(*type));
                r.error_msg = e.what();
                results.push_back(std::move(r));
                continue;
            }
            jobs.push_back(std::move(job));
        }
    }

    if (jobs.empty()) {
        Logger::log(LogLevel::Error, "No valid input files.", "main");
        return 1;
    }

    // --- validate pipelines before dispatching anything ---
    for (const auto type : {ContentType::Js, ContentType::Css}) {
        const bool used = std::ranges::any_of(jobs, [type](const Job& j) { return j.type == type; });
        if (!used) continue;
        const auto names = engines_for(settings, type);
        if (names.empty() || !registry.supports(names, type)) {
            std::cerr << RED << "Error: engines \"" << join_engines(names) << "\" cannot crush "
                      << content_type_to_string(type) << " content. Available:";
            for (const auto& name : registry.available(type)) std::cerr << " " << name;
            std::cerr << RESET << std::endl;
            return 2;
        }
    }

    // --- dispatch ---
    PoolOptions options;
    options.worker_executable = settings.worker_path;
    options.workers = settings.num_workers;
    options.worker_log_level = level;
    options.crusher = settings.crusher;

    const auto worker_count = static_cast<unsigned>(
        std::min<std::size_t>(settings.num_workers, jobs.size()));

    std::mutex results_mtx;
    std::string stdin_output;
    const size_t total = jobs.size();
    size_t done = 0;
    std::latch all_done(static_cast<std::ptrdiff_t>(total));
    const auto start_total = std::chrono::steady_clock::now();

    // declared last: its destructor stops the threads that run the callbacks
    WorkerPool pool(options);

    pool.events().subscribe<WorkerExitedEvent>([&settings](const WorkerExitedEvent& e) {
        if (!e.expected && !settings.quiet) {
            std::cerr << YELLOW << "\n[WORKER] worker " << e.worker << " (pid " << e.pid
                      << ") exited unexpectedly" << RESET << std::endl;
        }
    });
    pool.events().subscribe<WorkerFaultEvent>([](const WorkerFaultEvent& e) {
        Logger::log(LogLevel::Error, "worker " + std::to_string(e.worker) + " torn down: " + e.reason, "main");
    });
    pool.events().subscribe<TaskDispatchedEvent>([](const TaskDispatchedEvent& e) {
        Logger::log(LogLevel::Debug, "task " + e.task_id + " -> worker " + std::to_string(e.worker), "main");
    });

    try {
        pool.initialize(std::max(1u, worker_count));

        for (auto& job : jobs) {
            if (interrupted.load()) break;

            const auto names = engines_for(settings, job.type);
            const std::uintmax_t size_before = job.content.size();
            const fs::path path = job.path;
            const fs::path destination = destination_of(settings, job);
            const bool from_stdin = job.from_stdin;

            Task task;
            task.engines = names;
            task.extension = std::string(content_type_to_string(job.type));
            task.content = std::move(job.content);
            task.gzip = settings.gzip;

            // runs on the reader thread of the answering worker
            auto on_reply = [&, names, size_before, path, destination, from_stdin]
                    (const std::optional<TaskError>& error, Task reply) {
                Result r;
                r.path = path;
                r.type = reply.extension;
                r.engines = join_engines(names);
                r.size_before = size_before;
                r.size_after = reply.content.size();
                r.gzip_size = reply.gzip_size;
                r.seconds = static_cast<double>(reply.duration.count()) / 1000.0;
                for (const auto& name : names) {
                    const auto it = reply.individual.find(name);
                    const bool seen = std::ranges::any_of(r.engine_times,
                        [&name](const auto& p) { return p.first == name; });
                    if (it != reply.individual.end() && !seen) {
                        r.engine_times.emplace_back(name, it->second);
                    }
                }

                if (error) {
                    r.error_msg = std::string(error_kind_name(error->kind)) + ": " + error->message;
                    Logger::log(LogLevel::Error, path.string() + " " + r.error_msg, "main");
                } else {
                    r.success = true;
                    const bool in_place = settings.output_path.empty();
                    if (!destination.empty() && (!in_place || r.size_after < size_before)) {
                        try {
                            write_file_atomic(destination, reply.content);
                            r.written = true;
                        } catch (const std::exception& e) {
                            r.success = false;
                            r.error_msg = e.what();
                            Logger::log(LogLevel::Error, e.what(), "main");
                        }
                    }
                }

                std::lock_guard lock(results_mtx);
                if (from_stdin && r.success) {
                    stdin_output = std::move(reply.content);
                }
                results.push_back(std::move(r));
                ++done;
                if (!settings.quiet) {
                    const double elapsed = std::chrono::duration<double>(
                        std::chrono::steady_clock::now() - start_total).count();
                    print_progress_bar(done, total, elapsed);
                }
                all_done.count_down();
            };

            pool.send(std::move(task), std::move(on_reply));
        }
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Error, std::string("Cannot dispatch: ") + e.what(), "main");
        std::cerr << RED << "Error: " << e.what() << RESET << std::endl;
        pool.kill();
        return 1;
    }

    // wait for every reply or for an interrupt
    while (!all_done.try_wait()) {
        if (interrupted.load()) {
            std::cerr << CYAN
                      << "\n[INTERRUPT] Stop detected. Killing workers..."
                      << RESET << std::endl;
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    pool.kill();

    const double total_seconds = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - start_total).count();

    std::lock_guard lock(results_mtx);
    if (!settings.quiet) {
        std::cerr << std::endl;
    }

    if (settings.is_pipe && !settings.dry_run && !stdin_output.empty()) {
        std::cout << stdin_output << std::flush;
    }

    if (!settings.quiet) {
        print_console_report(results, std::max(1u, worker_count), total_seconds);
    }

    // export CSV if requested
    if (!settings.report_path.empty()) {
        if (!export_csv_report(results, settings.report_path, total_seconds)) {
            Logger::log(LogLevel::Error, "Cannot write report " + settings.report_path.string(), "main");
        }
    }

    if (interrupted.load()) {
        return 130; // standard exit code for SIGINT
    }
    const bool any_failed =
        std::ranges::any_of(results, [](const Result& r) { return !r.success; });
    return any_failed ? 1 : 0;
}
