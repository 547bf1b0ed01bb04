/**
 * @file main.cpp
 * @brief Entry point of the worker process started by WorkerPool.
 *
 * The pool connects a socket to fd --channel-fd and forwards its log level
 * and crusher configuration as flags. The worker serves tasks until the
 * pool hangs up.
 */

#include <CLI/CLI.hpp>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include "../../libcrusher/include/capabilities.hpp"
#include "../../libcrusher/include/config.hpp"
#include "../../libcrusher/include/console_log_sink.hpp"
#include "../../libcrusher/include/crusher_registry.hpp"
#include "../../libcrusher/include/logger.hpp"
#include "../../libcrusher/include/pipeline_executor.hpp"
#include "../../libcrusher/include/worker_service.hpp"

using namespace crusher;

int main(int argc, char* argv[]) {
    CLI::App app{"crusher_worker: task executor spawned by the crusher worker pool."};

    int channel_fd = 3;
    int index = 0;
    std::string log_level = "WARNING";
    CrusherConfig config;

    app.add_option("--channel-fd", channel_fd, "Socket connected to the pool.")
       ->check(CLI::NonNegativeNumber);
    app.add_option("--index", index, "Worker number, used to tag log lines.");
    app.add_option("--log-level", log_level, "Log level: ERROR, WARNING, INFO, DEBUG, NONE.")
       ->check(CLI::IsMember({"ERROR", "WARNING", "INFO", "DEBUG", "NONE"}, CLI::ignore_case));
    register_config_options(app, config);

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    }

    // a vanished pool must surface as a write error, not kill the worker
    std::signal(SIGPIPE, SIG_IGN);

    // stdout is not ours to write to; the pool leaves stderr attached to its own
    Logger::clear_sinks();
    Logger::add_sink(std::make_unique<ConsoleLogSink>(Logger::string_to_level(log_level), true));

    const Capabilities caps = Capabilities::probe(config);
    const CrusherRegistry registry(caps, config);
    const PipelineExecutor executor(registry);

    WorkerService service(channel_fd, executor, index);
    return service.serve();
}
