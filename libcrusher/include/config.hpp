/**
 * @file config.hpp
 * @brief Runtime configuration of crushers and of the worker pool.
 */

#ifndef CRUSHER_CONFIG_HPP
#define CRUSHER_CONFIG_HPP

#include "log_sink.hpp"
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

// forward declaration
namespace CLI { class App; }

namespace crusher {

    /**
     * @brief Settings consumed by the crushers of one process.
     *
     * The control process forwards these to every worker on its command line,
     * so a worker sees exactly the configuration its pool was created with.
     */
    struct CrusherConfig {
        std::filesystem::path java_path;                 ///< Explicit java binary; empty means search PATH
        bool disable_java = false;                       ///< Behave as if java were not installed
        std::filesystem::path vendor_dir = "vendor";     ///< Directory holding yui.jar and closure.jar
        std::string closure_url = "https://closure-compiler.appspot.com/compile";
        std::chrono::milliseconds remote_timeout{30000}; ///< Whole-request timeout of the remote service

        /// @return The flags that reproduce this configuration through register_config_options().
        [[nodiscard]] std::vector<std::string> to_arguments() const;
    };

    /**
     * @brief Settings of a worker pool.
     */
    struct PoolOptions {
        std::filesystem::path worker_executable;       ///< Empty: default_worker_executable()
        unsigned workers = 0;                          ///< 0: default_worker_count()
        LogLevel worker_log_level = LogLevel::Warning; ///< Threshold of the workers' stderr sink
        CrusherConfig crusher;                         ///< Forwarded to every worker
    };

    /**
     * @brief Adds the --java, --no-java, --vendor-dir, --closure-url and
     *        --remote-timeout options bound to config.
     * @param app The CLI::App instance to configure.
     * @param config The configuration the options write to.
     */
    void register_config_options(CLI::App& app, CrusherConfig& config);

    /// @return `crusher_worker` in the directory of the running executable.
    std::filesystem::path default_worker_executable();

    /// @return The logical CPU count, at least 1.
    unsigned default_worker_count() noexcept;

} // namespace crusher

#endif // CRUSHER_CONFIG_HPP
