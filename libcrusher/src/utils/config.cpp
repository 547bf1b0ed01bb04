#include "../../include/config.hpp"
#include <CLI/CLI.hpp>
#include <system_error>
#include <thread>

namespace crusher {

    std::vector<std::string> CrusherConfig::to_arguments() const {
        std::vector<std::string> args;
        if (!java_path.empty()) {
            args.push_back("--java=" + java_path.string());
        }
        if (disable_java) {
            args.emplace_back("--no-java");
        }
        args.push_back("--vendor-dir=" + vendor_dir.string());
        args.push_back("--closure-url=" + closure_url);
        args.push_back("--remote-timeout=" + std::to_string(remote_timeout.count()));
        return args;
    }

    void register_config_options(CLI::App& app, CrusherConfig& config) {
        app.add_option("--java", config.java_path,
                       "Path of the java executable used by the jar-backed engines");
        app.add_flag("--no-java", config.disable_java,
                     "Never run java; yui passes content through and closure uses the remote service");
        app.add_option("--vendor-dir", config.vendor_dir,
                       "Directory containing yui.jar and closure.jar")
           ->capture_default_str();
        app.add_option("--closure-url", config.closure_url,
                       "Endpoint of the closure compiler service")
           ->capture_default_str();
        app.add_option_function<long long>("--remote-timeout",
                                           [&config](const long long ms) {
                                               config.remote_timeout = std::chrono::milliseconds(ms);
                                           },
                                           "Timeout of remote service requests in milliseconds")
           ->check(CLI::PositiveNumber);
    }

    std::filesystem::path default_worker_executable() {
        std::error_code ec;
        const auto self = std::filesystem::read_symlink("/proc/self/exe", ec);
        if (ec) {
            return "crusher_worker";
        }
        return self.parent_path() / "crusher_worker";
    }

    unsigned default_worker_count() noexcept {
        const unsigned n = std::thread::hardware_concurrency();
        return n == 0 ? 1 : n;
    }

} // namespace crusher
