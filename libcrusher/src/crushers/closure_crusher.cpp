#include "../../include/closure_crusher.hpp"
#include "../../include/external_process.hpp"
#include "../../include/logger.hpp"

namespace crusher {

    ClosureCrusher::ClosureCrusher(Capabilities caps, CrusherConfig config)
        : caps_(std::move(caps)),
          config_(std::move(config)),
          service_(config_.closure_url, config_.remote_timeout) {}

    std::string ClosureCrusher::run([[maybe_unused]] const ContentType type, const std::string_view content) const {
        if (!caps_.has_java()) {
            Logger::log(LogLevel::Debug, "java not available, using " + service_.url(), "closure");
            return service_.post_form({
                {"output_format", "text"},
                {"output_info", "compiled_code"},
                {"js_code", std::string(content)},
                {"compilation_level", "SIMPLE_OPTIMIZATIONS"},
                {"charset", "ascii"},
                {"language_in", "ECMASCRIPT5"},
                {"warning_level", "QUIET"},
            });
        }

        const ProcessOptions options = {
            {"charset", std::string("ascii")},
            {"compilation_level", std::string("SIMPLE_OPTIMIZATIONS")},
            {"language_in", std::string("ECMASCRIPT5")},
            {"warning_level", std::string("QUIET")},
            {"jscomp_off", std::string("uselessCode")},
            {"summary_detail_level", 0LL},
        };
        return invoke_external(*caps_.java,
                               {"-jar", (config_.vendor_dir / "closure.jar").string()},
                               options,
                               content);
    }

} // namespace crusher
