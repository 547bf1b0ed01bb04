#include "../../include/yui_crusher.hpp"
#include "../../include/external_process.hpp"
#include "../../include/logger.hpp"

namespace crusher {

    std::string YuiCrusher::run(const ContentType type, const std::string_view content) const {
        if (!caps_.has_java()) {
            Logger::log(LogLevel::Debug, "java not available, yui leaves content unchanged", "yui");
            return std::string(content);
        }

        // no --charset here: yui would mangle utf-8 characters with it
        const ProcessOptions options = {
            {"type", std::string(content_type_to_string(type))},
            {"line-break", 256LL},
            {"verbose", false},
        };
        return invoke_external(*caps_.java,
                               {"-jar", (config_.vendor_dir / "yui.jar").string()},
                               options,
                               content);
    }

} // namespace crusher
