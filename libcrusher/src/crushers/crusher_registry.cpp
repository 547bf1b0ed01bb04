#include "../../include/crusher_registry.hpp"
#include "../../include/closure_crusher.hpp"
#include "../../include/errors.hpp"
#include "../../include/jscrush_crusher.hpp"
#include "../../include/jsmin_crusher.hpp"
#include "../../include/sqwish_crusher.hpp"
#include "../../include/yui_crusher.hpp"
#include <algorithm>

namespace crusher {

    CrusherRegistry::CrusherRegistry(const Capabilities& caps, const CrusherConfig& config) {
        crushers_.push_back(std::make_unique<JsminCrusher>());
        crushers_.push_back(std::make_unique<JscrushCrusher>());
        crushers_.push_back(std::make_unique<SqwishCrusher>());
        crushers_.push_back(std::make_unique<YuiCrusher>(caps, config));
        crushers_.push_back(std::make_unique<ClosureCrusher>(caps, config));
    }

    const ICrusher& CrusherRegistry::resolve(const std::string_view name, const std::string_view extension) const {
        const auto type = parse_content_type(extension);
        const auto id = crusher_id_from_name(name);
        const ICrusher* crusher = (type && id) ? find(*id) : nullptr;
        if (!crusher) {
            throw CrushError(ErrorKind::UnknownTransform,
                             "The engine " + std::string(name) + " does not exist");
        }
        return *crusher;
    }

    const ICrusher* CrusherRegistry::find(const CrusherId id) const noexcept {
        const auto it = std::find_if(crushers_.begin(), crushers_.end(),
                                     [id](const auto& c) { return c->get_id() == id; });
        return it == crushers_.end() ? nullptr : it->get();
    }

    std::vector<std::string> CrusherRegistry::available(const ContentType type) const {
        std::vector<std::string> names;
        for (const auto& crusher : crushers_) {
            if (crusher->accepts(type)) {
                names.emplace_back(crusher->get_name());
            }
        }
        return names;
    }

    bool CrusherRegistry::supports(const std::vector<std::string>& names, const ContentType type) const {
        const auto avail = available(type);
        return std::all_of(names.begin(), names.end(), [&avail](const std::string& n) {
            return std::find(avail.begin(), avail.end(), n) != avail.end();
        });
    }

} // namespace crusher
