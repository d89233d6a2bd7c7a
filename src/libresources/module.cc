#include "nixops/resources/module.hh"
#include "nixops/util/logging.hh"

namespace nixops {

ResolvedConfig evalResource(const ResourceModule & module, std::vector<Override> userOverrides)
{
    auto overrides = module.config;
    for (auto & override : userOverrides) {
        if (override.source.empty())
            override.source = "user";
        overrides.push_back(std::move(override));
    }

    debug("evaluating a resource of type '%s' with %d definitions", module.kind, overrides.size());

    return resolve(*module.options, overrides, module.kind);
}

} // namespace nixops
