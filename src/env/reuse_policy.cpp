#include "env/reuse_policy.hpp"

namespace venvbox::env {

ReusePolicy::ReusePolicy(const EnvironmentStore& store) : store_(store) {}

ReuseDecision ReusePolicy::resolve(const std::string& name,
                                   const std::vector<std::string>& requested) const {
    auto metadata = store_.read_metadata(name);
    if (core::errors::is_error(metadata)) {
        return {ReuseVerdict::Rebuild, core::errors::get_error(metadata).message};
    }
    if (!store_.environment_exists(name)) {
        return {ReuseVerdict::Rebuild, "Environment directory is missing: " + name};
    }

    const auto& recorded = core::errors::get_value(metadata).dependencies;
    if (recorded != to_dependency_set(requested)) {
        return {ReuseVerdict::Rebuild, "Dependency set changed for environment: " + name};
    }
    return {ReuseVerdict::Reuse, "Dependency set matches recorded environment: " + name};
}

std::string to_string(const ReuseVerdict verdict) {
    switch (verdict) {
        case ReuseVerdict::Reuse:
            return "reuse";
        case ReuseVerdict::Rebuild:
            return "rebuild";
        default:
            return "unknown";
    }
}

}  // namespace venvbox::env
