#pragma once

#include <string>
#include <vector>
#include "env/environment_store.hpp"

namespace venvbox::env {

enum class ReuseVerdict {
    Reuse,
    Rebuild
};

struct ReuseDecision {
    ReuseVerdict verdict = ReuseVerdict::Rebuild;
    std::string reason;
};

class ReusePolicy {
public:
    explicit ReusePolicy(const EnvironmentStore& store);

    ReuseDecision resolve(const std::string& name,
                          const std::vector<std::string>& requested) const;

private:
    const EnvironmentStore& store_;
};

std::string to_string(ReuseVerdict verdict);

}  // namespace venvbox::env
