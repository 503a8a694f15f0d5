#pragma once

#include "worksplit/properties.hpp"

#include <cstddef>
#include <limits>

namespace worksplit {

// One group per reference.
constexpr int kUnboundedWorkers = std::numeric_limits<int>::max();

struct PlannerConfig {
    static constexpr const char *kMaxWorkersKey = "worksplit.max.workers";
    static constexpr const char *kThreadsKey = "worksplit.planner.threads";

    int max_workers{kUnboundedWorkers};
    std::size_t concurrency{1};

    // Missing keys keep their defaults. Throws ConfigError on malformed values.
    static PlannerConfig from_properties(const Properties &properties);
};

} // namespace worksplit
