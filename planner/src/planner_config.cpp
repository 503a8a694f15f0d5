#include "worksplit/planner_config.hpp"

#include "worksplit/errors.hpp"

namespace worksplit {

PlannerConfig PlannerConfig::from_properties(const Properties &properties) {
    PlannerConfig config;
    auto it = properties.find(kMaxWorkersKey);
    if (it != properties.end()) {
        auto value = parse_int(it->first, it->second);
        if (value > std::numeric_limits<int>::max() || value < std::numeric_limits<int>::min()) {
            throw ConfigError(std::string(kMaxWorkersKey) + " out of range: " + it->second);
        }
        config.max_workers = static_cast<int>(value);
    }
    it = properties.find(kThreadsKey);
    if (it != properties.end()) {
        auto value = parse_uint(it->first, it->second);
        if (value == 0) {
            throw ConfigError(std::string(kThreadsKey) + " must be > 0");
        }
        config.concurrency = static_cast<std::size_t>(value);
    }
    return config;
}

} // namespace worksplit
