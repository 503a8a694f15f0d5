#pragma once

#include "worksplit/host_weight_estimator.hpp"
#include "worksplit/planner_config.hpp"
#include "worksplit/split_record.hpp"
#include "worksplit/storage.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace worksplit {

class SplitPlanner {
  public:
    SplitPlanner(DescriptorResolver &resolver, BlockLocator &locator, std::size_t concurrency = 1);

    // Throws NoInputError on an empty list; any collaborator error aborts the whole call.
    std::vector<SplitRecord> plan(const std::vector<std::string> &references,
                                  int max_workers = kUnboundedWorkers) const;

    // Lists every root through the resolver, then plans the concatenated listing.
    std::vector<SplitRecord> plan_inputs(const std::vector<std::string> &roots,
                                         int max_workers = kUnboundedWorkers) const;

    // References per split; a max_workers of zero or less counts as one.
    static std::size_t group_size(std::size_t reference_count, int max_workers);

    std::vector<std::string> hosts_for(const std::string &reference) const;

    std::size_t concurrency() const noexcept;

  private:
    std::vector<std::vector<std::string>> resolve_hosts(const std::vector<std::string> &references) const;

    DescriptorResolver &resolver_;
    HostWeightEstimator estimator_;
    std::size_t concurrency_;
};

} // namespace worksplit
