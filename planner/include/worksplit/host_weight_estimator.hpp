#pragma once

#include "worksplit/storage.hpp"
#include "worksplit/work_descriptor.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace worksplit {

struct HostWeight {
    std::string host;
    std::uint64_t bytes;
};

class HostWeightEstimator {
  public:
    static constexpr std::size_t kMinLocationNames = 3;
    static constexpr double kLocalityThreshold = 0.75;

    explicit HostWeightEstimator(BlockLocator &locator);

    // Top hosts for the descriptors, most weighted first.
    std::vector<std::string> estimate(const std::vector<WorkDescriptor> &descriptors) const;

    // Bytes per host in first-contribution order, plus the combined range length.
    std::vector<HostWeight> accumulate(const std::vector<WorkDescriptor> &descriptors,
                                       std::uint64_t &total_length) const;

    // Keeps hosts while fewer than kMinLocationNames are kept, on a tie with the
    // previous host, or while one host alone holds kLocalityThreshold of the total.
    static std::vector<std::string> select_top_hosts(const std::vector<HostWeight> &ranked,
                                                     std::uint64_t total_length);

    // Stable descending sort by bytes.
    static void rank(std::vector<HostWeight> &weights);

  private:
    BlockLocator &locator_;
};

} // namespace worksplit
