#include "worksplit/host_weight_estimator.hpp"

#include "worksplit/errors.hpp"
#include "worksplit/logging.hpp"

#include <algorithm>
#include <limits>
#include <unordered_map>

namespace worksplit {

namespace {

std::uint64_t clipped_length(const BlockLocation &block, std::uint64_t range_start,
                             std::uint64_t range_end) {
    const auto block_end = block.offset + block.length;
    const auto start = std::max(block.offset, range_start);
    const auto end = std::min(block_end, range_end);
    return end > start ? end - start : 0;
}

} // namespace

HostWeightEstimator::HostWeightEstimator(BlockLocator &locator) : locator_(locator) {}

std::vector<std::string>
HostWeightEstimator::estimate(const std::vector<WorkDescriptor> &descriptors) const {
    std::uint64_t total_length = 0;
    auto weights = accumulate(descriptors, total_length);
    rank(weights);
    return select_top_hosts(weights, total_length);
}

std::vector<HostWeight> HostWeightEstimator::accumulate(const std::vector<WorkDescriptor> &descriptors,
                                                        std::uint64_t &total_length) const {
    std::vector<HostWeight> weights;
    std::unordered_map<std::string, std::size_t> index_by_host;
    total_length = 0;

    for (const auto &descriptor : descriptors) {
        if (!descriptor.source_file_path) {
            WORKSPLIT_LOG_WARN("skipping block location retrieval for work descriptor without a source "
                               "file path (range_start="
                               << descriptor.range_start << ')');
            continue;
        }
        const auto &path = *descriptor.source_file_path;
        const auto range_start = descriptor.range_start;
        const auto range_end = descriptor.range_end ? *descriptor.range_end : locator_.file_length(path);
        if (range_end < range_start) {
            throw InvalidDescriptorError("range end " + std::to_string(range_end) +
                                         " precedes range start " + std::to_string(range_start) +
                                         " for " + path);
        }
        const auto range_length = range_end - range_start;
        total_length += range_length;

        for (const auto &block : locator_.block_locations(path, range_start, range_length)) {
            const auto bytes = clipped_length(block, range_start, range_end);
            if (bytes == 0) {
                continue;
            }
            for (const auto &host : block.hosts) {
                auto it = index_by_host.find(host);
                if (it == index_by_host.end()) {
                    index_by_host.emplace(host, weights.size());
                    weights.push_back(HostWeight{host, bytes});
                } else {
                    weights[it->second].bytes += bytes;
                }
            }
        }
    }
    return weights;
}

void HostWeightEstimator::rank(std::vector<HostWeight> &weights) {
    std::stable_sort(weights.begin(), weights.end(),
                     [](const HostWeight &a, const HostWeight &b) { return a.bytes > b.bytes; });
}

std::vector<std::string> HostWeightEstimator::select_top_hosts(const std::vector<HostWeight> &ranked,
                                                               std::uint64_t total_length) {
    auto dominant = [total_length](std::uint64_t bytes) {
        return total_length > 0 &&
               static_cast<double>(bytes) / static_cast<double>(total_length) >= kLocalityThreshold;
    };

    std::uint64_t previous = std::numeric_limits<std::uint64_t>::max();
    std::size_t end = 0;
    while (end < ranked.size() &&
           (end < kMinLocationNames || ranked[end].bytes == previous || dominant(ranked[end].bytes))) {
        previous = ranked[end].bytes;
        ++end;
    }

    std::vector<std::string> hosts;
    hosts.reserve(end);
    for (std::size_t i = 0; i < end; ++i) {
        hosts.push_back(ranked[i].host);
    }
    return hosts;
}

} // namespace worksplit
