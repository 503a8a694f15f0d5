#pragma once

#include "worksplit/work_descriptor.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace worksplit {

struct BlockLocation {
    std::vector<std::string> hosts;
    std::uint64_t offset;
    std::uint64_t length;
};

// Turns descriptor-file references into work descriptors.
class DescriptorResolver {
  public:
    virtual ~DescriptorResolver() = default;

    // Descriptor files directly under root, or root itself when it names a file.
    // Throws NotFoundError when root does not exist.
    virtual std::vector<std::string> list(const std::string &root) = 0;

    // Throws NotFoundError when ref does not exist.
    virtual DescriptorFile load(const std::string &ref) = 0;

    std::vector<WorkDescriptor> resolve(const std::string &ref);
};

// Length and physical block layout of data files.
class BlockLocator {
  public:
    virtual ~BlockLocator() = default;

    virtual std::uint64_t file_length(const std::string &path) = 0;

    // Every block overlapping [offset, offset + length), in file order.
    virtual std::vector<BlockLocation> block_locations(const std::string &path, std::uint64_t offset,
                                                       std::uint64_t length) = 0;
};

} // namespace worksplit
