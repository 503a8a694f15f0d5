#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace worksplit {

struct WorkDescriptor {
    std::optional<std::string> source_file_path;
    std::uint64_t range_start{0};
    // Absent means the range runs to the end of the file.
    std::optional<std::uint64_t> range_end;
};

struct SingleDescriptor {
    WorkDescriptor descriptor;
};

struct DescriptorContainer {
    std::vector<WorkDescriptor> descriptors;
};

using DescriptorFile = std::variant<SingleDescriptor, DescriptorContainer>;

std::vector<WorkDescriptor> flatten(DescriptorFile file);

} // namespace worksplit
