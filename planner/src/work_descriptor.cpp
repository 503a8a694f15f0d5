#include "worksplit/work_descriptor.hpp"

#include <type_traits>
#include <utility>

namespace worksplit {

std::vector<WorkDescriptor> flatten(DescriptorFile file) {
    return std::visit(
        [](auto &&entry) -> std::vector<WorkDescriptor> {
            using T = std::decay_t<decltype(entry)>;
            if constexpr (std::is_same_v<T, SingleDescriptor>) {
                return {std::move(entry.descriptor)};
            } else {
                return std::move(entry.descriptors);
            }
        },
        std::move(file));
}

} // namespace worksplit
