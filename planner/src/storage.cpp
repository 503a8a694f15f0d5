#include "worksplit/storage.hpp"

namespace worksplit {

std::vector<WorkDescriptor> DescriptorResolver::resolve(const std::string &ref) {
    return flatten(load(ref));
}

} // namespace worksplit
