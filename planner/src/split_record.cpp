#include "worksplit/split_record.hpp"

#include <set>
#include <utility>

namespace worksplit {

SplitRecord::SplitRecord(std::vector<std::string> paths, std::vector<std::string> preferred_hosts)
    : paths_(std::move(paths)) {
    std::set<std::string> seen;
    preferred_hosts_.reserve(preferred_hosts.size());
    for (auto &host : preferred_hosts) {
        if (seen.insert(host).second) {
            preferred_hosts_.push_back(std::move(host));
        }
    }
}

const std::vector<std::string> &SplitRecord::paths() const noexcept { return paths_; }

const std::vector<std::string> &SplitRecord::preferred_hosts() const noexcept { return preferred_hosts_; }

std::vector<std::string> SplitRecord::locations() const { return preferred_hosts_; }

bool SplitRecord::operator==(const SplitRecord &other) const {
    if (paths_ != other.paths_) {
        return false;
    }
    std::set<std::string> lhs(preferred_hosts_.begin(), preferred_hosts_.end());
    std::set<std::string> rhs(other.preferred_hosts_.begin(), other.preferred_hosts_.end());
    return lhs == rhs;
}

bool SplitRecord::operator!=(const SplitRecord &other) const { return !(*this == other); }

} // namespace worksplit
