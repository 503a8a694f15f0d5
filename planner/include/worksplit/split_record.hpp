#pragma once

#include <string>
#include <vector>

namespace worksplit {

// Something a scheduler can place near its data.
class Locatable {
  public:
    virtual ~Locatable() = default;

    virtual std::vector<std::string> locations() const = 0;
};

// Descriptor-file references for one worker plus the hosts storing most of their data.
class SplitRecord : public Locatable {
  public:
    SplitRecord(std::vector<std::string> paths, std::vector<std::string> preferred_hosts);

    const std::vector<std::string> &paths() const noexcept;

    const std::vector<std::string> &preferred_hosts() const noexcept;

    std::vector<std::string> locations() const override;

    // Paths compare in order, preferred hosts as a set.
    bool operator==(const SplitRecord &other) const;
    bool operator!=(const SplitRecord &other) const;

  private:
    std::vector<std::string> paths_;
    std::vector<std::string> preferred_hosts_;
};

} // namespace worksplit
