#pragma once

#include "worksplit/storage.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace worksplit {

// Block k of a data file lives on `replication` hosts starting at hosts[k % n].
class LocalStorage : public DescriptorResolver, public BlockLocator {
  public:
    static constexpr const char *kContainerExtension = ".mwu";
    static constexpr const char *kDescriptorSeparator = "---";
    static constexpr const char *kSourceFilePathKey = "source.file.path";
    static constexpr const char *kRangeStartKey = "source.range.start";
    static constexpr const char *kRangeEndKey = "source.range.end";
    static constexpr std::uint64_t kDefaultBlockSize = 32ull * 1024 * 1024;

    // An empty host list means the local host name.
    explicit LocalStorage(std::uint64_t block_size = kDefaultBlockSize, std::vector<std::string> hosts = {},
                          std::size_t replication = 1);

    std::vector<std::string> list(const std::string &root) override;

    DescriptorFile load(const std::string &ref) override;

    std::uint64_t file_length(const std::string &path) override;

    std::vector<BlockLocation> block_locations(const std::string &path, std::uint64_t offset,
                                               std::uint64_t length) override;

    std::uint64_t block_size() const noexcept;

    const std::vector<std::string> &hosts() const noexcept;

    static std::string local_host_name();

  private:
    std::vector<std::string> hosts_for_block(std::uint64_t block_index) const;

    std::uint64_t block_size_;
    std::vector<std::string> hosts_;
    std::size_t replication_;
};

} // namespace worksplit
