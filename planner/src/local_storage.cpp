#include "worksplit/local_storage.hpp"

#include "worksplit/errors.hpp"
#include "worksplit/properties.hpp"

#include <unistd.h>

#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace worksplit {

namespace {

bool is_container(const std::string &ref) {
    const std::string extension = LocalStorage::kContainerExtension;
    return ref.size() >= extension.size() &&
           ref.compare(ref.size() - extension.size(), extension.size(), extension) == 0;
}

WorkDescriptor to_descriptor(const Properties &properties) {
    WorkDescriptor descriptor;
    auto it = properties.find(LocalStorage::kSourceFilePathKey);
    if (it != properties.end() && !it->second.empty()) {
        descriptor.source_file_path = it->second;
    }
    it = properties.find(LocalStorage::kRangeStartKey);
    if (it != properties.end()) {
        descriptor.range_start = parse_uint(it->first, it->second);
    }
    it = properties.find(LocalStorage::kRangeEndKey);
    if (it != properties.end()) {
        descriptor.range_end = parse_uint(it->first, it->second);
    }
    return descriptor;
}

std::vector<std::string> split_sections(std::istream &in) {
    std::vector<std::string> sections(1);
    std::string line;
    while (std::getline(in, line)) {
        if (trim(line) == LocalStorage::kDescriptorSeparator) {
            sections.emplace_back();
            continue;
        }
        sections.back() += line;
        sections.back() += '\n';
    }
    return sections;
}

} // namespace

LocalStorage::LocalStorage(std::uint64_t block_size, std::vector<std::string> hosts, std::size_t replication)
    : block_size_(block_size), hosts_(std::move(hosts)), replication_(replication) {
    if (block_size_ == 0) {
        throw std::invalid_argument("block size must be > 0");
    }
    if (replication_ == 0) {
        throw std::invalid_argument("replication must be > 0");
    }
    if (hosts_.empty()) {
        hosts_.push_back(local_host_name());
    }
    replication_ = std::min(replication_, hosts_.size());
}

std::vector<std::string> LocalStorage::list(const std::string &root) {
    const std::filesystem::path path(root);
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        throw NotFoundError("path " + root + " does not exist");
    }
    std::vector<std::string> files;
    if (std::filesystem::is_regular_file(path, ec)) {
        files.push_back(root);
        return files;
    }
    try {
        for (auto const &entry : std::filesystem::directory_iterator(path)) {
            if (entry.is_regular_file()) {
                files.push_back(entry.path().string());
            }
        }
    } catch (const std::filesystem::filesystem_error &err) {
        throw StorageError("failed to list " + root + ": " + err.what());
    }
    std::sort(files.begin(), files.end());
    return files;
}

DescriptorFile LocalStorage::load(const std::string &ref) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(ref, ec)) {
        throw NotFoundError("descriptor file " + ref + " does not exist");
    }
    std::ifstream in(ref);
    if (!in) {
        throw NotFoundError("descriptor file " + ref + " does not exist");
    }
    try {
        if (!is_container(ref)) {
            return SingleDescriptor{to_descriptor(parse_properties(in))};
        }
        DescriptorContainer container;
        for (const auto &section : split_sections(in)) {
            std::istringstream section_in(section);
            auto properties = parse_properties(section_in);
            if (properties.empty()) {
                continue;
            }
            container.descriptors.push_back(to_descriptor(properties));
        }
        return DescriptorFile{std::move(container)};
    } catch (const ConfigError &err) {
        throw InvalidDescriptorError(ref + ": " + err.what());
    }
}

std::uint64_t LocalStorage::file_length(const std::string &path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        throw NotFoundError("data file " + path + " does not exist");
    }
    const auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        throw StorageError("failed to stat " + path + ": " + ec.message());
    }
    return static_cast<std::uint64_t>(size);
}

std::vector<BlockLocation> LocalStorage::block_locations(const std::string &path, std::uint64_t offset,
                                                         std::uint64_t length) {
    const auto file_size = file_length(path);
    std::vector<BlockLocation> blocks;
    if (offset >= file_size || length == 0) {
        return blocks;
    }
    const auto end = offset + std::min(length, file_size - offset);
    for (auto block_offset = offset / block_size_ * block_size_; block_offset < end;
         block_offset += block_size_) {
        const auto size = std::min(block_size_, file_size - block_offset);
        blocks.push_back(BlockLocation{hosts_for_block(block_offset / block_size_), block_offset, size});
    }
    return blocks;
}

std::uint64_t LocalStorage::block_size() const noexcept { return block_size_; }

const std::vector<std::string> &LocalStorage::hosts() const noexcept { return hosts_; }

std::string LocalStorage::local_host_name() {
    char name[256] = {};
    if (::gethostname(name, sizeof(name) - 1) != 0 || name[0] == '\0') {
        return "localhost";
    }
    return name;
}

std::vector<std::string> LocalStorage::hosts_for_block(std::uint64_t block_index) const {
    std::vector<std::string> hosts;
    hosts.reserve(replication_);
    for (std::size_t r = 0; r < replication_; ++r) {
        hosts.push_back(hosts_[(block_index + r) % hosts_.size()]);
    }
    return hosts;
}

} // namespace worksplit
