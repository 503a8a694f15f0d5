#pragma once

#include <cstdint>
#include <filesystem>
#include <istream>
#include <map>
#include <string>

namespace worksplit {

using Properties = std::map<std::string, std::string>;

// key=value lines; blank lines and lines starting with '#' are skipped.
// Throws ConfigError on a line without '=' or with an empty key.
Properties parse_properties(std::istream &in);

Properties load_properties(const std::filesystem::path &path);

std::int64_t parse_int(const std::string &key, const std::string &value);

std::uint64_t parse_uint(const std::string &key, const std::string &value);

std::string trim(const std::string &text);

} // namespace worksplit
