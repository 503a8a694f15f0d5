#pragma once

#include "worksplit/split_record.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <vector>

namespace worksplit {

// Strings are prefixed with an unsigned 16-bit byte length.
constexpr std::size_t kMaxEncodedStringBytes = 0xFFFF;

// Big-endian int32 counts, each followed by that many u16-length-prefixed UTF-8 strings.
std::vector<char> encode_split(const SplitRecord &split);

// Throws CorruptRecordError on negative counts, truncation, malformed UTF-8 or trailing bytes.
SplitRecord decode_split(const char *data, std::size_t size);

SplitRecord decode_split(const std::vector<char> &bytes);

void write_split_file(const std::filesystem::path &path, const SplitRecord &split);

SplitRecord read_split_file(const std::filesystem::path &path);

} // namespace worksplit
