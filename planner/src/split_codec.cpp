#include "worksplit/split_codec.hpp"

#include "worksplit/errors.hpp"

#include <arpa/inet.h>

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <iterator>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

namespace worksplit {

namespace {

// Rejects overlong forms, surrogates and code points past U+10FFFF.
bool is_valid_utf8(const std::string &text) {
    std::size_t i = 0;
    while (i < text.size()) {
        const auto lead = static_cast<unsigned char>(text[i]);
        std::size_t extra;
        std::uint32_t code_point;
        if (lead < 0x80) {
            ++i;
            continue;
        } else if ((lead & 0xE0) == 0xC0) {
            extra = 1;
            code_point = lead & 0x1F;
        } else if ((lead & 0xF0) == 0xE0) {
            extra = 2;
            code_point = lead & 0x0F;
        } else if ((lead & 0xF8) == 0xF0) {
            extra = 3;
            code_point = lead & 0x07;
        } else {
            return false;
        }
        if (extra > text.size() - i - 1) {
            return false;
        }
        for (std::size_t k = 1; k <= extra; ++k) {
            const auto next = static_cast<unsigned char>(text[i + k]);
            if ((next & 0xC0) != 0x80) {
                return false;
            }
            code_point = (code_point << 6) | (next & 0x3F);
        }
        static const std::uint32_t kMinForLength[] = {0, 0x80, 0x800, 0x10000};
        if (code_point < kMinForLength[extra] || code_point > 0x10FFFF ||
            (code_point >= 0xD800 && code_point <= 0xDFFF)) {
            return false;
        }
        i += extra + 1;
    }
    return true;
}

class Writer {
  public:
    void put_count(std::size_t count) {
        if (count > static_cast<std::size_t>(std::numeric_limits<std::int32_t>::max())) {
            throw std::length_error("too many entries to encode: " + std::to_string(count));
        }
        std::uint32_t value = htonl(static_cast<std::uint32_t>(count));
        append(&value, sizeof(value));
    }

    void put_string(const std::string &text) {
        if (text.size() > kMaxEncodedStringBytes) {
            throw std::length_error("string of " + std::to_string(text.size()) +
                                    " bytes exceeds encodable length");
        }
        if (!is_valid_utf8(text)) {
            throw std::invalid_argument("string is not valid UTF-8");
        }
        std::uint16_t length = htons(static_cast<std::uint16_t>(text.size()));
        append(&length, sizeof(length));
        append(text.data(), text.size());
    }

    std::vector<char> take() { return std::move(buffer_); }

  private:
    void append(const void *data, std::size_t size) {
        const char *bytes = static_cast<const char *>(data);
        buffer_.insert(buffer_.end(), bytes, bytes + size);
    }

    std::vector<char> buffer_;
};

class Reader {
  public:
    Reader(const char *data, std::size_t size) : data_(data), size_(size) {}

    std::size_t get_count(const char *what) {
        std::uint32_t raw;
        take(&raw, sizeof(raw), what);
        auto value = static_cast<std::int32_t>(ntohl(raw));
        if (value < 0) {
            throw CorruptRecordError(std::string("negative ") + what + ": " + std::to_string(value));
        }
        return static_cast<std::size_t>(value);
    }

    std::string get_string(const char *what) {
        std::uint16_t raw;
        take(&raw, sizeof(raw), what);
        std::string text(ntohs(raw), '\0');
        take(&text[0], text.size(), what);
        if (!is_valid_utf8(text)) {
            throw CorruptRecordError(std::string("malformed UTF-8 in ") + what);
        }
        return text;
    }

    // Every string costs at least its length prefix, which bounds how much a
    // declared count may reserve.
    std::size_t max_strings() const { return (size_ - pos_) / sizeof(std::uint16_t); }

    bool at_end() const noexcept { return pos_ == size_; }

    std::size_t remaining() const noexcept { return size_ - pos_; }

  private:
    void take(void *out, std::size_t count, const char *what) {
        if (count > size_ - pos_) {
            throw CorruptRecordError(std::string("truncated split record while reading ") + what);
        }
        if (count > 0) {
            std::memcpy(out, data_ + pos_, count);
        }
        pos_ += count;
    }

    const char *data_;
    std::size_t size_;
    std::size_t pos_{0};
};

std::vector<std::string> read_strings(Reader &reader, const char *count_name, const char *item_name) {
    const auto count = reader.get_count(count_name);
    std::vector<std::string> items;
    items.reserve(std::min(count, reader.max_strings()));
    for (std::size_t i = 0; i < count; ++i) {
        items.push_back(reader.get_string(item_name));
    }
    return items;
}

} // namespace

std::vector<char> encode_split(const SplitRecord &split) {
    Writer writer;
    writer.put_count(split.paths().size());
    for (const auto &path : split.paths()) {
        writer.put_string(path);
    }
    writer.put_count(split.preferred_hosts().size());
    for (const auto &host : split.preferred_hosts()) {
        writer.put_string(host);
    }
    return writer.take();
}

SplitRecord decode_split(const char *data, std::size_t size) {
    if (data == nullptr && size != 0) {
        throw std::invalid_argument("null split buffer");
    }
    Reader reader(data, size);
    auto paths = read_strings(reader, "path count", "path");
    auto hosts = read_strings(reader, "host count", "host");
    if (!reader.at_end()) {
        throw CorruptRecordError(std::to_string(reader.remaining()) +
                                 " trailing bytes after split record");
    }
    return SplitRecord(std::move(paths), std::move(hosts));
}

SplitRecord decode_split(const std::vector<char> &bytes) { return decode_split(bytes.data(), bytes.size()); }

void write_split_file(const std::filesystem::path &path, const SplitRecord &split) {
    auto bytes = encode_split(split);
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw StorageError("failed to open split file for writing: " + path.string());
    }
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    if (!out) {
        throw StorageError("failed to write split file: " + path.string());
    }
}

SplitRecord read_split_file(const std::filesystem::path &path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw NotFoundError("split file does not exist or is unreadable: " + path.string());
    }
    std::vector<char> bytes(std::istreambuf_iterator<char>(in), (std::istreambuf_iterator<char>()));
    return decode_split(bytes);
}

} // namespace worksplit
