#include "worksplit/properties.hpp"

#include "worksplit/errors.hpp"

#include <cctype>
#include <fstream>
#include <stdexcept>

namespace worksplit {

std::string trim(const std::string &text) {
    std::size_t begin = 0;
    std::size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
        --end;
    }
    return text.substr(begin, end - begin);
}

Properties parse_properties(std::istream &in) {
    Properties properties;
    std::string line;
    std::size_t line_number = 0;
    while (std::getline(in, line)) {
        ++line_number;
        auto content = trim(line);
        if (content.empty() || content[0] == '#') {
            continue;
        }
        auto eq = content.find('=');
        if (eq == std::string::npos) {
            throw ConfigError("line " + std::to_string(line_number) + ": expected key=value");
        }
        auto key = trim(content.substr(0, eq));
        if (key.empty()) {
            throw ConfigError("line " + std::to_string(line_number) + ": empty key");
        }
        properties[key] = trim(content.substr(eq + 1));
    }
    return properties;
}

Properties load_properties(const std::filesystem::path &path) {
    std::ifstream in(path);
    if (!in) {
        throw NotFoundError("failed to open properties file: " + path.string());
    }
    return parse_properties(in);
}

std::int64_t parse_int(const std::string &key, const std::string &value) {
    std::size_t consumed = 0;
    long long parsed = 0;
    try {
        parsed = std::stoll(value, &consumed);
    } catch (const std::logic_error &) {
        throw ConfigError("invalid integer for " + key + ": '" + value + "'");
    }
    if (consumed != value.size()) {
        throw ConfigError("invalid integer for " + key + ": '" + value + "'");
    }
    return static_cast<std::int64_t>(parsed);
}

std::uint64_t parse_uint(const std::string &key, const std::string &value) {
    if (value.empty() || value[0] == '-' || value[0] == '+') {
        throw ConfigError("invalid unsigned integer for " + key + ": '" + value + "'");
    }
    std::size_t consumed = 0;
    unsigned long long parsed = 0;
    try {
        parsed = std::stoull(value, &consumed);
    } catch (const std::logic_error &) {
        throw ConfigError("invalid unsigned integer for " + key + ": '" + value + "'");
    }
    if (consumed != value.size()) {
        throw ConfigError("invalid unsigned integer for " + key + ": '" + value + "'");
    }
    return static_cast<std::uint64_t>(parsed);
}

} // namespace worksplit
