#pragma once

#include <stdexcept>
#include <string>

namespace worksplit {

class Error : public std::runtime_error {
  public:
    explicit Error(const std::string &msg) : std::runtime_error(msg) {}
};

// Planning was asked to run over zero references.
class NoInputError : public Error {
  public:
    explicit NoInputError(const std::string &msg) : Error(msg) {}
};

// A reference, input root or data file does not exist in storage.
class NotFoundError : public Error {
  public:
    explicit NotFoundError(const std::string &msg) : Error(msg) {}
};

// An encoded split could not be decoded.
class CorruptRecordError : public Error {
  public:
    explicit CorruptRecordError(const std::string &msg) : Error(msg) {}
};

class InvalidDescriptorError : public Error {
  public:
    explicit InvalidDescriptorError(const std::string &msg) : Error(msg) {}
};

class StorageError : public Error {
  public:
    explicit StorageError(const std::string &msg) : Error(msg) {}
};

class ConfigError : public Error {
  public:
    explicit ConfigError(const std::string &msg) : Error(msg) {}
};

} // namespace worksplit
