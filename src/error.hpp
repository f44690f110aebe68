#pragma once

#include <stdexcept>
#include <string>

namespace whohas {

class Error : public std::runtime_error {
public:
  explicit Error(const std::string &message) : std::runtime_error(message) {}
};

// Invalid or incomplete settings, detected before any work starts
class ConfigurationError : public Error {
public:
  explicit ConfigurationError(const std::string &message) : Error(message) {}
};

class FileNotFound : public Error {
public:
  explicit FileNotFound(const std::string &path)
      : Error("File not found: " + path) {}
};

class StorageError : public Error {
public:
  explicit StorageError(const std::string &message) : Error(message) {}
};

class CaptureError : public Error {
public:
  explicit CaptureError(const std::string &message) : Error(message) {}
};

} // namespace whohas
