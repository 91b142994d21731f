#pragma once

#include <stdexcept>
#include <string>

namespace notify::util {

/*
  Central error types raised by the allocator.

  Retryable store conditions never escape as these unless the retry
  budget is spent.
*/

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Invalidation payload cannot be serialized or the stored form cannot be parsed.
class EncodingError : public std::runtime_error {
 public:
  explicit EncodingError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Every allocation attempt lost the race for its candidate id.
class ContentionExceeded : public std::runtime_error {
 public:
  explicit ContentionExceeded(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Store kept reporting busy / io / serialization failures.
class StoreUnavailable : public std::runtime_error {
 public:
  explicit StoreUnavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

class StoreError : public std::runtime_error {
 public:
  explicit StoreError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace notify::util
