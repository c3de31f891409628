#pragma once

#include <stdexcept>
#include <string>

namespace chadoxml::util {

/*
  Central error types.

  ValidationError stays inside the pipeline: a stage logs it and reports
  failure. The others are fatal and end the run with exit code 2.
*/

class ValidationError : public std::runtime_error {
 public:
  explicit ValidationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class CacheConsistencyError : public std::runtime_error {
 public:
  explicit CacheConsistencyError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class LifecycleError : public std::runtime_error {
 public:
  explicit LifecycleError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class SerializationError : public std::runtime_error {
 public:
  explicit SerializationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace chadoxml::util
