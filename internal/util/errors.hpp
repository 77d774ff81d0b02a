#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace txcluster::util {

/*
  Central error types.

  Recoverability:
    MalformedRecordError   per-record, skipped and counted unless strict
    StorageIOError         retried while transient(), fatal afterwards
    CapacityExceededError  fatal, never retried
    ConfigurationError     fatal at startup, before any processing

  Non-convergence is not an error; it is reported in the run report.
*/

class MalformedRecordError : public std::runtime_error {
 public:
  MalformedRecordError(uint64_t line_number, const std::string& reason)
      : std::runtime_error("malformed record at line " + std::to_string(line_number) + ": " + reason), line_number_(line_number) {
  }

  uint64_t LineNumber() const {
    return line_number_;
  }

 private:
  uint64_t line_number_;
};

class StorageIOError : public std::runtime_error {
 public:
  StorageIOError(const std::string& msg, bool transient) : std::runtime_error(msg), transient_(transient) {
  }

  bool Transient() const {
    return transient_;
  }

 private:
  bool transient_;
};

class CapacityExceededError : public std::runtime_error {
 public:
  explicit CapacityExceededError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ConfigurationError : public std::runtime_error {
 public:
  explicit ConfigurationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace txcluster::util
