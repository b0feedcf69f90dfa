#pragma once

#include <stdexcept>
#include <string>

namespace backupmon::util {

/*
  Central error types.

  Callers at process edges (scheduler loop, CLI) translate these into
  log lines and exit codes.
*/

// Non-duplicate storage failure during an import pass.
class StorageError : public std::runtime_error {
 public:
  explicit StorageError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace backupmon::util
