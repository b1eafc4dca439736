#pragma once

#include <stdexcept>
#include <string>

#include "internal/db/api/result.hpp"

namespace rowsweep::util {

/*
  Central error types.

  StoreError carries a portable db::ErrorCode so the sweep can tell
  transient failures from unrecoverable ones.
*/

class StoreError : public std::runtime_error {
 public:
  StoreError(db::ErrorCode code, const std::string& msg) : std::runtime_error(msg), code_(code) {
  }

  db::ErrorCode Code() const {
    return code_;
  }

 private:
  db::ErrorCode code_;
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

class CheckpointError : public std::runtime_error {
 public:
  explicit CheckpointError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace rowsweep::util
