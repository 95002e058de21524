#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

#include "internal/db/api/result.hpp"

namespace bridgewatch::db {

/*
  Exceptions raised by reads and transaction control.

  Writes report through Result; callers that cannot continue on a failed
  write turn it into one of these with ThrowIfError.
*/

class StoreError : public std::runtime_error {
 public:
  StoreError(ErrorCode code, const std::string& msg) : std::runtime_error(msg), code_(code) {
  }

  ErrorCode Code() const {
    return code_;
  }

 private:
  ErrorCode code_;
};

// The connection is gone. Recovery is Connection::Reconnect().
class StoreUnavailable : public StoreError {
 public:
  explicit StoreUnavailable(const std::string& msg) : StoreError(ErrorCode::Unavailable, msg) {
  }
};

[[noreturn]] inline void Throw(const Result& result, std::string_view context) {
  std::string message(context);
  message += ": ";
  message += result.message.empty() ? ToString(result.code) : result.message;

  if (result.code == ErrorCode::Unavailable) {
    throw StoreUnavailable(message);
  }
  throw StoreError(result.code, message);
}

inline void ThrowIfError(const Result& result, std::string_view context) {
  if (!result) {
    Throw(result, context);
  }
}

} // namespace bridgewatch::db
