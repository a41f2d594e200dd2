#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace outbox::store {

/*
  Portable store result codes.

  Backends translate their own errors (errno, sqlite rc) into these.
  The relay engine never depends on backend error types.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,
  InvalidArgument,
  InvalidTransition,
  Busy,

  IOError,
  Corruption,

  InternalError
};

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }

  // IOError and Busy may succeed when repeated; everything else is final
  bool IsRetryable() const {
    return code == ErrorCode::IOError || code == ErrorCode::Busy;
  }
};

constexpr std::string_view ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::NotFound:
      return "not_found";
    case ErrorCode::AlreadyExists:
      return "already_exists";
    case ErrorCode::InvalidArgument:
      return "invalid_argument";
    case ErrorCode::InvalidTransition:
      return "invalid_transition";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::IOError:
      return "io_error";
    case ErrorCode::Corruption:
      return "corruption";
    case ErrorCode::InternalError:
      return "internal_error";
  }
  return "unknown";
}

/*
  Thrown by the inspection calls (Get, ListFailed, Stats) when the backend
  itself fails. The relay path reports through Result instead.
*/
class StoreError : public std::runtime_error {
 public:
  explicit StoreError(Result result) : std::runtime_error(std::string(ToString(result.code)) + ": " + result.message), result_(std::move(result)) {
  }

  const Result& result() const {
    return result_;
  }

 private:
  Result result_;
};

} // namespace outbox::store
