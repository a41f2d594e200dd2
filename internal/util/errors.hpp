#pragma once

#include <stdexcept>
#include <string>

namespace outbox::util {

/*
  Central exception types.

  Store operations report through store::Result instead; these cover
  parsing, bad arguments and states the caller cannot recover from.
*/

class ParseError : public std::runtime_error {
 public:
  explicit ParseError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::invalid_argument {
 public:
  explicit InvalidArgument(const std::string& msg) : std::invalid_argument(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace outbox::util
