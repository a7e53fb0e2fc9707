#pragma once

#include <string>
#include <utility>

namespace docrev::db {

/*
  Repository result codes.

  Both backends report document and sentence lookups through these, so
  DocumentService maps a missing filename or position the same way
  whether the store is sqlite or memory.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,       // no document under that path, or no sentence at that position
  AlreadyExists,  // filename already stored
  Conflict,
  Busy,           // store locked by another docrev process

  ConstraintViolation,

  IOError,
  Corruption,

  InternalError
};

inline const char* ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK: return "ok";
    case ErrorCode::NotFound: return "not found";
    case ErrorCode::AlreadyExists: return "already exists";
    case ErrorCode::Conflict: return "conflict";
    case ErrorCode::Busy: return "busy";
    case ErrorCode::ConstraintViolation: return "constraint violation";
    case ErrorCode::IOError: return "io error";
    case ErrorCode::Corruption: return "corruption";
    case ErrorCode::InternalError: return "internal error";
  }
  return "unknown";
}

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() {
    return {};
  }

  // "not found: <message>"
  std::string Describe() const {
    return message.empty() ? ToString(code) : std::string(ToString(code)) + ": " + message;
  }

  static Result Err(ErrorCode c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

} // namespace docrev::db
