#pragma once

#include <stdexcept>
#include <string>

namespace docrev::util {

/*
  Central error types.

  Three families, mapped to exit codes by the CLI (see exit_code.hpp):

    InputError  - rejected before any file I/O
    FormatError - package could not be unpacked or parsed
    IOError     - path not readable / not writable

  NotFound is raised when the metadata store has no matching document.
*/

class InputError : public std::runtime_error {
 public:
  explicit InputError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidInterval : public InputError {
 public:
  explicit InvalidInterval(const std::string& msg) : InputError(msg) {
  }
};

class EmptyInput : public InputError {
 public:
  explicit EmptyInput(const std::string& msg) : InputError(msg) {
  }
};

class EmptyDocument : public InputError {
 public:
  explicit EmptyDocument(const std::string& msg) : InputError(msg) {
  }
};

class UnsupportedMode : public InputError {
 public:
  explicit UnsupportedMode(const std::string& msg) : InputError(msg) {
  }
};

class RecordCountMismatch : public InputError {
 public:
  explicit RecordCountMismatch(const std::string& msg) : InputError(msg) {
  }
};

class DuplicateRevisionId : public InputError {
 public:
  explicit DuplicateRevisionId(const std::string& msg) : InputError(msg) {
  }
};

class InvalidTimestamp : public InputError {
 public:
  explicit InvalidTimestamp(const std::string& msg) : InputError(msg) {
  }
};

class InvalidArgument : public InputError {
 public:
  explicit InvalidArgument(const std::string& msg) : InputError(msg) {
  }
};

class FormatError : public std::runtime_error {
 public:
  explicit FormatError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotAPackage : public FormatError {
 public:
  explicit NotAPackage(const std::string& msg) : FormatError(msg) {
  }
};

class MissingRequiredPart : public FormatError {
 public:
  explicit MissingRequiredPart(const std::string& msg) : FormatError(msg) {
  }
};

class CorruptPackage : public FormatError {
 public:
  explicit CorruptPackage(const std::string& msg) : FormatError(msg) {
  }
};

class IOError : public std::runtime_error {
 public:
  explicit IOError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace docrev::util
