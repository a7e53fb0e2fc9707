#pragma once

#include <exception>

#include "internal/util/errors.hpp"

namespace docrev::util {

/*
  Converts internal exceptions into process exit codes.
*/

enum ExitCode : int {
  kExitOk          = 0,
  kExitUsage       = 1,
  kExitInputError  = 2,
  kExitFormatError = 3,
  kExitIOError     = 4,
  kExitNotFound    = 5,
  kExitInternal    = 6,
};

int ToExitCode(const std::exception& e);

const char* ErrorKind(const std::exception& e);

} // namespace docrev::util
