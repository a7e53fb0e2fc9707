#include "exit_code.hpp"

namespace docrev::util {

int ToExitCode(const std::exception& e) {
  if (dynamic_cast<const InputError*>(&e)) {
    return kExitInputError;
  }
  if (dynamic_cast<const FormatError*>(&e)) {
    return kExitFormatError;
  }
  if (dynamic_cast<const IOError*>(&e)) {
    return kExitIOError;
  }
  if (dynamic_cast<const NotFound*>(&e)) {
    return kExitNotFound;
  }

  return kExitInternal;
}

const char* ErrorKind(const std::exception& e) {
  switch (ToExitCode(e)) {
    case kExitInputError:
      return "input";
    case kExitFormatError:
      return "format";
    case kExitIOError:
      return "io";
    case kExitNotFound:
      return "not_found";
    default:
      return "internal";
  }
}

} // namespace docrev::util
