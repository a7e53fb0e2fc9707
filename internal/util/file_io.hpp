#pragma once

#include <filesystem>
#include <string>

namespace docrev::util {

/*
  Whole-file helpers. Failures raise util::IOError.
*/

std::string ReadFile(const std::filesystem::path& path);

/*
  Atomic write:
      write tmp → flush → rename

  The destination is either untouched or fully replaced. Parent
  directories are created on demand.
*/
void WriteFileAtomic(const std::filesystem::path& path, const std::string& bytes);

} // namespace docrev::util
