#include "file_io.hpp"

#include <unistd.h>

#include <fstream>
#include <iterator>
#include <system_error>

#include "internal/util/errors.hpp"

namespace docrev::util {

std::string ReadFile(const std::filesystem::path& path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    throw IOError("file not found: " + path.string());
  }

  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw IOError("cannot open for reading: " + path.string());
  }

  std::string bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (in.bad()) {
    throw IOError("read failed: " + path.string());
  }
  return bytes;
}

void WriteFileAtomic(const std::filesystem::path& path, const std::string& bytes) {
  std::error_code ec;
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
      throw IOError("cannot create directory " + path.parent_path().string() + ": " + ec.message());
    }
  }

  auto tmp_path = path;
  tmp_path += ".tmp." + std::to_string(::getpid());

  {
    std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
    if (!out) {
      throw IOError("cannot open for writing: " + tmp_path.string());
    }
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    out.flush();
    if (!out) {
      out.close();
      std::filesystem::remove(tmp_path, ec);
      throw IOError("write failed: " + tmp_path.string());
    }
  }

  std::filesystem::rename(tmp_path, path, ec);
  if (ec) {
    std::error_code cleanup;
    std::filesystem::remove(tmp_path, cleanup);
    throw IOError("cannot replace " + path.string() + ": " + ec.message());
  }
}

} // namespace docrev::util
