#include "package.hpp"

#include <cstring>
#include <cstdint>
#include <ctime>

#include <miniz.h>

#include "internal/observability/logging.hpp"
#include "internal/ooxml/namespaces.hpp"
#include "internal/ooxml/part_locator.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/file_io.hpp"

namespace docrev::package {

namespace {

// miniz stores entry times as local DOS time (localtime_r), so the
// instant is taken in local time: every zone then records exactly
// 1980-01-01 12:00:00, the earliest date a DOS timestamp can express.
MZ_TIME_T EntryTime() {
  std::tm fields{};
  fields.tm_year  = 80;
  fields.tm_mon   = 0;
  fields.tm_mday  = 1;
  fields.tm_hour  = 12;
  fields.tm_isdst = -1;

  const std::time_t local = std::mktime(&fields);
  if (local == static_cast<std::time_t>(-1)) {
    throw util::IOError("cannot compute zip entry timestamp");
  }
  return static_cast<MZ_TIME_T>(local);
}

constexpr mz_uint kCompressionLevel = MZ_DEFAULT_LEVEL;

/*
  RAII owner of an mz_zip_archive reader.
*/
class ZipReader {
 public:
  explicit ZipReader(const std::string& bytes) {
    std::memset(&archive_, 0, sizeof(archive_));
    if (!mz_zip_reader_init_mem(&archive_, bytes.data(), bytes.size(), 0)) {
      throw util::NotAPackage(std::string("not a zip archive: ") + mz_zip_get_error_string(mz_zip_get_last_error(&archive_)));
    }
  }

  ~ZipReader() {
    mz_zip_reader_end(&archive_);
  }

  ZipReader(const ZipReader&)            = delete;
  ZipReader& operator=(const ZipReader&) = delete;

  mz_zip_archive* get() {
    return &archive_;
  }

 private:
  mz_zip_archive archive_;
};

class ZipWriter {
 public:
  ZipWriter() : entry_time_(EntryTime()) {
    std::memset(&archive_, 0, sizeof(archive_));
    if (!mz_zip_writer_init_heap(&archive_, 0, 0)) {
      throw util::IOError("cannot initialise zip writer");
    }
  }

  ~ZipWriter() {
    mz_zip_writer_end(&archive_);
  }

  ZipWriter(const ZipWriter&)            = delete;
  ZipWriter& operator=(const ZipWriter&) = delete;

  void Add(const std::string& name, const std::string& bytes) {
    MZ_TIME_T modified = entry_time_;
    if (!mz_zip_writer_add_mem_ex_v2(&archive_, name.c_str(), bytes.data(), bytes.size(), nullptr, 0, kCompressionLevel, 0, 0,
                                     &modified, nullptr, 0, nullptr, 0)) {
      throw util::IOError("cannot add " + name + " to archive: " + mz_zip_get_error_string(mz_zip_get_last_error(&archive_)));
    }
  }

  std::string Finish() {
    void*  buffer = nullptr;
    size_t size   = 0;
    if (!mz_zip_writer_finalize_heap_archive(&archive_, &buffer, &size)) {
      throw util::IOError(std::string("cannot finalise archive: ") + mz_zip_get_error_string(mz_zip_get_last_error(&archive_)));
    }
    std::string out(static_cast<const char*>(buffer), size);
    mz_free(buffer);
    return out;
  }

 private:
  mz_zip_archive archive_;
  MZ_TIME_T      entry_time_;
};

} // namespace

void RequireParts(const Package& package) {
  if (!ooxml::MainDocumentPart(package)) {
    throw util::MissingRequiredPart("package has no main document part");
  }
  if (!ooxml::CorePropertiesPart(package)) {
    throw util::MissingRequiredPart("package has no core-properties part");
  }
}

Package Unpack(const std::string& bytes) {
  ZipReader reader(bytes);
  auto*     archive = reader.get();

  Package    package;
  const auto count = mz_zip_reader_get_num_files(archive);
  for (mz_uint i = 0; i < count; ++i) {
    mz_zip_archive_file_stat stat;
    if (!mz_zip_reader_file_stat(archive, i, &stat)) {
      throw util::NotAPackage("unreadable zip entry #" + std::to_string(i));
    }
    if (mz_zip_reader_is_file_a_directory(archive, i)) {
      continue;
    }

    std::string name = stat.m_filename;
    if (!name.empty() && name.front() == '/') {
      name.erase(0, 1);
    }

    if (stat.m_uncomp_size == 0) {
      package[name];
      continue;
    }

    size_t size = 0;
    void*  data = mz_zip_reader_extract_to_heap(archive, i, &size, 0);
    if (!data) {
      throw util::NotAPackage("cannot inflate " + name + ": " + mz_zip_get_error_string(mz_zip_get_last_error(archive)));
    }
    package[name].assign(static_cast<const char*>(data), size);
    mz_free(data);
  }

  if (package.empty()) {
    throw util::NotAPackage("archive has no entries");
  }

  RequireParts(package);

  DOCREV_LOG_DEBUG("package unpacked", {observability::IntField("parts", static_cast<int64_t>(package.size())),
                                        observability::IntField("bytes", static_cast<int64_t>(bytes.size()))});
  return package;
}

std::string Repack(const Package& package) {
  ZipWriter writer;

  const auto content_types = package.find(ooxml::kPartContentTypes);
  if (content_types != package.end()) {
    writer.Add(content_types->first, content_types->second);
  }
  for (const auto& [name, bytes] : package) {
    if (name == ooxml::kPartContentTypes) continue;
    writer.Add(name, bytes);
  }

  return writer.Finish();
}

Package ReadPackageFile(const std::filesystem::path& path) {
  return Unpack(util::ReadFile(path));
}

void WritePackageFile(const std::filesystem::path& path, const Package& package) {
  util::WriteFileAtomic(path, Repack(package));
  DOCREV_LOG_INFO("package written",
                  {observability::StringField("path", path.string()), observability::IntField("parts", static_cast<int64_t>(package.size()))});
}

} // namespace docrev::package
