#include "factory.hpp"

#include <filesystem>
#include <memory>
#include <system_error>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace docrev::factory {

std::shared_ptr<db::Repository> BuildRepository(const docrev::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_memory()) {
    DOCREV_LOG_DEBUG("using in-memory metadata store");
    return std::make_shared<db::memory::MemoryRepository>();
  }

  const std::filesystem::path path = database.sqlite().path().empty() ? "data/docrev.db" : database.sqlite().path();
  if (path.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
      throw util::IOError("cannot create database directory " + path.parent_path().string() + ": " + ec.message());
    }
  }

  auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(path.string(), database.sqlite().wal_mode());
  db::sqlite::BootstrapSchema(*sqlite_db);
  DOCREV_LOG_DEBUG("sqlite metadata store ready", {observability::StringField("path", path.string())});
  return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
}

core::ServiceOptions BuildServiceOptions(const docrev::runtime::config::RuntimeConfig& config) {
  core::ServiceOptions options;

  const auto& timeline = config.timeline();
  if (timeline.has_default_author()) options.default_author = timeline.default_author();
  options.min_interval_seconds = timeline.min_interval_seconds();
  options.max_interval_seconds = timeline.max_interval_seconds();
  if (!timeline.default_mode().empty()) options.default_mode = model::ParseRenderMode(timeline.default_mode());

  const auto& pkg = config.package();
  if (!pkg.application_name().empty()) options.builder.application_name = pkg.application_name();
  if (!pkg.app_version().empty()) options.builder.app_version = pkg.app_version();

  const auto& sanitize = config.sanitize();
  if (!sanitize.neutral_author().empty()) options.sanitize.neutral_author = sanitize.neutral_author();
  if (!sanitize.application_name().empty()) options.sanitize.application_name = sanitize.application_name();
  if (!sanitize.neutral_timestamp().empty()) options.neutral_instant = util::ParseTimestamp(sanitize.neutral_timestamp());

  return options;
}

Application Build(const docrev::runtime::config::RuntimeConfig& config) {
  Application app;
  app.repository = BuildRepository(config);
  app.documents  = std::make_shared<core::DocumentService>(app.repository, BuildServiceOptions(config));
  return app;
}

} // namespace docrev::factory
