#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/core/document_service.hpp"
#include "internal/db/api/repository.hpp"

namespace docrev::factory {

/*
  Application

  Long-lived objects for one CLI invocation.
*/
struct Application {
  std::shared_ptr<db::Repository>        repository;
  std::shared_ptr<core::DocumentService> documents;
};

/*
  Build

  Composition root: the ONLY place that knows concrete store types.
  Opens (and bootstraps) the configured metadata store.
*/
Application Build(const docrev::runtime::config::RuntimeConfig& config);

std::shared_ptr<db::Repository> BuildRepository(const docrev::runtime::config::RuntimeConfig& config);

// Throws util::UnsupportedMode / util::InvalidTimestamp for bad config values.
core::ServiceOptions BuildServiceOptions(const docrev::runtime::config::RuntimeConfig& config);

} // namespace docrev::factory
