#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/db/api/repository.hpp"

namespace bridgewatch::factory {

/*
  BuildRepository

  Opens the configured Record Store and bootstraps the telemetry table.

  NOTE:
  This is the composition root for storage.
  It is the ONLY place allowed to know concrete DB types.
*/
std::shared_ptr<db::Repository> BuildRepository(const bridgewatch::runtime::config::RuntimeConfig& config);

bridgewatch::model::FeatureSchema BuildSchema(const bridgewatch::runtime::config::RuntimeConfig& config);

} // namespace bridgewatch::factory
