#pragma once
#include "schemakit/engine/Outcome.hpp"
#include "schemakit/export.h"

#include <cstddef>
#include <spdlog/common.h>
#include <string>
#include <yaml-cpp/yaml.h>

namespace schemakit {

/// Runtime settings for the logger and the async engine.
///
///   log_file: schemakit.log      # empty string disables the file sink
///   log_level: info              # trace|debug|info|warn|error|critical|off
///   parallel_async: true
///   max_concurrency: 8           # worker threads per call; 0 runs inline
///
/// Environment overrides, applied after the file: SCHEMAKIT_LOG_LEVEL,
/// SCHEMAKIT_LOG_FILE, SCHEMAKIT_PARALLEL_ASYNC, SCHEMAKIT_MAX_CONCURRENCY.
struct SCHEMAKIT_API EngineConfig {
  std::string log_file{"schemakit.log"};
  spdlog::level::level_enum log_level{spdlog::level::info};
  bool parallel_async{true};
  std::size_t max_concurrency{engine::default_max_concurrency()};

  static EngineConfig load_file(const std::string &path);
  static EngineConfig from_yaml(const YAML::Node &node);
  // Defaults plus environment overrides
  static EngineConfig from_environment();

  void apply_environment();

  engine::AsyncOptions async_options() const;
};

/// Throws SchemaError on an unknown level name
SCHEMAKIT_API spdlog::level::level_enum parse_log_level(const std::string &name);

} // namespace schemakit
