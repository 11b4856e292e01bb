#include "schemakit/EngineConfig.hpp"
#include "schemakit/Result.hpp"

#include <fmt/format.h>

#include <cstdlib>
#include <stdexcept>
#include <string>

namespace schemakit {

namespace {

bool parse_bool(const std::string &text, const std::string &where) {
  if (text == "1" || text == "true" || text == "yes" || text == "on")
    return true;
  if (text == "0" || text == "false" || text == "no" || text == "off")
    return false;
  throw SchemaError(fmt::format("expected a boolean, got '{}'", text), where);
}

std::size_t parse_count(const std::string &text, const std::string &where) {
  std::size_t used = 0;
  unsigned long long n = 0;
  try {
    if (!text.empty() && text[0] != '-')
      n = std::stoull(text, &used);
  } catch (const std::logic_error &) {
    used = 0;
  }
  if (used == 0 || used != text.size())
    throw SchemaError(
        fmt::format("expected a non-negative integer, got '{}'", text), where);
  return static_cast<std::size_t>(n);
}

} // namespace

spdlog::level::level_enum parse_log_level(const std::string &name) {
  if (name == "trace")
    return spdlog::level::trace;
  if (name == "debug")
    return spdlog::level::debug;
  if (name == "info")
    return spdlog::level::info;
  if (name == "warn" || name == "warning")
    return spdlog::level::warn;
  if (name == "error" || name == "err")
    return spdlog::level::err;
  if (name == "critical")
    return spdlog::level::critical;
  if (name == "off")
    return spdlog::level::off;
  throw SchemaError(fmt::format("unknown log level '{}'", name), "log_level");
}

EngineConfig EngineConfig::load_file(const std::string &path) {
  YAML::Node root;
  try {
    root = YAML::LoadFile(path);
  } catch (const YAML::BadFile &) {
    throw SchemaError("cannot open config file", path);
  } catch (const YAML::ParserException &e) {
    throw SchemaError(fmt::format("malformed YAML: {}", e.what()), path);
  }
  EngineConfig config = from_yaml(root);
  config.apply_environment();
  return config;
}

EngineConfig EngineConfig::from_yaml(const YAML::Node &node) {
  EngineConfig config;
  if (!node || node.IsNull())
    return config;
  if (!node.IsMap())
    throw SchemaError("config must be a mapping", "/");

  for (const auto &entry : node) {
    auto key = entry.first.as<std::string>();
    const YAML::Node &value = entry.second;
    if (!value.IsScalar() && !value.IsNull())
      throw SchemaError("expected a scalar", "/" + key);

    if (key == "log_file") {
      config.log_file = value.IsNull() ? "" : value.as<std::string>();
    } else if (key == "log_level") {
      config.log_level = parse_log_level(value.as<std::string>());
    } else if (key == "parallel_async") {
      config.parallel_async = parse_bool(value.as<std::string>(), "/" + key);
    } else if (key == "max_concurrency") {
      config.max_concurrency = parse_count(value.as<std::string>(), "/" + key);
    } else {
      throw SchemaError(fmt::format("unknown config key '{}'", key), "/" + key);
    }
  }
  return config;
}

EngineConfig EngineConfig::from_environment() {
  EngineConfig config;
  config.apply_environment();
  return config;
}

void EngineConfig::apply_environment() {
  if (const char *level = std::getenv("SCHEMAKIT_LOG_LEVEL"))
    log_level = parse_log_level(level);
  if (const char *file = std::getenv("SCHEMAKIT_LOG_FILE"))
    log_file = file;
  if (const char *parallel = std::getenv("SCHEMAKIT_PARALLEL_ASYNC"))
    parallel_async = parse_bool(parallel, "SCHEMAKIT_PARALLEL_ASYNC");
  if (const char *workers = std::getenv("SCHEMAKIT_MAX_CONCURRENCY"))
    max_concurrency = parse_count(workers, "SCHEMAKIT_MAX_CONCURRENCY");
}

engine::AsyncOptions EngineConfig::async_options() const {
  engine::AsyncOptions options;
  options.parallel = parallel_async;
  options.max_concurrency = max_concurrency;
  return options;
}

} // namespace schemakit
