#pragma once
#include "schemakit/export.h"

#include <fmt/format.h>
#include <memory>
#include <mutex>
#include <spdlog/spdlog.h>
#include <string>

namespace schemakit {

/// Process-wide "schemakit" spdlog logger. Messages carry a component and a
/// tag: "[ENGINE] [ASYNC] ...". Logging before init() is a no-op.
class SCHEMAKIT_API SchemaLogger {
public:
  static SchemaLogger &instance();

  // Console sink at warn and above, plus a rotating file sink unless
  // log_file is empty. A second call only changes the level.
  void init(const std::string &log_file = "schemakit.log",
            spdlog::level::level_enum level = spdlog::level::info);

  // Drops the registered logger so a later init() recreates the sinks
  void shutdown();

  bool initialized();

  template <typename... Args>
  void log(spdlog::level::level_enum level, const std::string &component,
           const std::string &tag, const std::string &fmt_str,
           Args &&...args) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!logger_ || !logger_->should_log(level))
      return;

    logger_->log(level, fmt::format("[{}] [{}] {}", component, tag,
                                    fmt::format(fmt::runtime(fmt_str),
                                                std::forward<Args>(args)...)));
  }

private:
  SchemaLogger() = default;

  std::shared_ptr<spdlog::logger> logger_;
  std::mutex mutex_;
};

#define SK_LOG_TRACE(component, tag, ...)                                      \
  schemakit::SchemaLogger::instance().log(spdlog::level::trace, component,     \
                                          tag, __VA_ARGS__)
#define SK_LOG_DEBUG(component, tag, ...)                                      \
  schemakit::SchemaLogger::instance().log(spdlog::level::debug, component,     \
                                          tag, __VA_ARGS__)
#define SK_LOG_INFO(component, tag, ...)                                       \
  schemakit::SchemaLogger::instance().log(spdlog::level::info, component, tag, \
                                          __VA_ARGS__)
#define SK_LOG_WARN(component, tag, ...)                                       \
  schemakit::SchemaLogger::instance().log(spdlog::level::warn, component, tag, \
                                          __VA_ARGS__)
#define SK_LOG_ERROR(component, tag, ...)                                      \
  schemakit::SchemaLogger::instance().log(spdlog::level::err, component, tag,  \
                                          __VA_ARGS__)

} // namespace schemakit
