#include "schemakit/Logger.hpp"

#include <cstdio>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <vector>

namespace schemakit {

namespace {
constexpr std::size_t kMaxLogBytes = 5 * 1024 * 1024;
constexpr std::size_t kMaxLogFiles = 3;
} // namespace

// Defined out of line so every module shares one instance
SchemaLogger &SchemaLogger::instance() {
  static SchemaLogger logger;
  return logger;
}

void SchemaLogger::init(const std::string &log_file,
                        spdlog::level::level_enum level) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (logger_) {
    logger_->set_level(level);
    return;
  }

  try {
    auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console->set_level(spdlog::level::warn);

    std::vector<spdlog::sink_ptr> sinks{console};
    if (!log_file.empty()) {
      sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
          log_file, kMaxLogBytes, kMaxLogFiles));
    }

    logger_ = std::make_shared<spdlog::logger>("schemakit", sinks.begin(),
                                               sinks.end());
    logger_->set_level(level);
    logger_->flush_on(spdlog::level::warn);

    if (!spdlog::get("schemakit"))
      spdlog::register_logger(logger_);
  } catch (const spdlog::spdlog_ex &ex) {
    fmt::print(stderr, "Log initialization failed: {}\n", ex.what());
    logger_.reset();
  }
}

void SchemaLogger::shutdown() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (logger_)
    logger_->flush();
  spdlog::drop("schemakit");
  logger_.reset();
}

bool SchemaLogger::initialized() {
  std::lock_guard<std::mutex> lock(mutex_);
  return logger_ != nullptr;
}

} // namespace schemakit
