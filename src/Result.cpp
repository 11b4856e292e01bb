#include "schemakit/Result.hpp"

#include <fmt/format.h>

namespace schemakit {

nlohmann::json FlattenedErrors::to_json() const {
  nlohmann::json j;
  j["formErrors"] = form_errors;
  j["fieldErrors"] = nlohmann::json::object();
  for (const auto &[field, messages] : field_errors) {
    j["fieldErrors"][field] = messages;
  }
  return j;
}

ValidationError::ValidationError(std::vector<Issue> issues)
    : std::runtime_error(summarize(issues)), issues_(std::move(issues)) {}

std::string ValidationError::summarize(const std::vector<Issue> &issues) {
  return fmt::format("Validation failed with {} issue(s)\n{}", issues.size(),
                     format_issues(issues));
}

FlattenedErrors ValidationError::flatten() const {
  FlattenedErrors out;
  for (const auto &issue : issues_) {
    if (issue.path.empty()) {
      out.form_errors.push_back(issue.message);
      continue;
    }
    const auto &head = issue.path.front();
    std::string key = std::holds_alternative<std::string>(head)
                          ? std::get<std::string>(head)
                          : std::to_string(std::get<std::size_t>(head));
    out.field_errors[key].push_back(issue.message);
  }
  return out;
}

nlohmann::json ValidationError::to_json() const {
  nlohmann::json list = nlohmann::json::array();
  for (const auto &issue : issues_) {
    list.push_back(issue.to_json());
  }
  nlohmann::json j;
  j["issues"] = list;
  return j;
}

Result Result::success(Value value) {
  Result r;
  r.value_ = std::move(value);
  return r;
}

Result Result::failure(std::vector<Issue> issues) {
  if (issues.empty()) {
    throw std::invalid_argument("Result::failure requires at least one issue");
  }
  Result r;
  r.issues_ = std::move(issues);
  return r;
}

const Value &Result::value() const {
  if (!ok()) {
    throw std::logic_error("Result::value() called on a failed result");
  }
  return value_;
}

SafeParseResult SafeParseResult::from_result(const Result &result) {
  SafeParseResult out;
  out.success = result.ok();
  if (result.ok()) {
    out.data = result.value();
  } else {
    out.error.emplace(result.issues());
  }
  return out;
}

} // namespace schemakit
