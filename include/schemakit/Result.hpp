#pragma once
#include "schemakit/Issue.hpp"
#include "schemakit/Value.hpp"
#include "schemakit/export.h"

#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace schemakit {

/// Raised when a schema is built incorrectly (duplicate field, constraint on
/// the wrong kind, malformed schema description)
class SCHEMAKIT_API SchemaError : public std::runtime_error {
public:
  explicit SchemaError(const std::string &message, std::string where = "")
      : std::runtime_error(where.empty() ? message : where + ": " + message),
        where_(std::move(where)) {}

  const std::string &where() const { return where_; }

private:
  std::string where_;
};

/// Form-friendly view of a failure: root-level messages plus messages keyed
/// by the first path segment
struct SCHEMAKIT_API FlattenedErrors {
  std::vector<std::string> form_errors;
  std::map<std::string, std::vector<std::string>> field_errors;

  nlohmann::json to_json() const;
};

/// Aggregated failure raised by parse()/parse_async(), holding every issue
class SCHEMAKIT_API ValidationError : public std::runtime_error {
public:
  explicit ValidationError(std::vector<Issue> issues);

  const std::vector<Issue> &issues() const { return issues_; }

  FlattenedErrors flatten() const;
  // {"issues": [...]} suitable for a 4xx response body
  nlohmann::json to_json() const;

private:
  static std::string summarize(const std::vector<Issue> &issues);

  std::vector<Issue> issues_;
};

/// Success(value) | Failure(non-empty issue list)
class SCHEMAKIT_API Result {
public:
  static Result success(Value value);
  // Throws std::invalid_argument on an empty issue list
  static Result failure(std::vector<Issue> issues);

  bool ok() const { return issues_.empty(); }
  explicit operator bool() const { return ok(); }

  // Throws std::logic_error when called on a failure
  const Value &value() const;
  const std::vector<Issue> &issues() const { return issues_; }

  bool operator==(const Result &other) const {
    return value_ == other.value_ && issues_ == other.issues_;
  }
  bool operator!=(const Result &other) const { return !(*this == other); }

private:
  Result() = default;

  Value value_;
  std::vector<Issue> issues_;
};

/// Outcome of safe_parse(): {success, data} or {success, error}
struct SCHEMAKIT_API SafeParseResult {
  bool success{false};
  Value data;
  std::optional<ValidationError> error;

  static SafeParseResult from_result(const Result &result);
};

} // namespace schemakit
