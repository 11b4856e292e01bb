#pragma once
#include "schemakit/export.h"

#include <cstddef>
#include <nlohmann/json.hpp>
#include <string>
#include <variant>
#include <vector>

namespace schemakit {

enum class IssueCode {
  InvalidType,
  InvalidLiteral,
  InvalidEnumValue,
  UnrecognizedKeys,
  InvalidUnion,
  InvalidUnionDiscriminator,
  InvalidIntersectionTypes,
  TooSmall,
  TooBig,
  NotMultipleOf,
  NotFinite,
  InvalidStringFormat,
  InvalidDate,
  AsyncEffectEncountered,
  Custom
};

/// snake_case name, e.g. "invalid_type"
SCHEMAKIT_API std::string issue_code_name(IssueCode code);

/// Field name or array/tuple index
using PathSegment = std::variant<std::string, std::size_t>;
using Path = std::vector<PathSegment>;

/// Renders a path as `a.b[0].c`; the root renders as an empty string
SCHEMAKIT_API std::string path_to_string(const Path &path);
SCHEMAKIT_API nlohmann::json path_to_json(const Path &path);

struct SCHEMAKIT_API Issue {
  IssueCode code{IssueCode::Custom};
  Path path;
  std::string message;
  // Kind-specific data (expected/received, minimum, keys, options...)
  nlohmann::json params = nlohmann::json::object();
  // Per-alternative issues for InvalidUnion
  std::vector<std::vector<Issue>> union_errors;

  nlohmann::json to_json() const;

  bool operator==(const Issue &other) const;
  bool operator!=(const Issue &other) const { return !(*this == other); }
};

/// Multi-line "  - path: message" listing, used by error messages and the CLI
SCHEMAKIT_API std::string format_issues(const std::vector<Issue> &issues);

// Issue builders shared by the engine and the effect pipeline
namespace issues {

SCHEMAKIT_API Issue invalid_type(const Path &path, const std::string &expected,
                                 const std::string &received);
SCHEMAKIT_API Issue too_small(const Path &path, const std::string &type,
                              double minimum, bool inclusive, bool exact,
                              const std::string &message);
SCHEMAKIT_API Issue too_big(const Path &path, const std::string &type,
                            double maximum, bool inclusive, bool exact,
                            const std::string &message);
SCHEMAKIT_API Issue custom(const Path &path, const std::string &message,
                           nlohmann::json params = nlohmann::json::object());

} // namespace issues

} // namespace schemakit
