#pragma once
#include "schemakit/Issue.hpp"
#include "schemakit/Value.hpp"
#include "schemakit/export.h"

#include <memory>
#include <regex>
#include <string>
#include <vector>

namespace schemakit {

enum class CheckKind {
  MinLength,
  MaxLength,
  Length,
  Regex,
  Email,
  Url,
  Uuid,
  StartsWith,
  EndsWith,
  Includes,
  Int,
  Min, // number lower bound; `inclusive` distinguishes gte from gt
  Max,
  MultipleOf,
  Finite,
  MinDate,
  MaxDate
};

/// One constraint attached to a String, Number, Array or Date node
struct SCHEMAKIT_API Check {
  CheckKind kind{CheckKind::MinLength};
  double number{0};     // bound, divisor, or milliseconds for dates
  bool inclusive{true}; // Min/Max only
  std::string text;     // prefix, suffix, substring or regex source
  std::shared_ptr<const std::regex> pattern;
  std::string message; // empty selects the default message
};

namespace checks {

SCHEMAKIT_API Check min_length(std::size_t n, std::string message = "");
SCHEMAKIT_API Check max_length(std::size_t n, std::string message = "");
SCHEMAKIT_API Check length(std::size_t n, std::string message = "");
// Throws SchemaError if the pattern does not compile
SCHEMAKIT_API Check regex(const std::string &pattern, std::string message = "");
SCHEMAKIT_API Check email(std::string message = "");
SCHEMAKIT_API Check url(std::string message = "");
SCHEMAKIT_API Check uuid(std::string message = "");
SCHEMAKIT_API Check starts_with(std::string prefix, std::string message = "");
SCHEMAKIT_API Check ends_with(std::string suffix, std::string message = "");
SCHEMAKIT_API Check includes(std::string needle, std::string message = "");
SCHEMAKIT_API Check integer(std::string message = "");
SCHEMAKIT_API Check min(double bound, bool inclusive, std::string message = "");
SCHEMAKIT_API Check max(double bound, bool inclusive, std::string message = "");
SCHEMAKIT_API Check multiple_of(double divisor, std::string message = "");
SCHEMAKIT_API Check finite(std::string message = "");
SCHEMAKIT_API Check min_date(const Date &bound, std::string message = "");
SCHEMAKIT_API Check max_date(const Date &bound, std::string message = "");

} // namespace checks

/// Evaluates every check against a value already known to be of the node's
/// kind and appends one issue per failing check. Returns true if all passed.
SCHEMAKIT_API bool run_checks(const std::vector<Check> &list,
                              const Value &value, const Path &path,
                              std::vector<Issue> &out);

} // namespace schemakit
