#include "schemakit/Issue.hpp"
#include "schemakit/Value.hpp"

#include <fmt/format.h>

namespace schemakit {

std::string issue_code_name(IssueCode code) {
  switch (code) {
  case IssueCode::InvalidType:
    return "invalid_type";
  case IssueCode::InvalidLiteral:
    return "invalid_literal";
  case IssueCode::InvalidEnumValue:
    return "invalid_enum_value";
  case IssueCode::UnrecognizedKeys:
    return "unrecognized_keys";
  case IssueCode::InvalidUnion:
    return "invalid_union";
  case IssueCode::InvalidUnionDiscriminator:
    return "invalid_union_discriminator";
  case IssueCode::InvalidIntersectionTypes:
    return "invalid_intersection_types";
  case IssueCode::TooSmall:
    return "too_small";
  case IssueCode::TooBig:
    return "too_big";
  case IssueCode::NotMultipleOf:
    return "not_multiple_of";
  case IssueCode::NotFinite:
    return "not_finite";
  case IssueCode::InvalidStringFormat:
    return "invalid_string";
  case IssueCode::InvalidDate:
    return "invalid_date";
  case IssueCode::AsyncEffectEncountered:
    return "async_effect_encountered";
  case IssueCode::Custom:
    return "custom";
  }
  return "unknown";
}

std::string path_to_string(const Path &path) {
  std::string out;
  for (const auto &seg : path) {
    if (const auto *key = std::get_if<std::string>(&seg)) {
      if (!out.empty())
        out += ".";
      out += *key;
    } else {
      out += fmt::format("[{}]", std::get<std::size_t>(seg));
    }
  }
  return out;
}

nlohmann::json path_to_json(const Path &path) {
  nlohmann::json j = nlohmann::json::array();
  for (const auto &seg : path) {
    if (const auto *key = std::get_if<std::string>(&seg)) {
      j.push_back(*key);
    } else {
      j.push_back(std::get<std::size_t>(seg));
    }
  }
  return j;
}

nlohmann::json Issue::to_json() const {
  nlohmann::json j;
  j["code"] = issue_code_name(code);
  j["path"] = path_to_json(path);
  j["message"] = message;
  // Params sit beside the fixed members but never replace them
  if (params.is_object()) {
    for (const auto &[key, val] : params.items()) {
      if (key == "code" || key == "path" || key == "message" ||
          key == "unionErrors")
        continue;
      j[key] = val;
    }
  }
  if (!union_errors.empty()) {
    nlohmann::json alternatives = nlohmann::json::array();
    for (const auto &branch : union_errors) {
      nlohmann::json list = nlohmann::json::array();
      for (const auto &issue : branch) {
        list.push_back(issue.to_json());
      }
      alternatives.push_back(list);
    }
    j["unionErrors"] = alternatives;
  }
  return j;
}

bool Issue::operator==(const Issue &other) const {
  return code == other.code && path == other.path &&
         message == other.message && params == other.params &&
         union_errors == other.union_errors;
}

std::string format_issues(const std::vector<Issue> &issues) {
  std::string out;
  for (const auto &issue : issues) {
    std::string where = path_to_string(issue.path);
    out += fmt::format("  - {}: {} ({})\n", where.empty() ? "<root>" : where,
                       issue.message, issue_code_name(issue.code));
  }
  return out;
}

namespace issues {

namespace {

std::string format_bound(const std::string &type, double bound) {
  if (type == "date")
    return Date::from_millis(static_cast<int64_t>(bound)).to_iso_string();
  return Value(bound).describe();
}

} // namespace

Issue invalid_type(const Path &path, const std::string &expected,
                   const std::string &received) {
  Issue issue;
  issue.code = IssueCode::InvalidType;
  issue.path = path;
  issue.params = {{"expected", expected}, {"received", received}};
  if (received == "undefined") {
    issue.message = "Required";
  } else {
    issue.message = fmt::format("Expected {}, received {}", expected, received);
  }
  return issue;
}

Issue too_small(const Path &path, const std::string &type, double minimum,
                bool inclusive, bool exact, const std::string &message) {
  Issue issue;
  issue.code = IssueCode::TooSmall;
  issue.path = path;
  issue.params = {{"type", type},
                  {"minimum", minimum},
                  {"inclusive", inclusive},
                  {"exact", exact}};
  if (!message.empty()) {
    issue.message = message;
    return issue;
  }

  std::string bound = format_bound(type, minimum);
  if (type == "string" || type == "array") {
    std::string unit = type == "string" ? "character(s)" : "element(s)";
    std::string what = type == "string" ? "String" : "Array";
    if (exact) {
      issue.message =
          fmt::format("{} must contain exactly {} {}", what, bound, unit);
    } else {
      issue.message = fmt::format("{} must contain {} {} {}", what,
                                  inclusive ? "at least" : "over", bound, unit);
    }
  } else if (type == "date") {
    issue.message =
        fmt::format("Date must be {} {}",
                    inclusive ? "greater than or equal to" : "greater than",
                    bound);
  } else {
    issue.message =
        fmt::format("Number must be {} {}",
                    inclusive ? "greater than or equal to" : "greater than",
                    bound);
  }
  return issue;
}

Issue too_big(const Path &path, const std::string &type, double maximum,
              bool inclusive, bool exact, const std::string &message) {
  Issue issue;
  issue.code = IssueCode::TooBig;
  issue.path = path;
  issue.params = {{"type", type},
                  {"maximum", maximum},
                  {"inclusive", inclusive},
                  {"exact", exact}};
  if (!message.empty()) {
    issue.message = message;
    return issue;
  }

  std::string bound = format_bound(type, maximum);
  if (type == "string" || type == "array") {
    std::string unit = type == "string" ? "character(s)" : "element(s)";
    std::string what = type == "string" ? "String" : "Array";
    if (exact) {
      issue.message =
          fmt::format("{} must contain exactly {} {}", what, bound, unit);
    } else {
      issue.message =
          fmt::format("{} must contain {} {} {}", what,
                      inclusive ? "at most" : "under", bound, unit);
    }
  } else if (type == "date") {
    issue.message = fmt::format(
        "Date must be {} {}",
        inclusive ? "smaller than or equal to" : "smaller than", bound);
  } else {
    issue.message =
        fmt::format("Number must be {} {}",
                    inclusive ? "less than or equal to" : "less than", bound);
  }
  return issue;
}

Issue custom(const Path &path, const std::string &message,
             nlohmann::json params) {
  Issue issue;
  issue.code = IssueCode::Custom;
  issue.path = path;
  issue.message = message.empty() ? "Invalid input" : message;
  issue.params = std::move(params);
  return issue;
}

} // namespace issues

} // namespace schemakit
