#include "schemakit/Checks.hpp"
#include "schemakit/Result.hpp"

#include <cmath>
#include <fmt/format.h>

namespace schemakit {

namespace {

const std::regex &email_regex() {
  static const std::regex re(
      R"(^(?!\.)(?!.*\.\.)([A-Z0-9_'+\-\.]*)[A-Z0-9_+\-]@([A-Z0-9][A-Z0-9\-]*\.)+[A-Z]{2,}$)",
      std::regex::ECMAScript | std::regex::icase);
  return re;
}

const std::regex &url_regex() {
  static const std::regex re(R"(^[a-zA-Z][a-zA-Z0-9+.\-]*://[^\s/?#]+([/?#]\S*)?$)",
                             std::regex::ECMAScript);
  return re;
}

const std::regex &uuid_regex() {
  static const std::regex re(
      R"(^[0-9a-fA-F]{8}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-[0-9a-fA-F]{12}$)",
      std::regex::ECMAScript);
  return re;
}

// Length in code points; continuation bytes are not counted
std::size_t utf8_length(const std::string &s) {
  std::size_t n = 0;
  for (unsigned char c : s) {
    if ((c & 0xC0) != 0x80)
      ++n;
  }
  return n;
}

bool is_multiple_of(double value, double divisor) {
  if (divisor == 0)
    return false;
  double q = value / divisor;
  return std::fabs(q - std::round(q)) < 1e-9;
}

Issue format_issue(const Path &path, nlohmann::json validation,
                   const std::string &message) {
  Issue issue;
  issue.code = IssueCode::InvalidStringFormat;
  issue.path = path;
  issue.message = message;
  issue.params = {{"validation", std::move(validation)}};
  return issue;
}

Check make(CheckKind kind, std::string message) {
  Check c;
  c.kind = kind;
  c.message = std::move(message);
  return c;
}

std::string length_type(const Value &value) {
  return value.is_array() ? "array" : "string";
}

std::size_t length_of(const Value &value) {
  if (value.is_array())
    return value.as_array().size();
  return utf8_length(value.as_string());
}

} // namespace

namespace checks {

Check min_length(std::size_t n, std::string message) {
  Check c = make(CheckKind::MinLength, std::move(message));
  c.number = static_cast<double>(n);
  return c;
}

Check max_length(std::size_t n, std::string message) {
  Check c = make(CheckKind::MaxLength, std::move(message));
  c.number = static_cast<double>(n);
  return c;
}

Check length(std::size_t n, std::string message) {
  Check c = make(CheckKind::Length, std::move(message));
  c.number = static_cast<double>(n);
  return c;
}

Check regex(const std::string &pattern, std::string message) {
  Check c = make(CheckKind::Regex, std::move(message));
  c.text = pattern;
  try {
    c.pattern = std::make_shared<const std::regex>(pattern);
  } catch (const std::regex_error &e) {
    throw SchemaError(fmt::format("invalid regex '{}': {}", pattern, e.what()));
  }
  return c;
}

Check email(std::string message) {
  return make(CheckKind::Email, std::move(message));
}

Check url(std::string message) { return make(CheckKind::Url, std::move(message)); }

Check uuid(std::string message) {
  return make(CheckKind::Uuid, std::move(message));
}

Check starts_with(std::string prefix, std::string message) {
  Check c = make(CheckKind::StartsWith, std::move(message));
  c.text = std::move(prefix);
  return c;
}

Check ends_with(std::string suffix, std::string message) {
  Check c = make(CheckKind::EndsWith, std::move(message));
  c.text = std::move(suffix);
  return c;
}

Check includes(std::string needle, std::string message) {
  Check c = make(CheckKind::Includes, std::move(message));
  c.text = std::move(needle);
  return c;
}

Check integer(std::string message) {
  return make(CheckKind::Int, std::move(message));
}

Check min(double bound, bool inclusive, std::string message) {
  Check c = make(CheckKind::Min, std::move(message));
  c.number = bound;
  c.inclusive = inclusive;
  return c;
}

Check max(double bound, bool inclusive, std::string message) {
  Check c = make(CheckKind::Max, std::move(message));
  c.number = bound;
  c.inclusive = inclusive;
  return c;
}

Check multiple_of(double divisor, std::string message) {
  if (divisor == 0)
    throw SchemaError("multiple_of divisor must be non-zero");
  Check c = make(CheckKind::MultipleOf, std::move(message));
  c.number = divisor;
  return c;
}

Check finite(std::string message) {
  return make(CheckKind::Finite, std::move(message));
}

Check min_date(const Date &bound, std::string message) {
  if (!bound.valid)
    throw SchemaError("min_date bound must be a valid date");
  Check c = make(CheckKind::MinDate, std::move(message));
  c.number = static_cast<double>(bound.millis());
  return c;
}

Check max_date(const Date &bound, std::string message) {
  if (!bound.valid)
    throw SchemaError("max_date bound must be a valid date");
  Check c = make(CheckKind::MaxDate, std::move(message));
  c.number = static_cast<double>(bound.millis());
  return c;
}

} // namespace checks

bool run_checks(const std::vector<Check> &list, const Value &value,
                const Path &path, std::vector<Issue> &out) {
  std::size_t before = out.size();

  for (const auto &check : list) {
    switch (check.kind) {
    case CheckKind::MinLength: {
      if (length_of(value) < check.number) {
        out.push_back(issues::too_small(path, length_type(value), check.number,
                                        true, false, check.message));
      }
      break;
    }
    case CheckKind::MaxLength: {
      if (length_of(value) > check.number) {
        out.push_back(issues::too_big(path, length_type(value), check.number,
                                      true, false, check.message));
      }
      break;
    }
    case CheckKind::Length: {
      std::size_t len = length_of(value);
      if (len < check.number) {
        out.push_back(issues::too_small(path, length_type(value), check.number,
                                        true, true, check.message));
      } else if (len > check.number) {
        out.push_back(issues::too_big(path, length_type(value), check.number,
                                      true, true, check.message));
      }
      break;
    }
    case CheckKind::Regex: {
      if (!std::regex_search(value.as_string(), *check.pattern)) {
        out.push_back(format_issue(path, "regex",
                                   check.message.empty() ? "Invalid"
                                                         : check.message));
      }
      break;
    }
    case CheckKind::Email: {
      if (!std::regex_match(value.as_string(), email_regex())) {
        out.push_back(format_issue(
            path, "email",
            check.message.empty() ? "Invalid email" : check.message));
      }
      break;
    }
    case CheckKind::Url: {
      if (!std::regex_match(value.as_string(), url_regex())) {
        out.push_back(format_issue(
            path, "url", check.message.empty() ? "Invalid url" : check.message));
      }
      break;
    }
    case CheckKind::Uuid: {
      if (!std::regex_match(value.as_string(), uuid_regex())) {
        out.push_back(format_issue(
            path, "uuid",
            check.message.empty() ? "Invalid uuid" : check.message));
      }
      break;
    }
    case CheckKind::StartsWith: {
      const auto &s = value.as_string();
      if (s.compare(0, check.text.size(), check.text) != 0 ||
          s.size() < check.text.size()) {
        out.push_back(format_issue(
            path, {{"startsWith", check.text}},
            check.message.empty()
                ? fmt::format("Invalid input: must start with \"{}\"",
                              check.text)
                : check.message));
      }
      break;
    }
    case CheckKind::EndsWith: {
      const auto &s = value.as_string();
      bool ok = s.size() >= check.text.size() &&
                s.compare(s.size() - check.text.size(), check.text.size(),
                          check.text) == 0;
      if (!ok) {
        out.push_back(format_issue(
            path, {{"endsWith", check.text}},
            check.message.empty()
                ? fmt::format("Invalid input: must end with \"{}\"", check.text)
                : check.message));
      }
      break;
    }
    case CheckKind::Includes: {
      if (value.as_string().find(check.text) == std::string::npos) {
        out.push_back(format_issue(
            path, {{"includes", check.text}},
            check.message.empty()
                ? fmt::format("Invalid input: must include \"{}\"", check.text)
                : check.message));
      }
      break;
    }
    case CheckKind::Int: {
      double n = value.as_number();
      if (!std::isfinite(n) || std::floor(n) != n) {
        Issue issue = issues::invalid_type(path, "integer", "float");
        if (!check.message.empty())
          issue.message = check.message;
        out.push_back(std::move(issue));
      }
      break;
    }
    case CheckKind::Min: {
      double n = value.as_number();
      bool ok = check.inclusive ? n >= check.number : n > check.number;
      if (!ok) {
        out.push_back(issues::too_small(path, "number", check.number,
                                        check.inclusive, false, check.message));
      }
      break;
    }
    case CheckKind::Max: {
      double n = value.as_number();
      bool ok = check.inclusive ? n <= check.number : n < check.number;
      if (!ok) {
        out.push_back(issues::too_big(path, "number", check.number,
                                      check.inclusive, false, check.message));
      }
      break;
    }
    case CheckKind::MultipleOf: {
      if (!is_multiple_of(value.as_number(), check.number)) {
        Issue issue;
        issue.code = IssueCode::NotMultipleOf;
        issue.path = path;
        issue.params = {{"multipleOf", check.number}};
        issue.message =
            check.message.empty()
                ? fmt::format("Number must be a multiple of {}",
                              Value(check.number).describe())
                : check.message;
        out.push_back(std::move(issue));
      }
      break;
    }
    case CheckKind::Finite: {
      if (!std::isfinite(value.as_number())) {
        Issue issue;
        issue.code = IssueCode::NotFinite;
        issue.path = path;
        issue.message =
            check.message.empty() ? "Number must be finite" : check.message;
        out.push_back(std::move(issue));
      }
      break;
    }
    case CheckKind::MinDate: {
      if (static_cast<double>(value.as_date().millis()) < check.number) {
        out.push_back(issues::too_small(path, "date", check.number, true,
                                        false, check.message));
      }
      break;
    }
    case CheckKind::MaxDate: {
      if (static_cast<double>(value.as_date().millis()) > check.number) {
        out.push_back(issues::too_big(path, "date", check.number, true, false,
                                      check.message));
      }
      break;
    }
    }
  }

  return out.size() == before;
}

} // namespace schemakit
