#include "schemakit/ValueConversion.hpp"

#include <cmath>
#include <cstdio>
#include <string>

namespace schemakit {

namespace {

// Days since 1970-01-01 for a proleptic Gregorian date
int64_t days_from_civil(int64_t y, unsigned m, unsigned d) {
  y -= m <= 2;
  const int64_t era = (y >= 0 ? y : y - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

bool is_leap(int y) { return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0; }

int days_in_month(int y, int m) {
  static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (m == 2 && is_leap(y))
    return 29;
  return days[m - 1];
}

bool is_null_scalar(const std::string &s) {
  return s.empty() || s == "~" || s == "null" || s == "Null" || s == "NULL";
}

} // namespace

Date parse_iso_date(const std::string &text) {
  int y = 0, mo = 0, d = 0, h = 0, mi = 0, s = 0, ms = 0;
  int consumed = 0;

  if (text.size() == 10) {
    if (std::sscanf(text.c_str(), "%4d-%2d-%2d%n", &y, &mo, &d, &consumed) != 3 ||
        consumed != 10)
      return Date::invalid();
  } else {
    char zone = 0;
    int matched = std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d.%3d%c%n",
                              &y, &mo, &d, &h, &mi, &s, &ms, &zone, &consumed);
    if (matched != 8) {
      ms = 0;
      consumed = 0;
      matched = std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%c%n", &y, &mo,
                            &d, &h, &mi, &s, &zone, &consumed);
      if (matched != 7)
        return Date::invalid();
    }
    if (zone != 'Z' || static_cast<std::size_t>(consumed) != text.size())
      return Date::invalid();
  }

  if (mo < 1 || mo > 12 || d < 1 || d > days_in_month(y, mo) || h > 23 ||
      mi > 59 || s > 59 || h < 0 || mi < 0 || s < 0 || ms < 0)
    return Date::invalid();

  int64_t days = days_from_civil(y, static_cast<unsigned>(mo),
                                 static_cast<unsigned>(d));
  int64_t millis = ((days * 24 + h) * 60 + mi) * 60 * 1000 +
                   static_cast<int64_t>(s) * 1000 + ms;
  return Date::from_millis(millis);
}

nlohmann::json value_to_json(const Value &value) {
  switch (value.kind()) {
  case ValueKind::Undefined:
  case ValueKind::Null:
    return nullptr;
  case ValueKind::Boolean:
    return value.as_bool();
  case ValueKind::Number: {
    double n = value.as_number();
    // Integral values serialize without a fractional part
    if (std::isfinite(n) && std::floor(n) == n && std::fabs(n) < 9.0e15)
      return static_cast<int64_t>(n);
    return n;
  }
  case ValueKind::String:
    return value.as_string();
  case ValueKind::Date:
    if (!value.as_date().valid)
      return nullptr;
    return value.as_date().to_iso_string();
  case ValueKind::Array: {
    nlohmann::json j = nlohmann::json::array();
    for (const auto &item : value.as_array())
      j.push_back(value_to_json(item));
    return j;
  }
  case ValueKind::Object: {
    nlohmann::json j = nlohmann::json::object();
    for (const auto &[key, member] : value.as_object()) {
      if (member.is_undefined())
        continue;
      j[key] = value_to_json(member);
    }
    return j;
  }
  }
  return nullptr;
}

Value json_to_value(const nlohmann::json &j) {
  switch (j.type()) {
  case nlohmann::json::value_t::null:
    return Value(nullptr);
  case nlohmann::json::value_t::boolean:
    return Value(j.get<bool>());
  case nlohmann::json::value_t::number_integer:
  case nlohmann::json::value_t::number_unsigned:
  case nlohmann::json::value_t::number_float:
    return Value(j.get<double>());
  case nlohmann::json::value_t::string:
    return Value(j.get<std::string>());
  case nlohmann::json::value_t::array: {
    ValueArray arr;
    arr.reserve(j.size());
    for (const auto &item : j)
      arr.push_back(json_to_value(item));
    return Value(std::move(arr));
  }
  case nlohmann::json::value_t::object: {
    ValueObject obj;
    for (auto it = j.begin(); it != j.end(); ++it)
      obj.emplace(it.key(), json_to_value(it.value()));
    return Value(std::move(obj));
  }
  default:
    // binary and discarded values have no Value counterpart
    return Value();
  }
}

Value yaml_to_value(const YAML::Node &node) {
  if (!node.IsDefined())
    return Value();

  switch (node.Type()) {
  case YAML::NodeType::Null:
    return Value(nullptr);
  case YAML::NodeType::Scalar: {
    const std::string &text = node.Scalar();
    // Quoted scalars carry the "!" tag
    if (node.Tag() == "!")
      return Value(text);
    if (is_null_scalar(text))
      return Value(nullptr);
    bool b = false;
    if (YAML::convert<bool>::decode(node, b))
      return Value(b);
    double n = 0;
    if (YAML::convert<double>::decode(node, n))
      return Value(n);
    return Value(text);
  }
  case YAML::NodeType::Sequence: {
    ValueArray arr;
    for (const auto &item : node)
      arr.push_back(yaml_to_value(item));
    return Value(std::move(arr));
  }
  case YAML::NodeType::Map: {
    ValueObject obj;
    for (const auto &entry : node)
      obj.emplace(entry.first.as<std::string>(), yaml_to_value(entry.second));
    return Value(std::move(obj));
  }
  case YAML::NodeType::Undefined:
    break;
  }
  return Value();
}

} // namespace schemakit
