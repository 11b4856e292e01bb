#include "schemakit/Value.hpp"

#include <cmath>
#include <ctime>
#include <fmt/format.h>

namespace schemakit {

Date Date::from_millis(int64_t ms_since_epoch) {
  Date d;
  d.time = std::chrono::system_clock::time_point(
      std::chrono::duration_cast<std::chrono::system_clock::duration>(
          std::chrono::milliseconds(ms_since_epoch)));
  d.valid = true;
  return d;
}

int64_t Date::millis() const {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             time.time_since_epoch())
      .count();
}

std::string Date::to_iso_string() const {
  if (!valid)
    return "Invalid Date";

  int64_t ms = millis();
  int64_t secs = ms / 1000;
  int64_t rem = ms % 1000;
  if (rem < 0) {
    rem += 1000;
    secs -= 1;
  }
  std::time_t tt = static_cast<std::time_t>(secs);
  std::tm tm{};
#ifdef _WIN32
  gmtime_s(&tm, &tt);
#else
  gmtime_r(&tt, &tm);
#endif
  return fmt::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}.{:03d}Z",
                     tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour,
                     tm.tm_min, tm.tm_sec, static_cast<int>(rem));
}

Value Value::get(const std::string &key) const {
  if (!is_object())
    return Value();
  const auto &obj = as_object();
  auto it = obj.find(key);
  if (it == obj.end())
    return Value();
  return it->second;
}

bool Value::contains(const std::string &key) const {
  return is_object() && as_object().count(key) > 0;
}

std::string Value::describe() const {
  switch (kind()) {
  case ValueKind::Undefined:
    return "undefined";
  case ValueKind::Null:
    return "null";
  case ValueKind::Boolean:
    return as_bool() ? "true" : "false";
  case ValueKind::Number: {
    double n = as_number();
    if (std::isnan(n))
      return "NaN";
    if (std::isinf(n))
      return n > 0 ? "Infinity" : "-Infinity";
    if (std::floor(n) == n && std::fabs(n) < 1e15)
      return fmt::format("{}", static_cast<int64_t>(n));
    return fmt::format("{}", n);
  }
  case ValueKind::String:
    return fmt::format("\"{}\"", as_string());
  case ValueKind::Date:
    return as_date().to_iso_string();
  case ValueKind::Array:
    return fmt::format("array({})", as_array().size());
  case ValueKind::Object:
    return fmt::format("object({})", as_object().size());
  }
  return "unknown";
}

std::string value_kind_name(ValueKind kind) {
  switch (kind) {
  case ValueKind::Undefined:
    return "undefined";
  case ValueKind::Null:
    return "null";
  case ValueKind::Boolean:
    return "boolean";
  case ValueKind::Number:
    return "number";
  case ValueKind::String:
    return "string";
  case ValueKind::Date:
    return "date";
  case ValueKind::Array:
    return "array";
  case ValueKind::Object:
    return "object";
  }
  return "unknown";
}

std::string received_type_name(const Value &value) {
  if (value.is_number() && std::isnan(value.as_number()))
    return "nan";
  return value_kind_name(value.kind());
}

} // namespace schemakit
