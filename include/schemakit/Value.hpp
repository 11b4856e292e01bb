#pragma once
#include "schemakit/export.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <map>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace schemakit {

/// Absent sentinel: a missing object key or an unset optional
struct Undefined {
  bool operator==(const Undefined &) const { return true; }
  bool operator!=(const Undefined &) const { return false; }
};

/// Point in time. An invalid date (e.g. the result of parsing garbage) is
/// still a Date but fails the date() kind check.
struct Date {
  std::chrono::system_clock::time_point time{};
  bool valid{true};

  static Date from_millis(int64_t ms_since_epoch);
  static Date invalid() { return Date{{}, false}; }
  int64_t millis() const;
  // ISO-8601 UTC, e.g. "2024-01-31T12:00:00.000Z"
  std::string to_iso_string() const;

  bool operator==(const Date &other) const {
    if (!valid || !other.valid)
      return valid == other.valid;
    return time == other.time;
  }
  bool operator!=(const Date &other) const { return !(*this == other); }
};

class Value;
using ValueArray = std::vector<Value>;
using ValueObject = std::map<std::string, Value>;

enum class ValueKind {
  Undefined,
  Null,
  Boolean,
  Number,
  String,
  Date,
  Array,
  Object
};

/// Untyped input data: the shape every schema validates
class SCHEMAKIT_API Value {
public:
  using Storage = std::variant<Undefined, std::nullptr_t, bool, double,
                               std::string, Date, ValueArray, ValueObject>;

  Value() : storage_(Undefined{}) {}
  Value(Undefined u) : storage_(u) {}
  Value(std::nullptr_t) : storage_(nullptr) {}
  Value(bool b) : storage_(b) {}
  Value(double n) : storage_(n) {}
  Value(int n) : storage_(static_cast<double>(n)) {}
  Value(int64_t n) : storage_(static_cast<double>(n)) {}
  Value(std::string s) : storage_(std::move(s)) {}
  Value(const char *s) : storage_(std::string(s)) {}
  Value(Date d) : storage_(d) {}
  Value(ValueArray a) : storage_(std::move(a)) {}
  Value(ValueObject o) : storage_(std::move(o)) {}

  static Value array(std::initializer_list<Value> items) {
    return Value(ValueArray(items));
  }
  static Value object(
      std::initializer_list<std::pair<const std::string, Value>> entries) {
    return Value(ValueObject(entries));
  }

  ValueKind kind() const { return static_cast<ValueKind>(storage_.index()); }

  bool is_undefined() const { return kind() == ValueKind::Undefined; }
  bool is_null() const { return kind() == ValueKind::Null; }
  bool is_bool() const { return kind() == ValueKind::Boolean; }
  bool is_number() const { return kind() == ValueKind::Number; }
  bool is_string() const { return kind() == ValueKind::String; }
  bool is_date() const { return kind() == ValueKind::Date; }
  bool is_array() const { return kind() == ValueKind::Array; }
  bool is_object() const { return kind() == ValueKind::Object; }

  // Accessors throw std::bad_variant_access on kind mismatch
  bool as_bool() const { return std::get<bool>(storage_); }
  double as_number() const { return std::get<double>(storage_); }
  const std::string &as_string() const { return std::get<std::string>(storage_); }
  const Date &as_date() const { return std::get<Date>(storage_); }
  const ValueArray &as_array() const { return std::get<ValueArray>(storage_); }
  const ValueObject &as_object() const {
    return std::get<ValueObject>(storage_);
  }
  ValueArray &as_array() { return std::get<ValueArray>(storage_); }
  ValueObject &as_object() { return std::get<ValueObject>(storage_); }

  // Object member lookup; missing keys and non-objects yield Undefined
  Value get(const std::string &key) const;
  bool contains(const std::string &key) const;

  const Storage &storage() const { return storage_; }

  bool operator==(const Value &other) const {
    return storage_ == other.storage_;
  }
  bool operator!=(const Value &other) const { return !(*this == other); }

  // Short human-readable rendering used in messages and logs
  std::string describe() const;

private:
  Storage storage_;
};

/// Name used in "Expected X, received Y" messages (nan and integer aware)
SCHEMAKIT_API std::string received_type_name(const Value &value);
SCHEMAKIT_API std::string value_kind_name(ValueKind kind);

} // namespace schemakit
