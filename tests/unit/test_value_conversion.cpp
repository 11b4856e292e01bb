#include "TestFixtures.hpp"
#include "schemakit/ValueConversion.hpp"

#include <cmath>
#include <gtest/gtest.h>
#include <limits>

using namespace schemakit;

class ValueConversionTest : public test::SchemaTest {};

TEST_F(ValueConversionTest, ParsesCalendarDate) {
  auto d = parse_iso_date("2024-02-29");
  ASSERT_TRUE(d.valid);
  EXPECT_EQ(d.to_iso_string(), "2024-02-29T00:00:00.000Z");
}

TEST_F(ValueConversionTest, ParsesTimestamp) {
  EXPECT_EQ(parse_iso_date("1970-01-01T00:00:01Z").millis(), 1000);
  EXPECT_EQ(parse_iso_date("2001-09-09T01:46:40.123Z").millis(),
            1000000000123LL);
}

TEST_F(ValueConversionTest, RejectsMalformedDates) {
  for (const char *text : {"", "2023-02-29", "2024-13-01", "2024-01-01T25:00:00Z",
                           "2024-01-01T10:00:00", "2024-01-01T10:00:00+02:00",
                           "yesterday", "2024-1-1"}) {
    EXPECT_FALSE(parse_iso_date(text).valid) << text;
  }
}

TEST_F(ValueConversionTest, ValueToJson) {
  auto value = Value::object({{"n", 3},
                              {"f", 2.5},
                              {"s", "x"},
                              {"missing", Value()},
                              {"none", nullptr},
                              {"when", parse_iso_date("2024-01-31")},
                              {"list", Value::array({true, Value()})}});
  nlohmann::json expected = {{"n", 3},
                             {"f", 2.5},
                             {"s", "x"},
                             {"none", nullptr},
                             {"when", "2024-01-31T00:00:00.000Z"},
                             {"list", {true, nullptr}}};
  EXPECT_EQ(value_to_json(value), expected);
  EXPECT_TRUE(value_to_json(value)["n"].is_number_integer());
  EXPECT_TRUE(value_to_json(Value(Date::invalid())).is_null());
}

TEST_F(ValueConversionTest, JsonToValue) {
  auto j = nlohmann::json::parse(
      R"({"id": 7, "ratio": 0.5, "tags": ["a", null], "ok": false})");
  EXPECT_EQ(json_to_value(j),
            Value::object({{"id", 7},
                           {"ratio", 0.5},
                           {"tags", Value::array({"a", nullptr})},
                           {"ok", false}}));
}

TEST_F(ValueConversionTest, YamlScalarsAreTypedByContent) {
  auto node = YAML::Load(R"(
count: 42
ratio: 1.5
enabled: true
nothing: ~
name: Ada
quoted: "42"
items: [1, two]
)");
  EXPECT_EQ(yaml_to_value(node),
            Value::object({{"count", 42},
                           {"ratio", 1.5},
                           {"enabled", true},
                           {"nothing", nullptr},
                           {"name", "Ada"},
                           {"quoted", "42"},
                           {"items", Value::array({1, "two"})}}));
}

TEST_F(ValueConversionTest, DescribeAndTypeNames) {
  EXPECT_EQ(Value(3).describe(), "3");
  EXPECT_EQ(Value("a").describe(), "\"a\"");
  EXPECT_EQ(Value(std::nan("")).describe(), "NaN");
  EXPECT_EQ(Value::array({1, 2}).describe(), "array(2)");
  EXPECT_EQ(received_type_name(Value(std::numeric_limits<double>::quiet_NaN())),
            "nan");
  EXPECT_EQ(received_type_name(Value()), "undefined");
  EXPECT_EQ(received_type_name(Value::object({})), "object");
}

TEST_F(ValueConversionTest, ObjectLookup) {
  auto v = Value::object({{"a", 1}});
  EXPECT_TRUE(v.contains("a"));
  EXPECT_FALSE(v.contains("b"));
  EXPECT_TRUE(v.get("b").is_undefined());
  EXPECT_TRUE(Value("x").get("a").is_undefined());
}
