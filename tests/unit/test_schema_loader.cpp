#include "TestFixtures.hpp"
#include "schemakit/SchemaLoader.hpp"
#include "schemakit/ValueConversion.hpp"

#include <gtest/gtest.h>

using namespace schemakit;
using schemakit::test::issue_paths;

namespace {

const char *kAccountSchema = R"(
type: object
unknown_keys: strict
description: Account record
fields:
  id: { type: number, int: true, positive: true }
  email: { type: string, format: email }
  nickname: { type: string, min: 2, optional: true }
  role:
    type: enum
    values: [viewer, editor]
    default: viewer
  tags:
    type: array
    element: { type: string }
    max: 3
  joined: { type: date, coerce: true, min: "2000-01-01" }
)";

} // namespace

class SchemaLoaderTest : public test::FixtureDirTest {};

TEST_F(SchemaLoaderTest, LoadsObjectSchemaFromFile) {
  auto path = write_file("account.yaml", kAccountSchema);
  auto schema = SchemaLoader::load_file(path.string());
  EXPECT_EQ(schema.kind(), NodeKind::Object);
  EXPECT_EQ(schema.description(), "Account record");
  EXPECT_EQ(schema.unknown_keys(), UnknownKeys::Strict);
  ASSERT_EQ(schema.shape().size(), 6);
  EXPECT_EQ(schema.shape()[0].first, "id");
  EXPECT_EQ(schema.shape()[5].first, "joined");

  auto input = Value::object({{"id", 7},
                              {"email", "a@b.co"},
                              {"tags", Value::array({"x"})},
                              {"joined", "2021-06-01"}});
  auto result = schema.validate(input);
  ASSERT_TRUE(result.ok()) << format_issues(result.issues());
  EXPECT_EQ(result.value().get("role"), Value("viewer"));
  EXPECT_EQ(result.value().get("joined"), Value(parse_iso_date("2021-06-01")));
  EXPECT_FALSE(result.value().contains("nickname"));
}

TEST_F(SchemaLoaderTest, LoadedSchemaReportsEveryIssue) {
  auto schema = SchemaLoader::load_string(kAccountSchema);
  auto input = Value::object({{"id", -1.5},
                              {"email", "nope"},
                              {"nickname", "a"},
                              {"role", "owner"},
                              {"tags", Value::array({"a", "b", "c", "d"})},
                              {"joined", "1999-12-31"},
                              {"extra", 1}});
  auto result = schema.validate(input);
  EXPECT_EQ(issue_paths(result.issues()),
            (std::vector<std::string>{"id", "id", "email", "nickname", "role",
                                      "tags", "joined", ""}));
}

TEST_F(SchemaLoaderTest, CompositeTypes) {
  auto schema = SchemaLoader::load_string(R"(
type: discriminated_union
discriminator: kind
options:
  - type: object
    fields:
      kind: { type: literal, value: point }
      at:
        type: tuple
        items: [{ type: number }, { type: number }]
  - type: object
    fields:
      kind: { type: literal, value: label }
      text: { type: string, nullable: true }
      meta:
        type: record
        key: { type: string, min: 1 }
        value:
          type: union
          options: [{ type: string }, { type: boolean }]
)");
  EXPECT_TRUE(schema
                  .validate(Value::object(
                      {{"kind", "point"}, {"at", Value::array({1, 2})}}))
                  .ok());
  EXPECT_TRUE(schema
                  .validate(Value::object({{"kind", "label"},
                                           {"text", nullptr},
                                           {"meta", Value::object({{"a", true}})}}))
                  .ok());
  auto result = schema.validate(Value::object({{"kind", "box"}}));
  ASSERT_EQ(result.issues().size(), 1);
  EXPECT_EQ(result.issues()[0].message,
            "Invalid discriminator value. Expected 'point' | 'label'");
}

TEST_F(SchemaLoaderTest, IntersectionAndTupleRest) {
  auto schema = SchemaLoader::load_string(R"(
type: intersection
left:
  type: object
  unknown_keys: passthrough
  fields: { id: { type: number } }
right:
  type: object
  unknown_keys: passthrough
  fields:
    point:
      type: tuple
      items: [{ type: number }]
      rest: { type: string }
)");
  auto input = Value::object({{"id", 1}, {"point", Value::array({1, "a", "b"})}});
  EXPECT_EQ(schema.parse(input), input);
}

TEST_F(SchemaLoaderTest, QuotedLiteralStaysString) {
  auto schema = SchemaLoader::load_string("{ type: literal, value: \"1\" }");
  EXPECT_TRUE(schema.validate("1").ok());
  EXPECT_FALSE(schema.validate(1).ok());
}

TEST_F(SchemaLoaderTest, UnknownKeyIsRejectedWithLocation) {
  try {
    SchemaLoader::load_string(R"(
type: object
fields:
  age: { type: number, min_length: 3 }
)");
    FAIL() << "expected SchemaError";
  } catch (const SchemaError &e) {
    EXPECT_EQ(e.where(), "/fields/age/min_length");
  }
}

TEST_F(SchemaLoaderTest, MalformedDescriptionsThrow) {
  EXPECT_THROW(SchemaLoader::load_string("type: widget"), SchemaError);
  EXPECT_THROW(SchemaLoader::load_string("[1, 2]"), SchemaError);
  EXPECT_THROW(SchemaLoader::load_string("min: 3"), SchemaError);
  EXPECT_THROW(SchemaLoader::load_string("{ type: array }"), SchemaError);
  EXPECT_THROW(SchemaLoader::load_string("{ type: string, min: -1 }"),
               SchemaError);
  EXPECT_THROW(SchemaLoader::load_string("{ type: string, format: phone }"),
               SchemaError);
  EXPECT_THROW(SchemaLoader::load_string("{ type: date, min: soon }"),
               SchemaError);
  EXPECT_THROW(SchemaLoader::load_string("type: [unclosed"), SchemaError);
}

TEST_F(SchemaLoaderTest, FactoryErrorsCarryNodePath) {
  try {
    SchemaLoader::load_string(R"(
type: object
fields:
  level: { type: enum, values: [low, low] }
)");
    FAIL() << "expected SchemaError";
  } catch (const SchemaError &e) {
    EXPECT_EQ(e.where(), "/fields/level");
  }
}

TEST_F(SchemaLoaderTest, MissingFileThrows) {
  EXPECT_THROW(SchemaLoader::load_file((dir_ / "absent.yaml").string()),
               SchemaError);
}
