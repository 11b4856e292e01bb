#include "TestFixtures.hpp"
#include "schemakit/Schema.hpp"

#include <atomic>
#include <gtest/gtest.h>

using namespace schemakit;
using schemakit::test::issue_paths;

namespace {

Schema account_union() {
  auto user = object({{"type", literal("user")}, {"name", string()}});
  auto admin = object({{"type", literal("admin")},
                       {"name", string()},
                       {"permissions", array(string())}});
  return discriminated_union("type", {{Value("user"), user},
                                      {Value("admin"), admin}});
}

} // namespace

class UnionResolverTest : public test::SchemaTest {};

TEST_F(UnionResolverTest, FirstMatchingAlternativeWins) {
  auto schema = union_({string().transform([](const Value &) {
                          return Value("first");
                        }),
                        string().transform([](const Value &) {
                          return Value("second");
                        })});
  EXPECT_EQ(schema.parse("x"), Value("first"));
}

TEST_F(UnionResolverTest, LaterAlternativeUsedWhenEarlierFails) {
  auto schema = union_({number(), string()});
  EXPECT_EQ(schema.parse("x"), Value("x"));
  EXPECT_EQ(schema.parse(4), Value(4));
}

TEST_F(UnionResolverTest, NoMatchProducesOneUnionIssue) {
  auto schema = union_({number(), boolean()});
  auto result = schema.validate("x");
  ASSERT_EQ(result.issues().size(), 1);
  const auto &issue = result.issues()[0];
  EXPECT_EQ(issue.code, IssueCode::InvalidUnion);
  EXPECT_TRUE(issue.path.empty());
  ASSERT_EQ(issue.union_errors.size(), 2);
  EXPECT_EQ(issue.union_errors[0][0].code, IssueCode::InvalidType);
  EXPECT_EQ(issue.union_errors[1][0].params["expected"], "boolean");
}

TEST_F(UnionResolverTest, DirtyAlternativeDoesNotWin) {
  auto schema = union_({string().min(5), string().max(2)});
  auto result = schema.validate("abc");
  ASSERT_EQ(result.issues().size(), 1);
  EXPECT_EQ(result.issues()[0].code, IssueCode::InvalidUnion);
}

TEST_F(UnionResolverTest, LaterAlternativesAreNotEvaluatedAfterMatch) {
  std::atomic<int> calls{0};
  auto counted = string().refine([&calls](const Value &) {
    ++calls;
    return true;
  });
  auto schema = union_({string(), counted});
  EXPECT_TRUE(schema.validate("x").ok());
  EXPECT_EQ(calls.load(), 0);
}

TEST_F(UnionResolverTest, NestedUnionIssueCarriesPath) {
  auto schema = object({{"id", union_({number(), string()})}});
  auto result = schema.validate(Value::object({{"id", true}}));
  ASSERT_EQ(result.issues().size(), 1);
  EXPECT_EQ(issue_paths(result.issues())[0], "id");
  EXPECT_EQ(result.issues()[0].union_errors[0][0].path,
            (Path{std::string("id")}));
}

TEST_F(UnionResolverTest, DiscriminatorSelectsBranch) {
  auto admin = Value::object({{"type", "admin"},
                              {"name", "Root"},
                              {"permissions", Value::array({"all"})}});
  EXPECT_EQ(account_union().parse(admin), admin);
}

TEST_F(UnionResolverTest, UnknownDiscriminatorIsOneIssue) {
  auto result = account_union().validate(
      Value::object({{"type", "guest"}, {"name", "Bob"}}));
  ASSERT_EQ(result.issues().size(), 1);
  const auto &issue = result.issues()[0];
  EXPECT_EQ(issue.code, IssueCode::InvalidUnionDiscriminator);
  EXPECT_EQ(issue.path, (Path{std::string("type")}));
  EXPECT_EQ(issue.message,
            "Invalid discriminator value. Expected 'user' | 'admin'");
  EXPECT_EQ(issue.params["options"], (nlohmann::json{"user", "admin"}));
}

TEST_F(UnionResolverTest, MissingDiscriminatorIsOneIssue) {
  auto result = account_union().validate(Value::object({{"name", "Bob"}}));
  ASSERT_EQ(result.issues().size(), 1);
  EXPECT_EQ(issue_paths(result.issues())[0], "type");
}

TEST_F(UnionResolverTest, BranchIssuesSurfaceDirectly) {
  auto result = account_union().validate(
      Value::object({{"type", "admin"}, {"name", 5}}));
  EXPECT_EQ(issue_paths(result.issues()),
            (std::vector<std::string>{"name", "permissions"}));
}

TEST_F(UnionResolverTest, DiscriminatedUnionRequiresObject) {
  auto result = account_union().validate("user");
  ASSERT_EQ(result.issues().size(), 1);
  EXPECT_EQ(result.issues()[0].code, IssueCode::InvalidType);
}

TEST_F(UnionResolverTest, BranchesDerivedFromLiteralAndEnumFields) {
  auto shapes = discriminated_union(
      "kind",
      {object({{"kind", literal("circle")}, {"r", number()}}),
       object({{"kind", enum_({"square", "rect"})}, {"w", number()}})});
  EXPECT_TRUE(
      shapes.validate(Value::object({{"kind", "rect"}, {"w", 2}})).ok());
  EXPECT_TRUE(
      shapes.validate(Value::object({{"kind", "circle"}, {"r", 1}})).ok());
}

TEST_F(UnionResolverTest, DiscriminatorKeysAreTyped) {
  auto schema = discriminated_union(
      "v", {object({{"v", literal(1)}}), object({{"v", literal("1")}})});
  EXPECT_TRUE(schema.validate(Value::object({{"v", 1}})).ok());
  EXPECT_TRUE(schema.validate(Value::object({{"v", "1"}})).ok());
  EXPECT_FALSE(schema.validate(Value::object({{"v", 2}})).ok());
}

TEST_F(UnionResolverTest, InvalidConstructionThrows) {
  EXPECT_THROW(union_({}), SchemaError);
  EXPECT_THROW(discriminated_union("type", {string()}), SchemaError);
  EXPECT_THROW(discriminated_union("type", {object({{"name", string()}})}),
               SchemaError);
  EXPECT_THROW(discriminated_union("type",
                                   {object({{"type", literal("a")}}),
                                    object({{"type", literal("a")}})}),
               SchemaError);
}
