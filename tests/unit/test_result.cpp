#include "TestFixtures.hpp"
#include "schemakit/Schema.hpp"

#include <gtest/gtest.h>

using namespace schemakit;

namespace {

Schema signup_schema() {
  return object({{"email", string().email()}, {"age", number().int_().min(13)}})
      .refine([](const Value &v) { return v.get("email") != Value("root@x.io"); },
              "Reserved account");
}

} // namespace

class ResultTest : public test::SchemaTest {};

TEST_F(ResultTest, FailureRequiresIssues) {
  EXPECT_THROW(Result::failure({}), std::invalid_argument);
}

TEST_F(ResultTest, ValueOnFailureThrows) {
  auto result = Result::failure({issues::custom({}, "bad")});
  EXPECT_FALSE(result.ok());
  EXPECT_FALSE(static_cast<bool>(result));
  EXPECT_THROW(result.value(), std::logic_error);
}

TEST_F(ResultTest, SuccessHoldsValue) {
  auto result = Result::success(Value::array({1, "a"}));
  ASSERT_TRUE(result);
  EXPECT_TRUE(result.issues().empty());
  EXPECT_EQ(result.value(), Value::array({1, "a"}));
}

TEST_F(ResultTest, ParseThrowsWithAllIssues) {
  try {
    signup_schema().parse(Value::object({{"email", "nope"}, {"age", 12.5}}));
    FAIL() << "parse should throw";
  } catch (const ValidationError &e) {
    ASSERT_EQ(e.issues().size(), 3);
    std::string what = e.what();
    EXPECT_NE(what.find("Validation failed with 3 issue(s)"), std::string::npos);
    EXPECT_NE(what.find("email: Invalid email"), std::string::npos);
  }
}

TEST_F(ResultTest, SafeParseReportsSuccessAndFailure) {
  auto good = signup_schema().safe_parse(
      Value::object({{"email", "a@b.co"}, {"age", 30}}));
  EXPECT_TRUE(good.success);
  EXPECT_FALSE(good.error);
  EXPECT_EQ(good.data.get("age"), Value(30));

  auto bad = signup_schema().safe_parse(Value::object({{"age", 30}}));
  EXPECT_FALSE(bad.success);
  ASSERT_TRUE(bad.error);
  EXPECT_TRUE(bad.data.is_undefined());
  EXPECT_EQ(bad.error->issues()[0].message, "Required");
}

TEST_F(ResultTest, FlattenGroupsByTopLevelField) {
  auto schema = object({{"user", object({{"name", string()}, {"age", number()}})},
                        {"tags", array(string())}})
                    .super_refine([](const Value &, RefinementContext &ctx) {
                      ctx.add_issue("Form is stale");
                    });
  auto input = Value::object(
      {{"user", Value::object({{"name", 1}, {"age", "x"}})},
       {"tags", Value::array({2})}});
  auto result = schema.validate(input);
  // Object-level effects are skipped once a child aborts
  ASSERT_EQ(result.issues().size(), 3);

  auto flat = ValidationError(result.issues()).flatten();
  EXPECT_TRUE(flat.form_errors.empty());
  ASSERT_EQ(flat.field_errors.size(), 2);
  EXPECT_EQ(flat.field_errors["user"].size(), 2);
  EXPECT_EQ(flat.field_errors["tags"],
            (std::vector<std::string>{"Expected string, received number"}));

  auto j = flat.to_json();
  EXPECT_TRUE(j["formErrors"].empty());
  EXPECT_EQ(j["fieldErrors"]["tags"].size(), 1);
}

TEST_F(ResultTest, FlattenKeepsRootIssuesAsFormErrors) {
  auto error = ValidationError({issues::custom({}, "Form is stale"),
                                issues::custom({std::size_t{0}}, "first")});
  auto flat = error.flatten();
  EXPECT_EQ(flat.form_errors, (std::vector<std::string>{"Form is stale"}));
  EXPECT_EQ(flat.field_errors["0"], (std::vector<std::string>{"first"}));
}

TEST_F(ResultTest, IssueJsonCarriesCodePathAndParams) {
  auto result = object({{"items", array(number())}})
                    .validate(Value::object({{"items", Value::array({1, "x"})}}));
  auto j = ValidationError(result.issues()).to_json();
  ASSERT_EQ(j["issues"].size(), 1);
  const auto &issue = j["issues"][0];
  EXPECT_EQ(issue["code"], "invalid_type");
  EXPECT_EQ(issue["path"], (nlohmann::json{"items", 1}));
  EXPECT_EQ(issue["expected"], "number");
  EXPECT_EQ(issue["received"], "string");
}

TEST_F(ResultTest, IssueJsonParamsCannotReplaceFixedMembers) {
  RefineOptions options;
  options.message = "bad";
  options.params = {{"path", "spoofed"},
                    {"code", "ok"},
                    {"message", "fine"},
                    {"unionErrors", 3},
                    {"hint", 1}};
  auto result = string().refine([](const Value &) { return false; }, options)
                    .validate("x");
  ASSERT_EQ(result.issues().size(), 1);
  auto j = result.issues()[0].to_json();
  EXPECT_EQ(j["code"], "custom");
  EXPECT_EQ(j["path"], nlohmann::json::array());
  EXPECT_EQ(j["message"], "bad");
  EXPECT_FALSE(j.contains("unionErrors"));
  EXPECT_EQ(j["hint"], 1);
  // The issue itself still carries what the caller supplied
  EXPECT_EQ(result.issues()[0].params["path"], "spoofed");
}

TEST_F(ResultTest, UnionIssueJsonNestsAlternatives) {
  auto result = union_({number(), boolean()}).validate("x");
  auto j = result.issues()[0].to_json();
  EXPECT_EQ(j["code"], "invalid_union");
  ASSERT_EQ(j["unionErrors"].size(), 2);
  EXPECT_EQ(j["unionErrors"][1][0]["expected"], "boolean");
}

TEST_F(ResultTest, PathRendering) {
  EXPECT_EQ(path_to_string({}), "");
  EXPECT_EQ(path_to_string({std::string("team"), std::string("members"),
                            std::size_t{1}, std::string("id")}),
            "team.members[1].id");
  EXPECT_EQ(path_to_string({std::size_t{0}, std::size_t{2}}), "[0][2]");
  EXPECT_EQ(format_issues({issues::custom({}, "bad")}),
            "  - <root>: bad (custom)\n");
}
