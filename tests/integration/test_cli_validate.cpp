#include "TestFixtures.hpp"

#include <cstdlib>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <sys/wait.h>

#ifndef SCHEMAKIT_VALIDATE_BIN
#define SCHEMAKIT_VALIDATE_BIN "schemakit-validate"
#endif

namespace {

const char *kUserSchema = R"(
type: object
unknown_keys: strict
fields:
  name: { type: string, min: 2 }
  age: { type: number, int: true, nonnegative: true }
  role: { type: enum, values: [user, admin], default: user }
)";

} // namespace

class CliValidateTest : public schemakit::test::FixtureDirTest {
protected:
  struct RunResult {
    int exit_code;
    std::string out;
  };

  // Runs the validator with stdout captured; logging goes nowhere
  RunResult run(const std::string &args) {
    auto out_file = dir_ / "stdout.txt";
    std::string cmd = "SCHEMAKIT_LOG_FILE= " + std::string(SCHEMAKIT_VALIDATE_BIN) +
                      " " + args + " > " + out_file.string() + " 2>/dev/null";
    int status = std::system(cmd.c_str());

    std::ifstream in(out_file);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return {WIFEXITED(status) ? WEXITSTATUS(status) : -1, buffer.str()};
  }

  std::string schema_file() {
    return write_file("user.yaml", kUserSchema).string();
  }
};

TEST_F(CliValidateTest, ValidJsonInputSucceeds) {
  auto input = write_file("user.json", R"({"name": "Ada", "age": 36})");
  auto result = run(schema_file() + " " + input.string());
  EXPECT_EQ(result.exit_code, 0);
  EXPECT_NE(result.out.find("Validation succeeded."), std::string::npos);
  // Defaults appear in the printed output
  EXPECT_NE(result.out.find("\"role\": \"user\""), std::string::npos);
}

TEST_F(CliValidateTest, InvalidYamlInputListsIssues) {
  auto input = write_file("bad_user.yaml", "name: A\nage: -1.5\nextra: true\n");
  auto result = run(schema_file() + " " + input.string());
  EXPECT_EQ(result.exit_code, 2);
  EXPECT_NE(result.out.find("Validation failed:"), std::string::npos);
  EXPECT_NE(result.out.find("  - name: String must contain at least 2 character(s)"),
            std::string::npos);
  EXPECT_NE(result.out.find("  - age:"), std::string::npos);
  EXPECT_NE(result.out.find("Unrecognized key(s) in object: 'extra'"),
            std::string::npos);
}

TEST_F(CliValidateTest, AsyncFlagGivesSameVerdict) {
  auto input = write_file("user.json", R"({"name": "Ada", "age": "old"})");
  auto sync_run = run(schema_file() + " " + input.string());
  auto async_run = run(schema_file() + " " + input.string() + " --async");
  EXPECT_EQ(sync_run.exit_code, 2);
  EXPECT_EQ(async_run.exit_code, 2);
  EXPECT_EQ(sync_run.out, async_run.out);
}

TEST_F(CliValidateTest, ConfigFileIsAccepted) {
  auto config = write_file("engine.yaml", "parallel_async: false\nlog_level: off\n");
  auto input = write_file("user.json", R"({"name": "Ada", "age": 1})");
  auto result = run(schema_file() + " " + input.string() + " --async --config " +
                    config.string());
  EXPECT_EQ(result.exit_code, 0);
}

TEST_F(CliValidateTest, UsageAndLoadErrorsExitWithOne) {
  EXPECT_EQ(run("").exit_code, 1);
  EXPECT_EQ(run(schema_file() + " x.json --bogus").exit_code, 1);

  auto input = write_file("user.json", "{}");
  EXPECT_EQ(run((dir_ / "missing.yaml").string() + " " + input.string()).exit_code,
            1);

  auto broken_schema = write_file("broken.yaml", "type: widget\n");
  EXPECT_EQ(run(broken_schema.string() + " " + input.string()).exit_code, 1);

  auto broken_json = write_file("broken.json", "{\"name\": ");
  EXPECT_EQ(run(schema_file() + " " + broken_json.string()).exit_code, 1);
}
