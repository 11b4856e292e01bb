#include "TestFixtures.hpp"
#include "schemakit/Logger.hpp"

#include <atomic>
#include <fstream>

namespace schemakit {
namespace test {

void SchemaTest::SetUp() {
  SchemaLogger::instance().init("schemakit_test.log", spdlog::level::debug);
}

void SchemaTest::TearDown() {}

void FixtureDirTest::SetUp() {
  SchemaTest::SetUp();

  static std::atomic<int> counter{0};
  const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
  dir_ = std::filesystem::temp_directory_path() /
         ("schemakit_" + std::string(info->test_suite_name()) + "_" +
          info->name() + "_" + std::to_string(counter++));
  std::filesystem::create_directories(dir_);
}

void FixtureDirTest::TearDown() {
  std::error_code ec;
  std::filesystem::remove_all(dir_, ec);
  SchemaTest::TearDown();
}

std::filesystem::path FixtureDirTest::write_file(const std::string &name,
                                                 const std::string &content) const {
  auto path = dir_ / name;
  std::ofstream out(path);
  out << content;
  return path;
}

std::vector<std::string> issue_paths(const std::vector<Issue> &issues) {
  std::vector<std::string> out;
  for (const auto &issue : issues)
    out.push_back(path_to_string(issue.path));
  return out;
}

std::vector<IssueCode> issue_codes(const std::vector<Issue> &issues) {
  std::vector<IssueCode> out;
  for (const auto &issue : issues)
    out.push_back(issue.code);
  return out;
}

} // namespace test
} // namespace schemakit
