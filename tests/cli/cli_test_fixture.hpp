#pragma once

#include <filesystem>
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace servant::test {

// Result of running servantc
struct CliResult {
  int exit_code;
  std::string output;  // stdout and stderr interleaved

  [[nodiscard]] auto Success() const -> bool {
    return exit_code == 0;
  }
  [[nodiscard]] auto Contains(const std::string& text) const -> bool {
    return output.find(text) != std::string::npos;
  }
};

// Runs the servantc binary inside a scratch directory that is removed after
// each test.
//
// Usage:
//   TEST_F(CheckTest, Accepts) {
//     WriteFile("a.svc", "service A { state: 0 }\ndef f() { 1 }\n");
//     EXPECT_TRUE(Run({"check", "a.svc"}).Success());
//   }
//
class CliTestFixture : public ::testing::Test {
 protected:
  void SetUp() override;
  void TearDown() override;

  auto Run(const std::vector<std::string>& args) -> CliResult;
  auto RunIn(
      const std::filesystem::path& dir, const std::vector<std::string>& args)
      -> CliResult;

  void WriteFile(
      const std::filesystem::path& relative_path, const std::string& content);

  // A small anonymous counter service, the default subject of most tests.
  void WriteCounter(const std::string& filename);

  [[nodiscard]] auto TestDir() const -> const std::filesystem::path& {
    return test_dir_;
  }
  [[nodiscard]] auto FileExists(
      const std::filesystem::path& relative_path) const -> bool;
  [[nodiscard]] auto ReadFile(const std::filesystem::path& relative_path) const
      -> std::string;

 private:
  std::filesystem::path test_dir_;
  std::filesystem::path servantc_;
};

}  // namespace servant::test
