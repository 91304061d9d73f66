#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace servant::test {

// One call against the running service, written as a call literal such as
// `put("a", 1)`. Exactly one of `expect` and `error` is normally set.
struct CallStep {
  std::string call;
  std::optional<std::string> expect;  // Literal form of the reply
  std::optional<std::string> error;   // Substring of the failure message
};

struct TestCase {
  std::string name;
  std::string feature;
  std::string source_yaml;  // Path to YAML file for error reporting
  std::string svc_code;
  std::vector<CallStep> calls;

  // Substring of the first diagnostic when the declaration must not build.
  std::optional<std::string> build_error;

  // Literal form of the state after the last call.
  std::optional<std::string> final_state;
};

// GTest printer for readable test names
inline void PrintTo(const TestCase& test_case, std::ostream* os) {
  *os << test_case.feature << "/" << test_case.name;
}

}  // namespace servant::test
