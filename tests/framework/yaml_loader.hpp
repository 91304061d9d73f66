#pragma once

#include <string>
#include <vector>

#include "tests/framework/test_case.hpp"

namespace servant::test {

auto LoadTestCasesFromYaml(const std::string& path) -> std::vector<TestCase>;

}  // namespace servant::test
