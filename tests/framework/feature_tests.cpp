#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <gtest/gtest.h>
#include <iterator>
#include <optional>
#include <string>
#include <vector>

#include "servant/codegen/codegen.hpp"
#include "servant/common/diagnostic/diagnostic.hpp"
#include "servant/common/source_manager.hpp"
#include "servant/common/value.hpp"
#include "servant/frontend/parser.hpp"
#include "servant/runtime/errors.hpp"
#include "servant/runtime/registry.hpp"
#include "servant/service.hpp"
#include "tests/framework/test_case.hpp"
#include "tests/framework/yaml_loader.hpp"

namespace servant::test {
namespace {

// Get YAML file paths to load test cases from.
// Priority:
// 1. SERVANT_TEST_YAML env var (single file)
// 2. Every .yaml under the features directory
auto GetYamlPaths() -> std::vector<std::filesystem::path> {
  if (const char* yaml_path = std::getenv("SERVANT_TEST_YAML")) {
    return {yaml_path};
  }

  std::vector<std::filesystem::path> yaml_paths;
  for (const auto& entry :
       std::filesystem::recursive_directory_iterator(SERVANT_FEATURES_DIR)) {
    if (entry.is_regular_file() && entry.path().extension() == ".yaml") {
      yaml_paths.push_back(entry.path());
    }
  }

  // Sort for deterministic test order
  std::ranges::sort(yaml_paths);
  return yaml_paths;
}

struct CallOutcome {
  bool failed = false;
  std::string text;  // Reply in literal form, or the failure message
};

class ServiceFeatureTest : public testing::TestWithParam<TestCase> {
 protected:
  void TearDown() override {
    runtime::Registry::Instance().Clear();
  }
};

// Builds the case's declaration and checks the build outcome. Returns
// nullopt when there is nothing more to run.
auto BuildCase(const TestCase& tc, SourceManager& sources)
    -> std::optional<Service> {
  auto service = Service::FromSource(sources, tc.name + ".svc", tc.svc_code);
  if (tc.build_error) {
    EXPECT_FALSE(service.has_value())
        << "expected build error containing: " << *tc.build_error;
    if (!service) {
      const auto& message = service.error().primary.message;
      EXPECT_NE(message.find(*tc.build_error), std::string::npos)
          << "actual error: " << message;
    }
    return std::nullopt;
  }
  EXPECT_TRUE(service.has_value())
      << tc.source_yaml << ": " << service.error().primary.message;
  if (!service) {
    return std::nullopt;
  }
  return std::move(*service);
}

TEST_P(ServiceFeatureTest, Runtime) {
  const auto& tc = GetParam();
  SourceManager sources;
  auto service = BuildCase(tc, sources);
  if (!service) {
    return;
  }

  Value inline_state = service->GetModule().spec.initial_state;
  ServiceHandle handle;
  if (service->Mode() != ServiceMode::kInline) {
    handle = service->Run();
  }

  for (const auto& step : tc.calls) {
    FileId file = sources.AddFile("<call>", step.call);
    auto call = frontend::ParseCall(file, sources.GetFile(file)->content);
    ASSERT_TRUE(call.has_value())
        << step.call << ": " << call.error().primary.message;
    const auto& [function, args] = *call;

    CallOutcome outcome;
    try {
      Value result = handle
                         ? service->Call(*handle, function, args)
                         : service->CallInline(inline_state, function, args);
      outcome.text = ToString(result);
    } catch (const EvalError& e) {
      outcome = {.failed = true, .text = e.what()};
    } catch (const runtime::ServiceError& e) {
      outcome = {.failed = true, .text = e.what()};
    } catch (const DiagnosticException& e) {
      outcome = {.failed = true, .text = e.what()};
    }

    if (step.error) {
      EXPECT_TRUE(outcome.failed)
          << step.call << " returned " << outcome.text;
      EXPECT_NE(outcome.text.find(*step.error), std::string::npos)
          << step.call << " failed with: " << outcome.text;
    } else {
      EXPECT_FALSE(outcome.failed) << step.call << ": " << outcome.text;
      if (step.expect) {
        EXPECT_EQ(outcome.text, *step.expect) << step.call;
      }
    }
  }

  if (tc.final_state) {
    Value state = handle ? handle->GetState() : inline_state;
    EXPECT_EQ(ToString(state), *tc.final_state);
  }
  if (handle) {
    handle->Stop();
  }
}

TEST_P(ServiceFeatureTest, GeneratedSource) {
  const auto& tc = GetParam();
  SourceManager sources;
  auto service = BuildCase(tc, sources);
  if (!service) {
    return;
  }
  auto code = service->GeneratedSource();
  EXPECT_NE(
      code.find(
          "class " + service->GetModule().spec.module_name + " {"),
      std::string::npos)
      << code;
  for (const auto& function : service->GetClientApi().Entries()) {
    auto method = "static auto " + codegen::CppIdentifier(function.name) + "(";
    EXPECT_NE(code.find(method), std::string::npos)
        << "no client method for " << function.name;
  }
}

auto LoadTestCases() -> std::vector<TestCase> {
  std::vector<TestCase> all_cases;
  auto yaml_paths = GetYamlPaths();

  for (const auto& yaml_path : yaml_paths) {
    auto cases = LoadTestCasesFromYaml(yaml_path.string());
    auto category = yaml_path.stem().string();

    // Prefix test names with category for uniqueness across YAML files
    for (auto& tc : cases) {
      tc.name = category + "_" + tc.name;
    }

    all_cases.insert(
        all_cases.end(), std::make_move_iterator(cases.begin()),
        std::make_move_iterator(cases.end()));
  }

  return all_cases;
}

INSTANTIATE_TEST_SUITE_P(
    ServiceFeatures, ServiceFeatureTest, testing::ValuesIn(LoadTestCases()),
    [](const testing::TestParamInfo<TestCase>& info) {
      return info.param.name;
    });

}  // namespace
}  // namespace servant::test

auto main(int argc, char** argv) -> int {
  testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
