#include "commands.hpp"

#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "input.hpp"
#include "print.hpp"
#include "servant/codegen/codegen.hpp"
#include "servant/common/diagnostic/diagnostic_sink.hpp"
#include "servant/common/value.hpp"
#include "servant/decl/dumper.hpp"
#include "servant/frontend/parser.hpp"
#include "servant/impl/module.hpp"
#include "servant/lowering/impl_generator.hpp"
#include "servant/runtime/errors.hpp"
#include "servant/service.hpp"

namespace servant::driver {

namespace fs = std::filesystem;

auto CheckCommand(const argparse::ArgumentParser& cmd) -> int {
  auto loaded = LoadDeclaration(cmd.get<std::string>("file"));
  if (!loaded) {
    return 1;
  }

  DiagnosticSink sink;
  auto module =
      lowering::GenerateImplementation(std::move(loaded->declaration), sink);
  PrintDiagnostics(sink, loaded->sources.get());
  if (sink.HasErrors()) {
    return 1;
  }
  spdlog::debug(
      "{}: {} function(s), mode {}", module.spec.module_name,
      module.functions.size(), ToString(module.spec.mode));
  return 0;
}

auto DumpCommand(const argparse::ArgumentParser& cmd) -> int {
  auto stage = cmd.get<std::string>("--stage");
  if (stage != "decl" && stage != "impl" && stage != "all") {
    PrintError(
        fmt::format("unknown stage '{}', use 'decl', 'impl' or 'all'", stage));
    return 1;
  }

  auto loaded = LoadDeclaration(cmd.get<std::string>("file"));
  if (!loaded) {
    return 1;
  }

  if (stage != "impl") {
    decl::Dumper dumper(&loaded->declaration.arena, &std::cout);
    dumper.Dump(loaded->declaration);
    if (stage == "decl") {
      return 0;
    }
    std::cout << "\n";
  }

  DiagnosticSink sink;
  auto module =
      lowering::GenerateImplementation(std::move(loaded->declaration), sink);
  if (sink.HasErrors()) {
    PrintDiagnostics(sink, loaded->sources.get());
    return 1;
  }
  impl::Dump(module, std::cout);
  return 0;
}

auto EmitCommand(const argparse::ArgumentParser& cmd) -> int {
  auto path = cmd.get<std::string>("file");
  auto loaded = LoadDeclaration(path);
  if (!loaded) {
    return 1;
  }

  DiagnosticSink sink;
  auto module =
      lowering::GenerateImplementation(std::move(loaded->declaration), sink);
  if (sink.HasErrors()) {
    PrintDiagnostics(sink, loaded->sources.get());
    return 1;
  }

  codegen::Codegen codegen;
  std::string header =
      codegen.Generate(module, fs::path(path).filename().string());

  auto out_path = cmd.present<std::string>("-o");
  if (!out_path) {
    std::cout << header;
    return 0;
  }
  std::ofstream out(*out_path);
  if (!out) {
    PrintError(fmt::format("cannot write '{}'", *out_path));
    return 1;
  }
  out << header;
  spdlog::debug("wrote {}", *out_path);
  return 0;
}

auto CallCommand(
    const argparse::ArgumentParser& cmd, const config::RuntimeConfig& config)
    -> int {
  auto loaded = LoadDeclaration(cmd.get<std::string>("file"));
  if (!loaded) {
    return 1;
  }
  auto calls = cmd.get<std::vector<std::string>>("calls");
  SourceManager& sources = *loaded->sources;

  auto service = Service::Build(
      std::move(loaded->declaration), config::ToRuntimeOptions(config));
  if (!service) {
    PrintDiagnostic(service.error(), &sources);
    return 1;
  }

  Value inline_state = service->GetModule().spec.initial_state;
  ServiceHandle handle;
  if (service->Mode() != ServiceMode::kInline) {
    handle = service->Run();
  }

  int status = 0;
  for (const auto& text : calls) {
    FileId file = sources.AddFile("<call>", text);
    auto call = frontend::ParseCall(file, sources.GetFile(file)->content);
    if (!call) {
      PrintDiagnostic(call.error(), &sources);
      status = 1;
      break;
    }
    const auto& [name, args] = *call;

    try {
      Value result;
      switch (service->Mode()) {
        case ServiceMode::kInline:
          result = service->CallInline(inline_state, name, args);
          break;
        case ServiceMode::kNamed:
          result = service->Call(name, args);
          break;
        case ServiceMode::kAnonymous:
        case ServiceMode::kPooled:
          result = service->Call(*handle, name, args);
          break;
      }
      std::cout << ToString(result) << "\n";
    } catch (const DiagnosticException& e) {
      PrintDiagnostic(e.GetDiagnostic(), &sources);
      status = 1;
      break;
    } catch (const runtime::ServiceError& e) {
      PrintError(fmt::format("{}: {}", text, e.what()));
      status = 1;
      break;
    } catch (const EvalError& e) {
      PrintError(fmt::format("{}: {}", text, e.what()));
      status = 1;
      break;
    }
  }

  if (handle) {
    handle->Stop();
  }
  return status;
}

}  // namespace servant::driver
