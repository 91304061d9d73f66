#include "servant/service.hpp"

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "servant/codegen/codegen.hpp"
#include "servant/frontend/parser.hpp"
#include "servant/lowering/impl_generator.hpp"
#include "servant/runtime/strategies.hpp"

namespace servant {

auto ResolveOptions(
    const decl::ServiceSpec& spec, runtime::RuntimeOptions defaults)
    -> runtime::RuntimeOptions {
  runtime::RuntimeOptions options = std::move(defaults);
  options.label = spec.module_name;
  options.service_name = spec.service_name;
  if (spec.pool) {
    options.pool = {.min = spec.pool->min, .max = spec.pool->max};
    if (spec.pool->checkout_timeout) {
      options.checkout_timeout = *spec.pool->checkout_timeout;
    }
    if (spec.pool->idle_grace) {
      options.idle_grace = *spec.pool->idle_grace;
    }
  }
  if (spec.call_timeout) {
    options.call_timeout = *spec.call_timeout;
  }
  if (spec.restart.max_restarts) {
    options.restart.max_restarts = *spec.restart.max_restarts;
  }
  if (spec.restart.window) {
    options.restart.window = *spec.restart.window;
  }
  return options;
}

auto Service::Build(
    decl::Declaration declaration, runtime::RuntimeOptions defaults)
    -> Result<Service> {
  if (auto checked = frontend::CheckServiceSpec(declaration.spec); !checked) {
    return std::unexpected(checked.error());
  }
  auto lowered = lowering::LowerDeclaration(std::move(declaration));
  if (!lowered) {
    return std::unexpected(lowered.error());
  }

  auto module = std::make_shared<const impl::Module>(std::move(*lowered));
  auto options = ResolveOptions(module->spec, std::move(defaults));
  Service service(module, lowering::GenerateClientApi(module), options);

  if (module->spec.diagnostics) {
    spdlog::info(
        "generated code for {}:\n{}", module->spec.module_name,
        service.GeneratedSource());
  }
  return service;
}

auto Service::FromSource(
    SourceManager& sources, std::string path, std::string text,
    runtime::RuntimeOptions defaults) -> Result<Service> {
  FileId file = sources.AddFile(std::move(path), std::move(text));
  auto declaration =
      frontend::ParseDeclaration(file, sources.GetFile(file)->content);
  if (!declaration) {
    return std::unexpected(declaration.error());
  }
  return Build(std::move(*declaration), std::move(defaults));
}

auto Service::Run() const -> ServiceHandle {
  return Run(module_->spec.initial_state);
}

auto Service::Run(Value initial_state) const -> ServiceHandle {
  return runtime::MakeRuntime<Value>(
      module_->spec.mode, std::move(initial_state), options_);
}

auto Service::Lookup(std::string_view function, size_t arity) const
    -> const lowering::ClientFunction& {
  const auto* entry =
      client_api_.Find(function, static_cast<uint32_t>(arity));
  if (entry != nullptr) {
    return *entry;
  }
  auto diag = Diagnostic::HostError(
      fmt::format(
          "service '{}' has no function {}/{}", module_->spec.module_name,
          function, arity));
  for (const auto& candidate : client_api_.Entries()) {
    if (candidate.name == function) {
      diag = std::move(diag).WithNote(
          fmt::format("{}/{} is defined", candidate.name, candidate.arity));
    }
  }
  throw DiagnosticException(std::move(diag));
}

auto Service::Call(
    runtime::ServiceRuntime<Value>& service, std::string_view function,
    const std::vector<Value>& args) const -> Value {
  return Lookup(function, args.size()).call(service, args);
}

auto Service::Call(
    std::string_view function, const std::vector<Value>& args) const -> Value {
  const auto& entry = Lookup(function, args.size());
  auto service = client_api_.ResolveNamed();
  return entry.call(*service, args);
}

auto Service::CallInline(
    Value& state, std::string_view function,
    const std::vector<Value>& args) const -> Value {
  return Lookup(function, args.size()).call_inline(state, args);
}

auto Service::GeneratedSource() const -> std::string {
  codegen::Codegen codegen;
  return codegen.Generate(
      *module_, fmt::format("{}.svc", module_->spec.module_name));
}

}  // namespace servant
