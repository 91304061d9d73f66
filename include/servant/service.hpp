#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "servant/common/diagnostic/diagnostic.hpp"
#include "servant/common/service_mode.hpp"
#include "servant/common/source_manager.hpp"
#include "servant/common/value.hpp"
#include "servant/decl/declaration.hpp"
#include "servant/impl/module.hpp"
#include "servant/lowering/client_api.hpp"
#include "servant/runtime/options.hpp"
#include "servant/runtime/service_runtime.hpp"

namespace servant {

using ServiceHandle = std::shared_ptr<runtime::ServiceRuntime<Value>>;

// A declaration taken through the whole pipeline: lowered, with its client
// API built and its runtime options settled. Start it with Run().
//
// Calling an unknown function, or with the wrong number of arguments,
// throws DiagnosticException (host error). Calls through a running service
// throw the runtime::ServiceError family; inline calls let EvalError
// through.
class Service {
 public:
  // Options written in the declaration override `defaults`.
  static auto Build(
      decl::Declaration declaration, runtime::RuntimeOptions defaults = {})
      -> Result<Service>;

  // Parses `text` (registered in `sources` as `path`) and builds it.
  static auto FromSource(
      SourceManager& sources, std::string path, std::string text,
      runtime::RuntimeOptions defaults = {}) -> Result<Service>;

  // Starts with the declared initial state. Named services return the live
  // instance when one is already registered.
  [[nodiscard]] auto Run() const -> ServiceHandle;
  [[nodiscard]] auto Run(Value initial_state) const -> ServiceHandle;

  auto Call(
      runtime::ServiceRuntime<Value>& service, std::string_view function,
      const std::vector<Value>& args) const -> Value;

  // Named services only: resolves the service by its registered name.
  auto Call(std::string_view function, const std::vector<Value>& args) const
      -> Value;

  // Inline services: runs the function on caller-owned `state`.
  auto CallInline(
      Value& state, std::string_view function,
      const std::vector<Value>& args) const -> Value;

  [[nodiscard]] auto Mode() const -> ServiceMode {
    return module_->spec.mode;
  }
  [[nodiscard]] auto GetModule() const -> const impl::Module& {
    return *module_;
  }
  [[nodiscard]] auto GetClientApi() const -> const lowering::ClientApi& {
    return client_api_;
  }
  [[nodiscard]] auto Options() const -> const runtime::RuntimeOptions& {
    return options_;
  }

  // The module rendered as a C++ header.
  [[nodiscard]] auto GeneratedSource() const -> std::string;

 private:
  Service(
      std::shared_ptr<const impl::Module> module,
      lowering::ClientApi client_api, runtime::RuntimeOptions options)
      : module_(std::move(module)),
        client_api_(std::move(client_api)),
        options_(std::move(options)) {
  }

  auto Lookup(std::string_view function, size_t arity) const
      -> const lowering::ClientFunction&;

  std::shared_ptr<const impl::Module> module_;
  lowering::ClientApi client_api_;
  runtime::RuntimeOptions options_;
};

// Declaration options layered over `defaults`.
auto ResolveOptions(
    const decl::ServiceSpec& spec, runtime::RuntimeOptions defaults)
    -> runtime::RuntimeOptions;

}  // namespace servant
