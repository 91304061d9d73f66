#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "servant/common/value.hpp"
#include "servant/impl/interpreter.hpp"
#include "servant/impl/module.hpp"
#include "servant/runtime/service_runtime.hpp"

namespace servant::lowering {

using ServiceRef = runtime::ServiceRuntime<Value>;

// One caller-facing function. The state parameter is hidden: `call` routes
// the request through a running service and returns the unwrapped reply;
// `call_inline` threads a caller-owned state instead (inline mode).
struct ClientFunction {
  std::string name;
  uint32_t arity = 0;  // Arguments the caller supplies
  std::function<Value(ServiceRef& service, const std::vector<Value>& args)>
      call;
  std::function<Value(Value& state, const std::vector<Value>& args)>
      call_inline;
};

class ClientApi {
 public:
  ClientApi(
      std::shared_ptr<const impl::Interpreter> interpreter,
      std::vector<ClientFunction> functions)
      : interpreter_(std::move(interpreter)), functions_(std::move(functions)) {
  }

  [[nodiscard]] auto Find(std::string_view name, uint32_t arity) const
      -> const ClientFunction*;

  [[nodiscard]] auto Entries() const -> const std::vector<ClientFunction>& {
    return functions_;
  }

  [[nodiscard]] auto GetInterpreter() const -> const impl::Interpreter& {
    return *interpreter_;
  }

  // The running service registered under the module's service name.
  // Throws ServiceUnavailable when none is.
  [[nodiscard]] auto ResolveNamed() const -> std::shared_ptr<ServiceRef>;

 private:
  std::shared_ptr<const impl::Interpreter> interpreter_;
  std::vector<ClientFunction> functions_;
};

// One ClientFunction per public function of `module`.
auto GenerateClientApi(std::shared_ptr<const impl::Module> module) -> ClientApi;

}  // namespace servant::lowering
