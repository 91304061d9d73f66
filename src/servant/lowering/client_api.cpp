#include "servant/lowering/client_api.hpp"

#include <memory>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include "servant/common/internal_error.hpp"
#include "servant/runtime/errors.hpp"
#include "servant/runtime/registry.hpp"
#include "servant/runtime/reply.hpp"

namespace servant::lowering {

auto ClientApi::Find(std::string_view name, uint32_t arity) const
    -> const ClientFunction* {
  for (const auto& function : functions_) {
    if (function.name == name && function.arity == arity) {
      return &function;
    }
  }
  return nullptr;
}

auto ClientApi::ResolveNamed() const -> std::shared_ptr<ServiceRef> {
  const auto& spec = interpreter_->GetModule().spec;
  if (!spec.service_name) {
    throw runtime::ServiceUnavailable(
        fmt::format("service '{}' is not a named service", spec.module_name));
  }
  return runtime::Registry::Instance().Lookup<Value>(*spec.service_name);
}

auto GenerateClientApi(std::shared_ptr<const impl::Module> module)
    -> ClientApi {
  auto interpreter = std::make_shared<const impl::Interpreter>(module);

  std::vector<ClientFunction> functions;
  for (const auto& function : module->functions) {
    if (!function.IsPublic()) {
      continue;
    }
    const impl::Function* target = &function;
    auto arity = function.CallerArity();

    auto check_arity = [name = function.name,
                        arity](const std::vector<Value>& args) {
      if (args.size() != arity) {
        common::ThrowInternalError(
            "ClientFunction",
            fmt::format(
                "{}/{} called with {} arguments", name, arity, args.size()));
      }
    };

    functions.push_back(
        ClientFunction{
            .name = function.name,
            .arity = arity,
            .call =
                [interpreter, target, check_arity](
                    ServiceRef& service, const std::vector<Value>& args) {
                  check_arity(args);
                  return service.Call<Value>([interpreter, target,
                                              args](const Value& state) {
                    return interpreter->Invoke(*target, state, args);
                  });
                },
            .call_inline =
                [interpreter, target, check_arity](
                    Value& state, const std::vector<Value>& args) {
                  check_arity(args);
                  return runtime::Commit<Value, Value>(
                      interpreter->Invoke(*target, state, args), state);
                },
        });
  }
  return ClientApi(std::move(interpreter), std::move(functions));
}

}  // namespace servant::lowering
