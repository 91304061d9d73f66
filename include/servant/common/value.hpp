#pragma once

#include <cstdint>
#include <initializer_list>
#include <map>
#include <memory>
#include <ostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace servant {

class Value;

using ValueMap = std::map<Value, Value>;

// Failure while evaluating a function body: a type mismatch, division by
// zero, an explicit raise(), or no matching clause. Inside a worker this is
// a logic failure and terminates the worker.
class EvalError : public std::runtime_error {
 public:
  explicit EvalError(const std::string& message)
      : std::runtime_error(message) {
  }
};

enum class ValueKind : uint8_t {
  kNil,
  kBool,
  kInt,
  kString,
  kMap,
};

auto ToString(ValueKind kind) -> const char*;

// Dynamic value used as service state, arguments and results.
//
// Values are immutable. A map shares its entries between copies; updates
// (see value_ops.hpp) build a new map and leave every existing Value intact,
// so a state snapshot handed to an implementation function can never change
// underneath it.
//
// Values are totally ordered: first by kind (nil < bool < int < string <
// map), then by content. This makes any Value usable as a map key.
class Value {
 public:
  Value() = default;

  static auto Nil() -> Value {
    return Value{};
  }
  static auto Bool(bool value) -> Value {
    return Value{Storage{value}};
  }
  static auto Int(int64_t value) -> Value {
    return Value{Storage{value}};
  }
  static auto String(std::string value) -> Value {
    return Value{Storage{std::move(value)}};
  }
  static auto Map(ValueMap entries) -> Value;
  static auto Map(std::initializer_list<std::pair<const Value, Value>> entries)
      -> Value;

  [[nodiscard]] auto Kind() const -> ValueKind {
    return static_cast<ValueKind>(data_.index());
  }
  [[nodiscard]] auto IsNil() const -> bool {
    return Kind() == ValueKind::kNil;
  }
  [[nodiscard]] auto IsBool() const -> bool {
    return Kind() == ValueKind::kBool;
  }
  [[nodiscard]] auto IsInt() const -> bool {
    return Kind() == ValueKind::kInt;
  }
  [[nodiscard]] auto IsString() const -> bool {
    return Kind() == ValueKind::kString;
  }
  [[nodiscard]] auto IsMap() const -> bool {
    return Kind() == ValueKind::kMap;
  }

  // Accessors throw EvalError on a kind mismatch.
  [[nodiscard]] auto AsBool() const -> bool;
  [[nodiscard]] auto AsInt() const -> int64_t;
  [[nodiscard]] auto AsString() const -> const std::string&;
  [[nodiscard]] auto AsMap() const -> const ValueMap&;

  friend auto operator==(const Value& lhs, const Value& rhs) -> bool;
  friend auto operator<(const Value& lhs, const Value& rhs) -> bool;

 private:
  // Alternative order must match ValueKind.
  using Storage = std::variant<
      std::monostate, bool, int64_t, std::string,
      std::shared_ptr<const ValueMap>>;

  explicit Value(Storage data) : data_(std::move(data)) {
  }

  Storage data_;
};

// Render in declaration-literal syntax: nil, true, 42, "text", {"k": 1}.
auto ToString(const Value& value) -> std::string;

// Like ToString, but strings are rendered without quotes.
auto ToDisplayString(const Value& value) -> std::string;

auto operator<<(std::ostream& os, const Value& value) -> std::ostream&;

}  // namespace servant
