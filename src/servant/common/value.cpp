#include "servant/common/value.hpp"

#include <algorithm>
#include <cstdint>
#include <memory>
#include <ostream>
#include <string>
#include <utility>

#include <fmt/core.h>

namespace servant {

namespace {

auto EscapeString(const std::string& text) -> std::string {
  std::string out;
  out.reserve(text.size() + 2);
  out += '"';
  for (char c : text) {
    switch (c) {
      case '"':
        out += "\\\"";
        break;
      case '\\':
        out += "\\\\";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\t':
        out += "\\t";
        break;
      default:
        out += c;
        break;
    }
  }
  out += '"';
  return out;
}

[[noreturn]] void ThrowKindMismatch(ValueKind expected, ValueKind actual) {
  throw EvalError(
      fmt::format(
          "expected {} value, got {}", ToString(expected), ToString(actual)));
}

}  // namespace

auto ToString(ValueKind kind) -> const char* {
  switch (kind) {
    case ValueKind::kNil:
      return "nil";
    case ValueKind::kBool:
      return "bool";
    case ValueKind::kInt:
      return "int";
    case ValueKind::kString:
      return "string";
    case ValueKind::kMap:
      return "map";
  }
  return "unknown";
}

auto Value::Map(ValueMap entries) -> Value {
  return Value{Storage{std::make_shared<const ValueMap>(std::move(entries))}};
}

auto Value::Map(std::initializer_list<std::pair<const Value, Value>> entries)
    -> Value {
  return Map(ValueMap(entries));
}

auto Value::AsBool() const -> bool {
  if (!IsBool()) {
    ThrowKindMismatch(ValueKind::kBool, Kind());
  }
  return std::get<bool>(data_);
}

auto Value::AsInt() const -> int64_t {
  if (!IsInt()) {
    ThrowKindMismatch(ValueKind::kInt, Kind());
  }
  return std::get<int64_t>(data_);
}

auto Value::AsString() const -> const std::string& {
  if (!IsString()) {
    ThrowKindMismatch(ValueKind::kString, Kind());
  }
  return std::get<std::string>(data_);
}

auto Value::AsMap() const -> const ValueMap& {
  if (!IsMap()) {
    ThrowKindMismatch(ValueKind::kMap, Kind());
  }
  return *std::get<std::shared_ptr<const ValueMap>>(data_);
}

auto operator==(const Value& lhs, const Value& rhs) -> bool {
  if (lhs.Kind() != rhs.Kind()) {
    return false;
  }
  switch (lhs.Kind()) {
    case ValueKind::kNil:
      return true;
    case ValueKind::kBool:
      return lhs.AsBool() == rhs.AsBool();
    case ValueKind::kInt:
      return lhs.AsInt() == rhs.AsInt();
    case ValueKind::kString:
      return lhs.AsString() == rhs.AsString();
    case ValueKind::kMap: {
      const auto& l = std::get<std::shared_ptr<const ValueMap>>(lhs.data_);
      const auto& r = std::get<std::shared_ptr<const ValueMap>>(rhs.data_);
      return l == r || *l == *r;
    }
  }
  return false;
}

auto operator<(const Value& lhs, const Value& rhs) -> bool {
  if (lhs.Kind() != rhs.Kind()) {
    return lhs.Kind() < rhs.Kind();
  }
  switch (lhs.Kind()) {
    case ValueKind::kNil:
      return false;
    case ValueKind::kBool:
      return lhs.AsBool() < rhs.AsBool();
    case ValueKind::kInt:
      return lhs.AsInt() < rhs.AsInt();
    case ValueKind::kString:
      return lhs.AsString() < rhs.AsString();
    case ValueKind::kMap:
      return std::lexicographical_compare(
          lhs.AsMap().begin(), lhs.AsMap().end(), rhs.AsMap().begin(),
          rhs.AsMap().end());
  }
  return false;
}

auto ToString(const Value& value) -> std::string {
  switch (value.Kind()) {
    case ValueKind::kNil:
      return "nil";
    case ValueKind::kBool:
      return value.AsBool() ? "true" : "false";
    case ValueKind::kInt:
      return std::to_string(value.AsInt());
    case ValueKind::kString:
      return EscapeString(value.AsString());
    case ValueKind::kMap: {
      std::string out = "{";
      bool first = true;
      for (const auto& [key, item] : value.AsMap()) {
        if (!first) {
          out += ", ";
        }
        first = false;
        out += fmt::format("{}: {}", ToString(key), ToString(item));
      }
      out += "}";
      return out;
    }
  }
  return "nil";
}

auto ToDisplayString(const Value& value) -> std::string {
  if (value.IsString()) {
    return value.AsString();
  }
  return ToString(value);
}

auto operator<<(std::ostream& os, const Value& value) -> std::ostream& {
  return os << ToString(value);
}

}  // namespace servant
