#pragma once

namespace servant {

// Builds a visitor for std::visit out of one lambda per alternative:
//
//   std::visit(Overloaded{
//       [](const Plain& p) { ... },
//       [](const WithState& w) { ... },
//   }, reply);
//
// A missing alternative is a compile error rather than a silent fallthrough.
template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};

template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

}  // namespace servant
