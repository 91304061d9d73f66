#pragma once

#include <utility>
#include <variant>

namespace servant::runtime {

// Reply that leaves the service state unchanged.
template <typename R>
struct Plain {
  R value;
};

// Reply that replaces the service state with `new_state`.
template <typename R, typename S>
struct WithState {
  R value;
  S new_state;
};

// What every implementation function returns.
template <typename R, typename S>
using NormalizedReply = std::variant<Plain<R>, WithState<R, S>>;

// Applies `reply` to `state` and returns the value for the caller.
template <typename R, typename S>
auto Commit(NormalizedReply<R, S> reply, S& state) -> R {
  if (auto* with_state = std::get_if<WithState<R, S>>(&reply)) {
    state = std::move(with_state->new_state);
    return std::move(with_state->value);
  }
  return std::move(std::get<Plain<R>>(reply).value);
}

// The reply's value, ignoring any state change.
template <typename R, typename S>
auto ReplyValue(const NormalizedReply<R, S>& reply) -> const R& {
  if (const auto* with_state = std::get_if<WithState<R, S>>(&reply)) {
    return with_state->value;
  }
  return std::get<Plain<R>>(reply).value;
}

}  // namespace servant::runtime
