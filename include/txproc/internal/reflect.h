#pragma once

#include <tuple>
#include <type_traits>

namespace txproc::internal::reflect {

template <typename T>
struct Signature;

template <class R, class... Args>
struct Signature<R (*)(Args...)> {
  using ReturnType = R;
  using ArgsTupleType = std::tuple<Args...>;
  using DecayedArgsTupleType = std::tuple<std::decay_t<Args>...>;
};

template <typename R, typename C, typename... Args>
struct Signature<R (C::*)(Args...)> {
  using ClassType = C;
  using ReturnType = R;
  using ArgsTupleType = std::tuple<Args...>;
  using DecayedArgsTupleType = std::tuple<std::decay_t<Args>...>;
};
template <typename R, typename C, typename... Args>
struct Signature<R (C::*)(Args...) const> : Signature<R (C::*)(Args...)> {};
template <typename R, typename C, typename... Args>
struct Signature<R (C::* const)(Args...)> : Signature<R (C::*)(Args...)> {};
template <typename R, typename C, typename... Args>
struct Signature<R (C::* const)(Args...) const> : Signature<R (C::*)(Args...)> {};

}  // namespace txproc::internal::reflect
