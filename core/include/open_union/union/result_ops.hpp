// open_union/union/result_ops.hpp - Context and reshaping on results
//
// Free functions that apply the union operations to the failure arm of a
// Result, and lift bare payload errors into traced unions.
//
// Usage:
//   Result<Config, Union<ParseError, IoError>> load(const std::string & path)
//   {
//     auto text = read_file(path);                        // Result<std::string, IoError>
//     if (!text) {
//       return make_unexpected(traced(std::move(text.error()))
//                                .context("reading config")
//                                .widen<ParseError, IoError>());
//     }
//     return context(parse(*text), "parsing config");      // Result<Config, Union<ParseError>>
//   }
//
#pragma once

#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>

#include "open_union/basic/context_message.hpp"
#include "open_union/basic/result.hpp"
#include "open_union/dispatch/any_error.hpp"
#include "open_union/type_set/algebra.hpp"
#include "open_union/type_set/type_list.hpp"
#include "open_union/union/union.hpp"

namespace open_union
{

template <typename T>
struct IsUnion : std::false_type
{
};

template <typename... Ts>
struct IsUnion<Union<Ts...>> : std::true_type
{
};

template <typename T>
inline constexpr bool is_union_v = IsUnion<std::decay_t<T>>::value;

/// Payload raised when an optional value turned out to be empty
class AbsentValueError : public std::runtime_error
{
public:
  AbsentValueError() : std::runtime_error("value was absent") {}
};

namespace detail
{

/// Carry a success value (or void) into a result with another failure type
template <typename Target, typename T, typename E>
Target forward_value(Result<T, E> && result)
{
  if constexpr (std::is_void_v<T>) {
    (void)result;
    return Target();
  } else {
    return Target(tl::in_place, std::move(*result));
  }
}

}  // namespace detail

// ============================================================================
// Lifting bare errors
// ============================================================================

/// Wrap a bare error as a single-candidate union, capturing the backtrace
template <typename E>
[[nodiscard]] Union<std::decay_t<E>> traced(E && error)
{
  static_assert(!is_union_v<E>, "traced() expects a bare payload error, not a union");
  return Union<std::decay_t<E>>(std::forward<E>(error));
}

/// Lift a bare failure into a union that is proven to contain it
template <typename... Others, typename T, typename E>
[[nodiscard]] Result<T, Union<Others...>> into_union(Result<T, E> && result)
{
  static_assert(!is_union_v<E>, "into_union() expects a bare payload error; use widen()");
  static_assert(
    contains_v<make_list_t<Others...>, E>, "into_union<...>() target must contain the error type");
  return std::move(result).map_error([](E && error) { return Union<Others...>(std::move(error)); });
}

/**
 * Lift a bare failure into a union, erasing it into AnyError when it is not
 * one of the candidates.
 *
 * The union must list AnyError unless E is already a candidate.
 */
template <typename... Others, typename T, typename E>
[[nodiscard]] Result<T, Union<Others...>> absorb(Result<T, E> && result)
{
  static_assert(!is_union_v<E>, "absorb() expects a bare payload error; use widen()");
  using Candidates = make_list_t<Others...>;
  static_assert(
    contains_v<Candidates, E> || contains_v<Candidates, AnyError>,
    "absorb<...>() target must contain the error type or AnyError");
  return std::move(result).map_error([](E && error) {
    if constexpr (contains_v<Candidates, E>) {
      return Union<Others...>(std::move(error));
    } else {
      return Union<Others...>(AnyError::from(std::move(error)));
    }
  });
}

// ============================================================================
// Context
// ============================================================================

template <typename T, typename... Es>
[[nodiscard]] Result<T, Union<Es...>> context(
  Result<T, Union<Es...>> && result, ContextMessage message)
{
  if (!result) {
    result.error().push_context(std::move(message));
  }
  return std::move(result);
}

/// Bare failures are traced first, so the result gains a union failure arm
template <typename T, typename E, std::enable_if_t<!is_union_v<E>, int> = 0>
[[nodiscard]] Result<T, Union<E>> context(Result<T, E> && result, ContextMessage message)
{
  if (result) {
    return detail::forward_value<Result<T, Union<E>>>(std::move(result));
  }
  return make_unexpected(traced(std::move(result.error())).context(std::move(message)));
}

/// Lazy variant of context(): make_message runs only on the failure path
template <typename T, typename... Es, typename F>
[[nodiscard]] Result<T, Union<Es...>> with_context(Result<T, Union<Es...>> && result, F && make_message)
{
  if (!result) {
    result.error().push_context(ContextMessage(std::forward<F>(make_message)()));
  }
  return std::move(result);
}

template <typename T, typename E, typename F, std::enable_if_t<!is_union_v<E>, int> = 0>
[[nodiscard]] Result<T, Union<E>> with_context(Result<T, E> && result, F && make_message)
{
  if (result) {
    return detail::forward_value<Result<T, Union<E>>>(std::move(result));
  }
  return make_unexpected(
    traced(std::move(result.error())).with_context(std::forward<F>(make_message)));
}

// ============================================================================
// Reshaping
// ============================================================================

template <typename... Others, typename T, typename... Es>
[[nodiscard]] Result<T, Union<Others...>> widen(Result<T, Union<Es...>> && result)
{
  return std::move(result).map_error(
    [](Union<Es...> && error) { return std::move(error).template widen<Others...>(); });
}

/**
 * Pull one candidate out of a result's failure arm.
 *
 * The success arm holds the narrowed error. The failure arm holds everything
 * else as a result over the remainder: the original success value, or the
 * error when it was some other candidate.
 */
template <typename Target, typename T, typename... Es>
[[nodiscard]] auto narrow(Result<T, Union<Es...>> && result)
{
  using Remainder = union_of_t<narrow_remainder_t<make_list_t<Es...>, Target>>;
  using Inner = Result<T, Remainder>;
  using Outer = Result<Target, Inner>;

  if (result) {
    return Outer(make_unexpected(detail::forward_value<Inner>(std::move(result))));
  }
  auto narrowed = std::move(result.error()).template narrow<Target>();
  if (narrowed) {
    return Outer(tl::in_place, std::move(*narrowed));
  }
  return Outer(make_unexpected(Inner(make_unexpected(std::move(narrowed.error())))));
}

// ============================================================================
// Optionals
// ============================================================================

/// Empty optionals become an AbsentValueError carrying message as context
template <typename T>
[[nodiscard]] Result<T, Union<AbsentValueError>> ok_or_absent(
  std::optional<T> value, ContextMessage message)
{
  if (value) {
    return Result<T, Union<AbsentValueError>>(tl::in_place, std::move(*value));
  }
  return make_unexpected(traced(AbsentValueError()).context(std::move(message)));
}

}  // namespace open_union
