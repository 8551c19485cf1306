// open_union/union/enum_bridge.hpp - Closed mirrors of an open union
//
// Once a union's candidate list is fully resolved it can be converted into a
// closed discriminated union with one alternative per list position, which
// std::visit checks exhaustively. Owned, shared-borrow and exclusive-borrow
// flavors exist for every arity from 1 to 9:
//
//   Union<A, B>::to_enum()      -> E2<A, B>                (payload moved out)
//   Union<A, B>::as_enum_ref()  -> E2<const A *, const B *>
//   Union<A, B>::as_enum_mut()  -> E2<A *, B *>
//
// Usage:
//   match(u.as_enum_ref(),
//         [](const std::uint32_t * n) { ... },
//         [](const std::string * s) { ... });
//
#pragma once

#include <cstddef>
#include <utility>
#include <variant>

#include "open_union/basic/casting.hpp"
#include "open_union/basic/erased_box.hpp"
#include "open_union/basic/panic.hpp"
#include "open_union/type_set/type_list.hpp"

namespace open_union
{

// ============================================================================
// Per-arity closed mirrors
// ============================================================================

template <typename A>
using E1 = std::variant<A>;
template <typename A, typename B>
using E2 = std::variant<A, B>;
template <typename A, typename B, typename C>
using E3 = std::variant<A, B, C>;
template <typename A, typename B, typename C, typename D>
using E4 = std::variant<A, B, C, D>;
template <typename A, typename B, typename C, typename D, typename E>
using E5 = std::variant<A, B, C, D, E>;
template <typename A, typename B, typename C, typename D, typename E, typename F>
using E6 = std::variant<A, B, C, D, E, F>;
template <typename A, typename B, typename C, typename D, typename E, typename F, typename G>
using E7 = std::variant<A, B, C, D, E, F, G>;
template <
  typename A, typename B, typename C, typename D, typename E, typename F, typename G, typename H>
using E8 = std::variant<A, B, C, D, E, F, G, H>;
template <
  typename A, typename B, typename C, typename D, typename E, typename F, typename G, typename H,
  typename I>
using E9 = std::variant<A, B, C, D, E, F, G, H, I>;

// ============================================================================
// Exhaustive matching
// ============================================================================

template <typename... Handlers>
struct overloaded : Handlers...
{
  using Handlers::operator()...;
};

template <typename... Handlers>
overloaded(Handlers...) -> overloaded<Handlers...>;

/// Visit a closed mirror with one handler per alternative
template <typename Variant, typename... Handlers>
decltype(auto) match(Variant && variant, Handlers &&... handlers)
{
  return std::visit(
    overloaded{std::forward<Handlers>(handlers)...}, std::forward<Variant>(variant));
}

namespace detail
{

/// Same linear identity scan as the trait folds, but producing the variant
/// alternative at the matching position
template <typename Variant, typename List, std::size_t I = 0>
struct EnumFold;

template <typename Variant, std::size_t I>
struct EnumFold<Variant, End, I>
{
  [[noreturn]] static Variant take(ErasedBox & box)
  {
    OPEN_UNION_PANIC("to_enum() found no candidate for payload '{}'", box.type().name());
  }

  [[noreturn]] static Variant ref(const ErasedBox & box)
  {
    OPEN_UNION_PANIC("as_enum_ref() found no candidate for payload '{}'", box.type().name());
  }

  [[noreturn]] static Variant mut(ErasedBox & box)
  {
    OPEN_UNION_PANIC("as_enum_mut() found no candidate for payload '{}'", box.type().name());
  }
};

template <typename Variant, typename Head, typename Tail, std::size_t I>
struct EnumFold<Variant, Cons<Head, Tail>, I>
{
  static Variant take(ErasedBox & box)
  {
    if (auto * held = dyn_cast<Boxed<Head>>(&box)) {
      return Variant(std::in_place_index<I>, held->release());
    }
    return EnumFold<Variant, Tail, I + 1>::take(box);
  }

  static Variant ref(const ErasedBox & box)
  {
    if (const auto * held = dyn_cast<Boxed<Head>>(&box)) {
      return Variant(std::in_place_index<I>, &held->get());
    }
    return EnumFold<Variant, Tail, I + 1>::ref(box);
  }

  static Variant mut(ErasedBox & box)
  {
    if (auto * held = dyn_cast<Boxed<Head>>(&box)) {
      return Variant(std::in_place_index<I>, &held->get());
    }
    return EnumFold<Variant, Tail, I + 1>::mut(box);
  }
};

}  // namespace detail

}  // namespace open_union
