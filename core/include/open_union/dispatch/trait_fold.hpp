// open_union/dispatch/trait_fold.hpp - Linear type-identity dispatch
//
// Given an erased payload and its candidate list, try each candidate in
// declared order; the first whose identity matches receives the requested
// capability. Candidates are distinct, so order affects only how many checks
// run, never which candidate answers.
//
// Usage:
//   fmt::memory_buffer out;
//   display_fold<make_list_t<int, std::string>>(box, out);
//   bool in_subset = is_fold<make_list_t<std::string>>(box);
//
#pragma once

#include <fmt/format.h>

#include <cstddef>
#include <exception>
#include <type_traits>
#include <utility>

#include "open_union/basic/casting.hpp"
#include "open_union/basic/erased_box.hpp"
#include "open_union/basic/panic.hpp"
#include "open_union/dispatch/payload_traits.hpp"
#include "open_union/type_set/type_list.hpp"

namespace open_union
{

template <typename List>
struct TraitFold;

/// Walking off the end means the payload matches no candidate: the union
/// was built unsoundly. Membership tests are the one fold where that is a
/// legitimate "no".
template <>
struct TraitFold<End>
{
  template <typename F>
  [[noreturn]] static void visit(const ErasedBox & box, F && /*f*/)
  {
    OPEN_UNION_PANIC("trait fold found no candidate for payload '{}'", box.type().name());
  }

  template <typename F>
  [[noreturn]] static void visit_mut(ErasedBox & box, F && /*f*/)
  {
    OPEN_UNION_PANIC("trait fold found no candidate for payload '{}'", box.type().name());
  }

  [[nodiscard]] static bool is(const ErasedBox & /*box*/) noexcept { return false; }

  [[noreturn]] static std::size_t index(const ErasedBox & box)
  {
    OPEN_UNION_PANIC("index fold found no candidate for payload '{}'", box.type().name());
  }
};

template <typename Head, typename Tail>
struct TraitFold<Cons<Head, Tail>>
{
  template <typename F>
  static void visit(const ErasedBox & box, F && f)
  {
    if (const auto * held = dyn_cast<Boxed<Head>>(&box)) {
      std::forward<F>(f)(held->get());
      return;
    }
    TraitFold<Tail>::visit(box, std::forward<F>(f));
  }

  template <typename F>
  static void visit_mut(ErasedBox & box, F && f)
  {
    if (auto * held = dyn_cast<Boxed<Head>>(&box)) {
      std::forward<F>(f)(held->get());
      return;
    }
    TraitFold<Tail>::visit_mut(box, std::forward<F>(f));
  }

  [[nodiscard]] static bool is(const ErasedBox & box) noexcept
  {
    return isa<Boxed<Head>>(&box) || TraitFold<Tail>::is(box);
  }

  [[nodiscard]] static std::size_t index(const ErasedBox & box)
  {
    if (isa<Boxed<Head>>(&box)) {
      return 0;
    }
    return 1 + TraitFold<Tail>::index(box);
  }
};

// ============================================================================
// Capabilities
// ============================================================================

template <typename List>
void display_fold(const ErasedBox & box, fmt::memory_buffer & out)
{
  TraitFold<List>::visit(box, [&out](const auto & value) {
    PayloadTraits<std::decay_t<decltype(value)>>::display(out, value);
  });
}

template <typename List>
void debug_fold(const ErasedBox & box, fmt::memory_buffer & out)
{
  TraitFold<List>::visit(box, [&out](const auto & value) {
    PayloadTraits<std::decay_t<decltype(value)>>::debug(out, value);
  });
}

/// Underlying cause of the held payload (for error-chain walking)
template <typename List>
[[nodiscard]] std::exception_ptr source_fold(const ErasedBox & box)
{
  std::exception_ptr cause;
  TraitFold<List>::visit(box, [&cause](const auto & value) {
    cause = PayloadTraits<std::decay_t<decltype(value)>>::source(value);
  });
  return cause;
}

/// true if the held payload is one of List's candidates
template <typename List>
[[nodiscard]] bool is_fold(const ErasedBox & box) noexcept
{
  return TraitFold<List>::is(box);
}

/// Position of the held payload in List
template <typename List>
[[nodiscard]] std::size_t index_fold(const ErasedBox & box)
{
  return TraitFold<List>::index(box);
}

}  // namespace open_union
