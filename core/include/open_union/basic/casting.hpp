// open_union/basic/casting.hpp - classof-based casting over erased payloads
//
// These helpers are the single place where a runtime type-identity check is
// turned into a typed pointer. They work with any hierarchy implementing the
// `classof` static method pattern; in this library that is ErasedBox/Boxed<T>.
//
// Usage:
//   if (isa<Boxed<int>>(box)) { ... }
//   auto * held = cast<Boxed<int>>(box);      // panics on failure
//   if (auto * held = dyn_cast<Boxed<int>>(box)) { ... }  // nullptr on failure
//
#pragma once

#include <type_traits>

#include "open_union/basic/panic.hpp"

namespace open_union
{

// ============================================================================
// Type Traits for classof Support
// ============================================================================

namespace detail
{

/// Check if T has a classof static method
template <typename T, typename From, typename = void>
struct HasClassof : std::false_type
{
};

template <typename T, typename From>
struct HasClassof<T, From, std::void_t<decltype(T::classof(std::declval<const From *>()))>>
: std::true_type
{
};

template <typename T, typename From>
inline constexpr bool has_classof_v = HasClassof<T, From>::value;

}  // namespace detail

// ============================================================================
// isa<T> - Type checking
// ============================================================================

/**
 * Check if a holder is of type T.
 *
 * @tparam T The target type to check for
 * @param node The holder to check (may be nullptr)
 * @return true if node is of type T, false otherwise (including if node is null)
 */
template <typename T, typename From>
[[nodiscard]] inline bool isa(const From * node) noexcept
{
  static_assert(detail::has_classof_v<T, From>, "Target type must have a classof() static method");
  return node != nullptr && T::classof(node);
}

/// isa for non-const pointers
template <typename T, typename From>
[[nodiscard]] inline bool isa(From * node) noexcept
{
  return isa<T>(static_cast<const From *>(node));
}

// ============================================================================
// cast<T> - Checked cast (panics on failure)
// ============================================================================

/**
 * Cast a holder to type T.
 *
 * A failed cast means a compile-time proof and the runtime payload disagree,
 * so it panics in every build type instead of asserting.
 *
 * @tparam T The target type to cast to
 * @param node The holder to cast (must not be nullptr, must be of type T)
 * @return Pointer to the holder as type T
 */
template <typename T, typename From>
[[nodiscard]] inline T * cast(From * node)
{
  if (node == nullptr) {
    OPEN_UNION_PANIC("cast<T>() called with nullptr");
  }
  if (!isa<T>(node)) {
    OPEN_UNION_PANIC("invalid cast: held payload does not match the requested type");
  }
  return static_cast<T *>(node);
}

template <typename T, typename From>
[[nodiscard]] inline const T * cast(const From * node)
{
  if (node == nullptr) {
    OPEN_UNION_PANIC("cast<T>() called with nullptr");
  }
  if (!isa<T>(node)) {
    OPEN_UNION_PANIC("invalid cast: held payload does not match the requested type");
  }
  return static_cast<const T *>(node);
}

// ============================================================================
// dyn_cast<T> - Safe dynamic cast (returns nullptr on failure)
// ============================================================================

/**
 * Safely cast a holder to type T, returning nullptr on failure.
 *
 * @tparam T The target type to cast to
 * @param node The holder to cast (may be nullptr)
 * @return Pointer to the holder as type T, or nullptr if cast fails
 */
template <typename T, typename From>
[[nodiscard]] inline T * dyn_cast(From * node) noexcept
{
  return isa<T>(node) ? static_cast<T *>(node) : nullptr;
}

template <typename T, typename From>
[[nodiscard]] inline const T * dyn_cast(const From * node) noexcept
{
  return isa<T>(node) ? static_cast<const T *>(node) : nullptr;
}

}  // namespace open_union
