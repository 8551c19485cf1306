// open_union/dispatch/payload_traits.hpp - Capability contract for payloads
//
// A payload needs three capabilities before a union holding it can be
// rendered or inspected: Display, Debug, and access to its underlying cause.
// The primary template derives them from std::exception (what(), nested
// causes) or from fmt::formatter<T>. Specialize PayloadTraits<T> to override.
//
// The contract is only checked by the operations that render; a union over
// unformattable types can still be narrowed, widened and subset.
//
#pragma once

#include <fmt/format.h>

#include <exception>
#include <iterator>
#include <string>
#include <string_view>
#include <type_traits>

namespace open_union
{

template <typename T, typename = void>
struct PayloadTraits
{
  /// Append the user-facing rendering of value
  static void display(fmt::memory_buffer & out, const T & value)
  {
    if constexpr (std::is_base_of_v<std::exception, T>) {
      fmt::format_to(std::back_inserter(out), "{}", value.what());
    } else {
      static_assert(
        fmt::is_formattable<T>::value,
        "payload must derive from std::exception, have a fmt::formatter, "
        "or specialize open_union::PayloadTraits");
      fmt::format_to(std::back_inserter(out), "{}", value);
    }
  }

  /// Append the developer-facing rendering of value; strings are quoted and escaped
  static void debug(fmt::memory_buffer & out, const T & value)
  {
    if constexpr (std::is_same_v<T, std::string> || std::is_same_v<T, std::string_view>) {
      fmt::format_to(std::back_inserter(out), "{:?}", value);
    } else {
      display(out, value);
    }
  }

  /// Underlying cause of value, or nullptr
  static std::exception_ptr source(const T & value) noexcept
  {
    if constexpr (std::is_base_of_v<std::nested_exception, T>) {
      return value.nested_ptr();
    } else {
      (void)value;
      return nullptr;
    }
  }
};

}  // namespace open_union
