// open_union/dispatch/any_error.hpp - Erased catch-all payload
//
// AnyError stands for any failure outside a union's named candidates. Listing
// it as a candidate lets the union absorb foreign errors, which keep their
// message and cause chain but lose their static type:
//
//   using LoadError = Union<IoError, ParseError, AnyError>;
//   return make_unexpected(traced(AnyError("no loader registered"))
//                            .context("loading plugin")
//                            .widen<IoError, ParseError, AnyError>());
//
#pragma once

#include <exception>
#include <iterator>
#include <string>
#include <string_view>
#include <utility>

#include "open_union/dispatch/payload_traits.hpp"

namespace open_union
{

class AnyError : public std::exception
{
public:
  /// Message-only error with no underlying exception
  explicit AnyError(std::string message);

  /**
   * Erase a captured exception.
   *
   * The message is taken from what() of a std::exception, and its
   * std::nested_exception cause (if any) becomes this error's cause. Other
   * exception types, and a null pointer, are described as "unknown exception".
   */
  explicit AnyError(std::exception_ptr error);

  template <typename E>
  [[nodiscard]] static AnyError from(E && error)
  {
    return AnyError(std::make_exception_ptr(std::forward<E>(error)));
  }

  [[nodiscard]] const char * what() const noexcept override { return message_.c_str(); }

  /// The erased exception, or null for a message-only error
  [[nodiscard]] const std::exception_ptr & error() const noexcept { return error_; }

  [[nodiscard]] const std::exception_ptr & cause() const noexcept { return cause_; }

  /// true if the erased exception has dynamic type E (or derives from it)
  template <typename E>
  [[nodiscard]] bool is() const
  {
    if (!error_) {
      return false;
    }
    try {
      std::rethrow_exception(error_);
    } catch (const E &) {
      return true;
    } catch (...) {
      return false;
    }
  }

private:
  std::exception_ptr error_;
  std::exception_ptr cause_;
  std::string message_;
};

template <>
struct PayloadTraits<AnyError>
{
  static void display(fmt::memory_buffer & out, const AnyError & value)
  {
    fmt::format_to(std::back_inserter(out), "{}", value.what());
  }

  static void debug(fmt::memory_buffer & out, const AnyError & value)
  {
    fmt::format_to(std::back_inserter(out), "AnyError({:?})", std::string_view(value.what()));
  }

  static std::exception_ptr source(const AnyError & value) noexcept { return value.cause(); }
};

}  // namespace open_union
