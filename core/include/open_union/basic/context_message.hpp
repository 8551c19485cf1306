// open_union/basic/context_message.hpp - Static-or-owned diagnostic string
//
#pragma once

#include <fmt/core.h>

#include <algorithm>
#include <cstddef>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace open_union
{

/**
 * A context message pushed onto a ContextTrace.
 *
 * String literals are kept by reference and never allocate. Every other
 * source (std::string, std::string_view, C strings, mutable character
 * buffers, formatted text) is copied into an owned string.
 *
 * @note A const character array bound to the literal constructor must have
 *       static storage duration.
 */
class ContextMessage
{
public:
  template <std::size_t N>
  ContextMessage(const char (&literal)[N]) noexcept  // NOLINT(google-explicit-constructor)
  : text_(std::string_view(literal, std::char_traits<char>::length(literal)))
  {
  }

  /// Mutable buffers are filled at run time; copy up to the first NUL
  template <std::size_t N>
  ContextMessage(char (&buffer)[N])  // NOLINT(google-explicit-constructor)
  : text_(std::string(buffer, std::find(buffer, buffer + N, '\0')))
  {
  }

  template <
    typename CharPtr, std::enable_if_t<
                        std::is_pointer_v<CharPtr> &&
                          std::is_convertible_v<CharPtr, const char *>,
                        int> = 0>
  ContextMessage(CharPtr text)  // NOLINT(google-explicit-constructor)
  : text_(std::string(text != nullptr ? text : ""))
  {
  }

  ContextMessage(std::string text) : text_(std::move(text)) {}  // NOLINT

  ContextMessage(std::string_view text) : text_(std::string(text)) {}  // NOLINT

  /// Build an owned message from a fmt format string
  template <typename... Args>
  [[nodiscard]] static ContextMessage format(fmt::format_string<Args...> fmt, Args &&... args)
  {
    return ContextMessage(fmt::format(fmt, std::forward<Args>(args)...));
  }

  [[nodiscard]] std::string_view view() const noexcept;

  /// true if the message refers to a literal and owns no memory
  [[nodiscard]] bool is_static() const noexcept;

  [[nodiscard]] std::string str() const { return std::string(view()); }

  friend bool operator==(const ContextMessage & a, const ContextMessage & b) noexcept
  {
    return a.view() == b.view();
  }

  friend bool operator!=(const ContextMessage & a, const ContextMessage & b) noexcept
  {
    return !(a == b);
  }

private:
  std::variant<std::string_view, std::string> text_;
};

}  // namespace open_union

template <>
struct fmt::formatter<open_union::ContextMessage> : fmt::formatter<std::string_view>
{
  template <typename FormatContext>
  auto format(const open_union::ContextMessage & msg, FormatContext & ctx) const
    -> decltype(ctx.out())
  {
    return fmt::formatter<std::string_view>::format(msg.view(), ctx);
  }
};
